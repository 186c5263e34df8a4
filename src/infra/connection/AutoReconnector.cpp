#include "infra/connection/AutoReconnector.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace camlink::infra {

namespace {

constexpr std::chrono::milliseconds MAX_HEALTH_CHECK_TIMEOUT{5000};

} // namespace

AutoReconnector::AutoReconnector(AsioContext& context, core::IConnectionManager& manager,
                                 core::ReconnectionPolicy policy)
    : context_(context), manager_(manager), policy_(policy) {}

AutoReconnector::~AutoReconnector() {
    stopAll();
}

void AutoReconnector::setStateCallback(StateCallback callback) {
    std::lock_guard lock(mutex_);
    stateCallback_ = std::move(callback);
}

std::shared_ptr<AutoReconnector::SupervisedCamera>
AutoReconnector::find(const std::string& cameraId) const {
    std::lock_guard lock(mutex_);
    auto it = cameras_.find(cameraId);
    return it != cameras_.end() ? it->second : nullptr;
}

void AutoReconnector::cancelTimers(SupervisedCamera& camera) {
    {
        // Ordered against the session hand-over in runAttempt
        std::lock_guard lock(camera.mutex);
        camera.active = false;
    }
    camera.healthTimer->cancel();
    camera.retryTimer->cancel();
}

void AutoReconnector::supervise(const std::string& cameraId, core::CameraDescriptor descriptor,
                                core::Credential credential,
                                std::shared_ptr<core::ICameraSession> session) {
    auto camera = std::make_shared<SupervisedCamera>();
    camera->id = cameraId;
    camera->descriptor = std::move(descriptor);
    camera->credential = std::move(credential);
    camera->session = std::move(session);
    camera->machine.setAutoReconnect(policy_.enabled);
    camera->healthTimer = std::make_shared<asio::steady_timer>(context_.getContext());
    camera->retryTimer = std::make_shared<asio::steady_timer>(context_.getContext());

    std::weak_ptr<SupervisedCamera> weak = camera;
    camera->machine.setListener([this, weak](core::ConnectionState from,
                                             core::ConnectionState to) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        spdlog::info("Camera {}: {} -> {}", self->id, core::connectionStateToString(from),
                     core::connectionStateToString(to));
        StateCallback callback;
        {
            std::lock_guard lock(mutex_);
            callback = stateCallback_;
        }
        if (callback) {
            callback(self->id, to);
        }
    });

    std::shared_ptr<SupervisedCamera> previous;
    {
        std::lock_guard lock(mutex_);
        auto it = cameras_.find(cameraId);
        if (it != cameras_.end()) {
            previous = it->second;
        }
        cameras_[cameraId] = camera;
    }
    if (previous) {
        cancelTimers(*previous);
    }

    spdlog::info("Supervising camera {} ({})", cameraId, camera->descriptor.host);

    if (camera->session && camera->session->isOpen()) {
        camera->machine.transitionTo(core::ConnectionState::Connecting);
        camera->machine.transitionTo(core::ConnectionState::Connected);
        scheduleHealthCheck(camera);
    } else {
        camera->machine.transitionTo(core::ConnectionState::Connecting);
        camera->machine.transitionTo(core::ConnectionState::Reconnecting);
        scheduleAttempt(camera);
    }
}

void AutoReconnector::notifyConnectionLost(const std::string& cameraId,
                                           const std::string& reason) {
    auto camera = find(cameraId);
    if (!camera) {
        spdlog::warn("Connection loss reported for unsupervised camera {}", cameraId);
        return;
    }
    handleLoss(camera, reason.empty() ? "connection lost" : reason);
}

void AutoReconnector::handleLoss(const std::shared_ptr<SupervisedCamera>& camera,
                                 const std::string& reason) {
    if (!camera->active) {
        return;
    }

    auto state = camera->machine.state();
    if (state != core::ConnectionState::Connected && state != core::ConnectionState::Streaming) {
        spdlog::debug("Camera {}: ignoring loss while {}", camera->id,
                      core::connectionStateToString(state));
        return;
    }

    spdlog::warn("Camera {} lost: {}", camera->id, reason);
    camera->healthTimer->cancel();

    std::shared_ptr<core::ICameraSession> stale;
    {
        std::lock_guard lock(camera->mutex);
        stale = std::move(camera->session);
        camera->attempt = 0;
    }
    if (stale) {
        manager_.disconnect(stale);
    }

    if (!policy_.enabled) {
        camera->machine.transitionTo(core::ConnectionState::Disconnected);
        return;
    }

    camera->machine.transitionTo(core::ConnectionState::Reconnecting);
    scheduleAttempt(camera);
}

void AutoReconnector::scheduleAttempt(std::shared_ptr<SupervisedCamera> camera) {
    if (!camera->active) {
        return;
    }

    int attempt = 0;
    {
        std::lock_guard lock(camera->mutex);
        attempt = camera->attempt + 1;
    }

    if (!policy_.allowsAttempt(attempt)) {
        spdlog::error("Camera {}: giving up after {} attempts", camera->id, attempt - 1);
        camera->machine.transitionTo(core::ConnectionState::Error);
        return;
    }

    auto delay = policy_.delayForAttempt(attempt);
    spdlog::info("Camera {}: reconnection attempt {} in {}ms", camera->id, attempt,
                 delay.count());

    camera->retryTimer->expires_after(delay);
    camera->retryTimer->async_wait([this, camera, attempt, delay](const asio::error_code& ec) {
        if (ec || !camera->active) {
            return;
        }
        runAttempt(camera, attempt, delay);
    });
}

void AutoReconnector::runAttempt(const std::shared_ptr<SupervisedCamera>& camera, int attempt,
                                 std::chrono::milliseconds delay) {
    core::ReconnectionAttempt record;
    record.attempt = attempt;
    record.delay = delay;
    record.timestamp = std::chrono::system_clock::now();

    core::CameraDescriptor descriptor;
    core::Credential credential;
    {
        std::lock_guard lock(camera->mutex);
        camera->attempt = attempt;
        descriptor = camera->descriptor;
        credential = camera->credential;
    }

    camera->machine.transitionTo(core::ConnectionState::Connecting);

    std::shared_ptr<core::ICameraSession> session;
    bool authenticationFailed = false;
    try {
        session = manager_.connect(descriptor, credential);
        record.success = true;
    } catch (const core::AuthenticationError& e) {
        record.error = e.what();
        authenticationFailed = true;
    } catch (const core::CamLinkError& e) {
        record.error = e.what();
    } catch (const std::exception& e) {
        record.error = fmt::format("unexpected failure: {}", e.what());
    }

    bool stillActive = false;
    {
        std::lock_guard lock(camera->mutex);
        stillActive = camera->active;
        if (stillActive) {
            camera->history.push_back(record);
            if (record.success) {
                camera->descriptor = descriptor;
                camera->session = session;
                camera->attempt = 0;
            }
        }
    }

    if (!stillActive) {
        if (session) {
            spdlog::debug("Camera {}: supervision ended during attempt {}, dropping its session",
                          camera->id, attempt);
            manager_.disconnect(session);
        }
        return;
    }

    if (record.success) {
        spdlog::info("Camera {}: reconnected on attempt {}", camera->id, attempt);
        camera->machine.transitionTo(core::ConnectionState::Connected);
        scheduleHealthCheck(camera);
        return;
    }

    if (authenticationFailed) {
        spdlog::error("Camera {}: credential rejected, not retrying: {}", camera->id,
                      record.error.value_or(""));
        camera->machine.transitionTo(core::ConnectionState::Error);
        return;
    }

    spdlog::warn("Camera {}: attempt {} failed: {}", camera->id, attempt,
                 record.error.value_or(""));
    camera->machine.transitionTo(core::ConnectionState::Reconnecting);
    scheduleAttempt(camera);
}

void AutoReconnector::scheduleHealthCheck(std::shared_ptr<SupervisedCamera> camera) {
    if (!camera->active || policy_.healthCheckInterval.count() <= 0) {
        return;
    }

    camera->healthTimer->expires_after(policy_.healthCheckInterval);
    camera->healthTimer->async_wait([this, camera](const asio::error_code& ec) {
        if (ec || !camera->active) {
            return;
        }

        std::shared_ptr<core::ICameraSession> session;
        {
            std::lock_guard lock(camera->mutex);
            session = camera->session;
        }

        auto timeout = std::min(policy_.healthCheckInterval, MAX_HEALTH_CHECK_TIMEOUT);
        if (!session || !session->checkHealth(timeout)) {
            handleLoss(camera, "health check failed");
            return;
        }
        scheduleHealthCheck(camera);
    });
}

void AutoReconnector::disconnect(const std::string& cameraId) {
    std::shared_ptr<SupervisedCamera> camera;
    {
        std::lock_guard lock(mutex_);
        auto it = cameras_.find(cameraId);
        if (it == cameras_.end()) {
            return;
        }
        camera = it->second;
        cameras_.erase(it);
    }

    cancelTimers(*camera);

    std::shared_ptr<core::ICameraSession> session;
    {
        std::lock_guard lock(camera->mutex);
        session = std::move(camera->session);
    }
    if (session) {
        manager_.disconnect(session);
    }

    camera->machine.transitionTo(core::ConnectionState::Disconnected);
    spdlog::info("Stopped supervising camera {}", cameraId);
}

void AutoReconnector::reset(const std::string& cameraId) {
    auto camera = find(cameraId);
    if (!camera) {
        return;
    }
    if (camera->machine.state() != core::ConnectionState::Error) {
        return;
    }

    {
        std::lock_guard lock(camera->mutex);
        camera->attempt = 0;
    }

    // Error only leaves via Disconnected when reconnection is disabled
    if (!camera->machine.transitionTo(core::ConnectionState::Reconnecting)) {
        camera->machine.transitionTo(core::ConnectionState::Disconnected);
        camera->machine.transitionTo(core::ConnectionState::Connecting);
        camera->machine.transitionTo(core::ConnectionState::Reconnecting);
    }
    spdlog::info("Camera {}: reset, reconnecting", cameraId);
    scheduleAttempt(camera);
}

void AutoReconnector::stopAll() {
    std::map<std::string, std::shared_ptr<SupervisedCamera>> cameras;
    {
        std::lock_guard lock(mutex_);
        cameras.swap(cameras_);
    }
    for (auto& [id, camera] : cameras) {
        cancelTimers(*camera);
    }
}

bool AutoReconnector::isSupervised(const std::string& cameraId) const {
    return find(cameraId) != nullptr;
}

std::optional<core::ConnectionState> AutoReconnector::state(const std::string& cameraId) const {
    auto camera = find(cameraId);
    if (!camera) {
        return std::nullopt;
    }
    return camera->machine.state();
}

std::vector<core::ReconnectionAttempt>
AutoReconnector::history(const std::string& cameraId) const {
    auto camera = find(cameraId);
    if (!camera) {
        return {};
    }
    std::lock_guard lock(camera->mutex);
    return camera->history;
}

int AutoReconnector::attemptCount(const std::string& cameraId) const {
    auto camera = find(cameraId);
    if (!camera) {
        return 0;
    }
    std::lock_guard lock(camera->mutex);
    return camera->attempt;
}

std::shared_ptr<core::ICameraSession>
AutoReconnector::session(const std::string& cameraId) const {
    auto camera = find(cameraId);
    if (!camera) {
        return nullptr;
    }
    std::lock_guard lock(camera->mutex);
    return camera->session;
}

std::optional<core::CameraDescriptor>
AutoReconnector::descriptor(const std::string& cameraId) const {
    auto camera = find(cameraId);
    if (!camera) {
        return std::nullopt;
    }
    std::lock_guard lock(camera->mutex);
    return camera->descriptor;
}

} // namespace camlink::infra
