#pragma once

#include "core/services/IConnectionManager.hpp"
#include "core/types/ConnectionState.hpp"
#include "core/types/ReconnectionPolicy.hpp"
#include "infra/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace camlink::infra {

/**
 * @brief Keeps supervised cameras connected.
 *
 * Each camera has its own health-check and retry timers on the worker pool.
 * A failed health check or notifyConnectionLost() moves the camera to
 * Reconnecting and schedules attempts with exponential backoff. Attempts go
 * through the connection manager. Rejected credentials and exhausted
 * attempts end in Error, which only reset() leaves.
 */
class AutoReconnector {
public:
    using StateCallback =
        std::function<void(const std::string& cameraId, core::ConnectionState state)>;

    /**
     * @brief Constructs an AutoReconnector.
     * @param context Worker pool running the timers.
     * @param manager Manager used for reconnection attempts.
     * @param policy Backoff and health-check parameters.
     */
    AutoReconnector(AsioContext& context, core::IConnectionManager& manager,
                    core::ReconnectionPolicy policy = {});

    /**
     * @brief Destructor. Cancels every timer.
     */
    ~AutoReconnector();

    AutoReconnector(const AutoReconnector&) = delete;
    AutoReconnector& operator=(const AutoReconnector&) = delete;

    /**
     * @brief Sets the callback receiving every state change.
     *
     * Invoked on worker threads.
     */
    void setStateCallback(StateCallback callback);

    /**
     * @brief Starts supervising a camera.
     *
     * With a session the camera starts Connected and health checks begin.
     * Without one the first attempt is scheduled right away. Supervising an
     * id again replaces the previous entry.
     *
     * @param cameraId Identifier used in callbacks and queries.
     * @param descriptor Camera to reconnect to.
     * @param credential Credential for reconnection attempts.
     * @param session Live session, or null.
     */
    void supervise(const std::string& cameraId, core::CameraDescriptor descriptor,
                   core::Credential credential, std::shared_ptr<core::ICameraSession> session);

    /**
     * @brief Reports that a camera's connection dropped.
     * @param cameraId Supervised camera.
     * @param reason Logged cause.
     */
    void notifyConnectionLost(const std::string& cameraId, const std::string& reason = {});

    /**
     * @brief Stops supervising a camera, cancels its timers and closes its session.
     *
     * Other cameras are unaffected.
     */
    void disconnect(const std::string& cameraId);

    /**
     * @brief Leaves the Error state and starts over with attempt 1.
     */
    void reset(const std::string& cameraId);

    void stopAll();

    [[nodiscard]] bool isSupervised(const std::string& cameraId) const;
    [[nodiscard]] std::optional<core::ConnectionState> state(const std::string& cameraId) const;
    [[nodiscard]] std::vector<core::ReconnectionAttempt> history(const std::string& cameraId) const;
    [[nodiscard]] int attemptCount(const std::string& cameraId) const;
    [[nodiscard]] std::shared_ptr<core::ICameraSession> session(const std::string& cameraId) const;
    [[nodiscard]] std::optional<core::CameraDescriptor>
    descriptor(const std::string& cameraId) const;

    [[nodiscard]] const core::ReconnectionPolicy& policy() const { return policy_; }

private:
    struct SupervisedCamera {
        std::string id;
        core::CameraDescriptor descriptor;
        core::Credential credential;
        std::shared_ptr<core::ICameraSession> session;
        core::ConnectionStateMachine machine;
        std::shared_ptr<asio::steady_timer> healthTimer;
        std::shared_ptr<asio::steady_timer> retryTimer;
        std::atomic<bool> active{true}; ///< Cleared under mutex
        int attempt{0};
        std::vector<core::ReconnectionAttempt> history;
        mutable std::mutex mutex;
    };

    std::shared_ptr<SupervisedCamera> find(const std::string& cameraId) const;
    void scheduleHealthCheck(std::shared_ptr<SupervisedCamera> camera);
    void scheduleAttempt(std::shared_ptr<SupervisedCamera> camera);
    void runAttempt(const std::shared_ptr<SupervisedCamera>& camera, int attempt,
                    std::chrono::milliseconds delay);
    void handleLoss(const std::shared_ptr<SupervisedCamera>& camera, const std::string& reason);
    static void cancelTimers(SupervisedCamera& camera);

    AsioContext& context_;
    core::IConnectionManager& manager_;
    core::ReconnectionPolicy policy_;
    StateCallback stateCallback_;
    std::map<std::string, std::shared_ptr<SupervisedCamera>> cameras_;
    mutable std::mutex mutex_;
};

} // namespace camlink::infra
