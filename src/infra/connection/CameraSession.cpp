#include "infra/connection/CameraSession.hpp"

#include "core/types/Errors.hpp"
#include "infra/network/RtspClient.hpp"
#include "infra/protocol/OnvifClient.hpp"

#include <spdlog/spdlog.h>

namespace camlink::infra {

CameraSession::CameraSession(core::ITransportFactory& transport, core::IHttpClient& http,
                             core::CameraDescriptor descriptor, std::string username,
                             std::optional<StandardsHandle> standards,
                             std::unique_ptr<ProprietarySession> proprietary)
    : transport_(transport), http_(http), descriptor_(std::move(descriptor)),
      username_(std::move(username)), standards_(std::move(standards)),
      proprietary_(std::move(proprietary)) {}

CameraSession::~CameraSession() {
    close();
}

std::optional<std::string> CameraSession::mediaUrl() const {
    if (!standards_ || standards_->mediaUrl.empty()) {
        return std::nullopt;
    }
    return standards_->mediaUrl;
}

std::optional<std::string> CameraSession::sessionToken() const {
    if (!proprietary_) {
        return std::nullopt;
    }
    return proprietary_->token();
}

bool CameraSession::checkHealth(std::chrono::milliseconds timeout) {
    if (!isOpen()) {
        return false;
    }

    if (standards_) {
        bool alive = false;
        if (standards_->onvif) {
            OnvifClient onvif(http_);
            alive = onvif.checkHealth(descriptor_.host, standards_->controlPort, timeout);
        } else {
            RtspClient rtsp(transport_);
            alive = rtsp.options(descriptor_.host, standards_->mediaPort, timeout).success;
        }
        if (!alive) {
            spdlog::warn("Standards path of {} did not answer", descriptor_.host);
            return false;
        }
    }

    if (proprietary_ && !proprietary_->keepAlive(timeout)) {
        spdlog::warn("Vendor session of {} missed its keep-alive", descriptor_.host);
        return false;
    }
    return true;
}

bool CameraSession::isOpen() const {
    if (!open_) {
        return false;
    }
    return !proprietary_ || proprietary_->isOpen();
}

void CameraSession::close() {
    if (!open_.exchange(false)) {
        return;
    }
    if (proprietary_) {
        proprietary_->close();
    }
    spdlog::debug("Closed session to {} as {}", descriptor_.host, username_);
}

ProprietarySession& CameraSession::vendor() {
    if (!proprietary_ || !isOpen()) {
        throw core::ConnectionError(
            fmt::format("No vendor protocol session to {}", descriptor_.host));
    }
    return *proprietary_;
}

nlohmann::json CameraSession::listRecordings(const std::string& beginTime,
                                             const std::string& endTime, int channel,
                                             std::chrono::milliseconds timeout) {
    return vendor().listRecordings(beginTime, endTime, channel, timeout);
}

nlohmann::json CameraSession::startPlayback(const std::string& fileName, int channel,
                                            std::chrono::milliseconds timeout) {
    return vendor().startPlayback(fileName, channel, timeout);
}

nlohmann::json CameraSession::ptzControl(const std::string& command, int speed, int channel,
                                         std::chrono::milliseconds timeout) {
    return vendor().ptzControl(command, speed, channel, timeout);
}

} // namespace camlink::infra
