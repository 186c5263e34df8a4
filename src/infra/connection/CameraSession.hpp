#pragma once

#include "core/services/IConnectionManager.hpp"
#include "core/services/IHttpClient.hpp"
#include "core/services/ITransport.hpp"
#include "infra/protocol/ProprietaryClient.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace camlink::infra {

/**
 * @brief Live standards path of a session.
 */
struct StandardsHandle {
    uint16_t controlPort{0};  ///< ONVIF device service port (0 when only RTSP answered)
    uint16_t mediaPort{0};    ///< RTSP port
    std::string mediaUrl;     ///< Stream URI handed to the renderer, empty if none verified
    bool onvif{false};        ///< Device service answered GetCapabilities
};

/**
 * @brief Session produced by HybridConnectionManager.
 *
 * Holds the standards handle, the vendor session, or both. Vendor command
 * helpers throw ConnectionError when the vendor path is not live.
 */
class CameraSession : public core::ICameraSession {
public:
    CameraSession(core::ITransportFactory& transport, core::IHttpClient& http,
                  core::CameraDescriptor descriptor, std::string username, std::optional<StandardsHandle> standards,
                  std::unique_ptr<ProprietarySession> proprietary);
    ~CameraSession() override;

    CameraSession(const CameraSession&) = delete;
    CameraSession& operator=(const CameraSession&) = delete;

    const core::CameraDescriptor& descriptor() const override { return descriptor_; }
    const std::string& username() const override { return username_; }

    std::optional<std::string> mediaUrl() const override;
    std::optional<std::string> sessionToken() const override;

    bool hasStandards() const override { return standards_.has_value(); }
    bool hasProprietary() const override { return proprietary_ != nullptr; }

    /**
     * @brief Checks each live path.
     *
     * ONVIF GetSystemDateAndTime or RTSP OPTIONS for the standards path,
     * a keep-alive for the vendor path.
     */
    bool checkHealth(std::chrono::milliseconds timeout) override;

    bool isOpen() const override;
    void close() override;

    [[nodiscard]] const std::optional<StandardsHandle>& standards() const { return standards_; }

    nlohmann::json listRecordings(const std::string& beginTime, const std::string& endTime,
                                  int channel, std::chrono::milliseconds timeout);
    nlohmann::json startPlayback(const std::string& fileName, int channel,
                                 std::chrono::milliseconds timeout);
    nlohmann::json ptzControl(const std::string& command, int speed, int channel,
                              std::chrono::milliseconds timeout);

private:
    ProprietarySession& vendor();

    core::ITransportFactory& transport_;
    core::IHttpClient& http_;
    core::CameraDescriptor descriptor_;
    std::string username_;
    std::optional<StandardsHandle> standards_;
    std::unique_ptr<ProprietarySession> proprietary_;
    std::atomic<bool> open_{true};
};

} // namespace camlink::infra
