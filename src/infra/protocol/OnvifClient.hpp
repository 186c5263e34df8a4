#pragma once

#include "core/services/IHttpClient.hpp"
#include "core/types/CameraDescriptor.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace camlink::infra {

/**
 * @brief Service addresses advertised by GetCapabilities.
 */
struct OnvifCapabilities {
    std::string deviceXAddr;
    std::optional<std::string> mediaXAddr;
    std::optional<std::string> eventsXAddr;
    std::optional<std::string> ptzXAddr;
};

struct OnvifDeviceInfo {
    std::string manufacturer;
    std::string model;
    std::string firmwareVersion;
    std::string serialNumber;
};

/**
 * @brief Outcome of one SOAP call.
 */
struct OnvifResponse {
    core::HttpResponse http;
    bool isSoap{false};      ///< Body is a SOAP envelope
    bool isFault{false};     ///< Envelope carries a SOAP fault
    bool isAuthFault{false}; ///< Camera refused the credential (401 or NotAuthorized)
    std::string faultReason;
};

/**
 * @brief ONVIF device and media service client (SOAP 1.2 over HTTP).
 *
 * Authenticated calls carry a WS-Security UsernameToken with a
 * PasswordDigest of Base64(SHA1(nonce + created + password)).
 */
class OnvifClient {
public:
    static constexpr const char* DEVICE_SERVICE_PATH = "/onvif/device_service";
    static constexpr const char* GET_CAPABILITIES_REQUEST =
        R"(<GetCapabilities xmlns="http://www.onvif.org/ver10/device/wsdl"><Category>All</Category></GetCapabilities>)";

    explicit OnvifClient(core::IHttpClient& http);

    /**
     * @brief Posts a SOAP body.
     * @param body Inner content of the SOAP Body element.
     * @param credential Adds a UsernameToken header when set.
     */
    OnvifResponse call(const std::string& host, uint16_t port, const std::string& path,
                       const std::string& body, const std::optional<core::Credential>& credential,
                       std::chrono::milliseconds timeout);

    /**
     * @brief Queries the device capabilities.
     * @return Capabilities, or nullopt if the endpoint does not speak ONVIF.
     * @throws AuthenticationError if the camera rejects the credential.
     */
    std::optional<OnvifCapabilities> getCapabilities(const std::string& host, uint16_t port,
                                                     const std::optional<core::Credential>& credential,
                                                     std::chrono::milliseconds timeout);

    std::optional<OnvifDeviceInfo>
    getDeviceInformation(const std::string& host, uint16_t port,
                         const std::optional<core::Credential>& credential,
                         std::chrono::milliseconds timeout);

    /**
     * @brief Resolves the RTSP URI of the first media profile.
     * @param mediaPath Path of the media service.
     * @return URI, or nullopt if profiles or the URI are unavailable.
     */
    std::optional<std::string> getStreamUri(const std::string& host, uint16_t port,
                                            const std::string& mediaPath,
                                            const std::optional<core::Credential>& credential,
                                            std::chrono::milliseconds timeout);

    /**
     * @brief Unauthenticated liveness check (GetSystemDateAndTime).
     */
    bool checkHealth(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

    /**
     * @brief Wraps a body into a SOAP 1.2 envelope.
     */
    static std::string buildEnvelope(const std::string& body, const std::string& header = {});

    /**
     * @brief Builds the WS-Security header for a credential.
     */
    static std::string buildSecurityHeader(const core::Credential& credential,
                                           const std::vector<unsigned char>& nonce,
                                           const std::string& created);

    /**
     * @brief Computes Base64(SHA1(nonce + created + password)).
     */
    static std::string passwordDigest(const std::vector<unsigned char>& nonce,
                                      const std::string& created, const std::string& password);

    /**
     * @brief Formats a timestamp as xsd:dateTime in UTC ("2024-01-31T12:00:00Z").
     */
    static std::string formatCreated(std::chrono::system_clock::time_point time);

    /**
     * @brief Extracts the path of an XAddr URL ("/" when absent).
     */
    static std::string pathFromUrl(const std::string& url);

private:
    core::IHttpClient& http_;
};

} // namespace camlink::infra
