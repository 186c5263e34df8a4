#pragma once

#include "core/protocol/BinaryProtocolCodec.hpp"
#include "core/services/IHttpClient.hpp"
#include "core/services/IProtocolDetector.hpp"
#include "core/services/ITransport.hpp"
#include "core/types/ProtocolStrategy.hpp"
#include "infra/network/RtspClient.hpp"
#include "infra/protocol/OnvifClient.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace camlink::infra {

/**
 * @brief Tunables of the protocol detector.
 */
struct DetectorOptions {
    std::chrono::milliseconds timeout{2000}; ///< Budget of each individual check
    std::vector<uint16_t> proprietaryPorts{core::DEFAULT_PROPRIETARY_PORT}; ///< Always get the vendor login
    core::ProtocolConstants constants;       ///< Vendor protocol framing
};

/**
 * @brief Classifies what a (host, port) speaks.
 *
 * Checks in order: ONVIF GetCapabilities, RTSP OPTIONS, the vendor login
 * frame and finally a plain HTTP GET. The first structurally valid answer
 * decides. HTTP pages go through DeviceHeuristics so routers and bare login
 * pages are rejected even though their port is open. An endpoint that
 * refuses the connection or answers none of the checks gets an
 * inconclusive rejection.
 *
 * Thread-safe: every check opens its own connection.
 */
class ProtocolDetector : public core::IProtocolDetector {
public:
    ProtocolDetector(core::ITransportFactory& transport, core::IHttpClient& http,
                     DetectorOptions options = {});

    core::Classification classify(const std::string& host, uint16_t port,
                                  const std::optional<core::Credential>& credential) override;

    /**
     * @brief Checks whether the vendor login runs on a port.
     *
     * True for configured proprietary ports and for ports that are neither
     * a known web nor a known streaming port.
     */
    [[nodiscard]] bool isProprietaryCandidate(uint16_t port) const;

    [[nodiscard]] const DetectorOptions& options() const { return options_; }

private:
    /// Check outcome: a decision, or a note for the rejection detail.
    struct CheckResult {
        std::optional<core::Classification> decision;
        std::string note;
        bool reachable{true};
    };

    CheckResult checkOnvif(const std::string& host, uint16_t port,
                           const std::optional<core::Credential>& credential);
    CheckResult checkRtsp(const std::string& host, uint16_t port);
    CheckResult checkProprietary(const std::string& host, uint16_t port,
                                 const std::optional<core::Credential>& credential);
    CheckResult checkHttp(const std::string& host, uint16_t port);

    core::ITransportFactory& transport_;
    DetectorOptions options_;
    core::IHttpClient& http_;
    RtspClient rtsp_;
    OnvifClient onvif_;
    core::BinaryProtocolCodec codec_;
};

} // namespace camlink::infra
