#include "infra/detection/ProtocolDetector.hpp"

#include "core/detection/DeviceHeuristics.hpp"
#include "core/types/CameraPorts.hpp"
#include "core/protocol/XmlSupport.hpp"
#include "core/types/Errors.hpp"
#include "infra/crypto/Digest.hpp"
#include "infra/protocol/ProprietaryClient.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace camlink::infra {

namespace {

constexpr double ONVIF_CAPABILITIES_CONFIDENCE = 0.95;
constexpr double ONVIF_FAULT_CONFIDENCE = 0.8;
constexpr double RTSP_CONFIDENCE = 0.9;
constexpr double PROPRIETARY_CONFIDENCE = 0.9;

// Account used for the vendor login when no credential is known. Any
// well-formed reply, including a refusal, identifies the protocol.
constexpr const char* DEFAULT_USERNAME = "admin";

core::Classification decide(core::ProtocolKind kind, double confidence, std::string detail) {
    core::Classification c;
    c.kind = kind;
    c.confidence = confidence;
    c.detail = std::move(detail);
    return c;
}

} // namespace

ProtocolDetector::ProtocolDetector(core::ITransportFactory& transport, core::IHttpClient& http,
                                   DetectorOptions options)
    : transport_(transport), options_(std::move(options)), http_(http), rtsp_(transport),
      onvif_(http), codec_(options_.constants) {}

bool ProtocolDetector::isProprietaryCandidate(uint16_t port) const {
    if (std::find(options_.proprietaryPorts.begin(), options_.proprietaryPorts.end(), port) !=
        options_.proprietaryPorts.end()) {
        return true;
    }
    return !core::CameraPorts::isWebInterfacePort(port) &&
           !core::CameraPorts::isStreamingPort(port);
}

ProtocolDetector::CheckResult
ProtocolDetector::checkOnvif(const std::string& host, uint16_t port,
                             const std::optional<core::Credential>& credential) {
    CheckResult result;
    auto response = onvif_.call(host, port, OnvifClient::DEVICE_SERVICE_PATH,
                                OnvifClient::GET_CAPABILITIES_REQUEST, credential,
                                options_.timeout);

    if (!response.http.connected) {
        result.reachable = false;
        result.note = "connect failed: " + response.http.errorMessage;
        return result;
    }
    if (!response.isSoap) {
        result.note = "onvif: " + (response.http.success
                                       ? fmt::format("HTTP {} without SOAP envelope",
                                                     response.http.statusCode)
                                       : response.http.errorMessage);
        return result;
    }

    if (response.isFault) {
        result.decision = decide(core::ProtocolKind::Standards, ONVIF_FAULT_CONFIDENCE,
                                 "ONVIF SOAP fault: " + response.faultReason);
        return result;
    }
    if (!core::xml::containsElement(response.http.body, "Capabilities")) {
        result.note = "onvif: SOAP envelope without Capabilities";
        return result;
    }

    std::string detail = "ONVIF GetCapabilities";
    auto info = onvif_.getDeviceInformation(host, port, credential, options_.timeout);
    if (info && !info->manufacturer.empty()) {
        if (core::DeviceHeuristics::isBlacklistedManufacturer(info->manufacturer)) {
            result.decision = decide(core::ProtocolKind::Rejected, 0.9,
                                     "ONVIF device from non-camera vendor " + info->manufacturer);
            return result;
        }
        detail += fmt::format(" ({} {})", info->manufacturer, info->model);
    }
    result.decision = decide(core::ProtocolKind::Standards, ONVIF_CAPABILITIES_CONFIDENCE, detail);
    return result;
}

ProtocolDetector::CheckResult ProtocolDetector::checkRtsp(const std::string& host, uint16_t port) {
    CheckResult result;

    auto response = rtsp_.options(host, port, options_.timeout);
    if (!response.connected) {
        result.reachable = false;
        result.note = "connect failed: " + response.errorMessage;
        return result;
    }
    if (!response.success) {
        result.note = "rtsp: " + response.errorMessage;
        return result;
    }

    auto detail = fmt::format("RTSP {} {}", response.protocol, response.statusCode);
    auto methods = response.header("public");
    if (!methods.empty()) {
        detail += " (" + methods + ")";
    }
    result.decision = decide(core::ProtocolKind::Media, RTSP_CONFIDENCE, detail);
    return result;
}

ProtocolDetector::CheckResult
ProtocolDetector::checkProprietary(const std::string& host, uint16_t port,
                                   const std::optional<core::Credential>& credential) {
    CheckResult result;
    std::string username = credential ? credential->username : DEFAULT_USERNAME;
    std::string secret = credential ? credential->secret : std::string{};

    try {
        auto stream = transport_.connect(host, port, options_.timeout);
        auto login = codec_.makeLoginPayload(username, Digest::md5Hex(secret));
        auto frame = ProprietaryClient::exchange(*stream, codec_,
                                                 static_cast<uint32_t>(core::CommandId::Login),
                                                 login, options_.timeout);
        stream->close();

        auto detail = fmt::format("Vendor login reply {}", core::commandIdToString(frame.commandId));
        if (frame.payload.contains("Ret")) {
            detail += " Ret " + frame.payload["Ret"].dump();
        }
        result.decision = decide(core::ProtocolKind::Proprietary, PROPRIETARY_CONFIDENCE, detail);
    } catch (const core::ProtocolError& e) {
        result.note = std::string("vendor: ") + e.what();
    } catch (const core::NetworkError& e) {
        result.note = std::string("vendor: ") + e.what();
    }
    return result;
}

ProtocolDetector::CheckResult ProtocolDetector::checkHttp(const std::string& host, uint16_t port) {
    CheckResult result;
    auto response = http_.get(host, port, "/", options_.timeout);

    if (!response.connected) {
        result.reachable = false;
        result.note = "connect failed: " + response.errorMessage;
        return result;
    }
    if (!response.success) {
        result.note = "http: " + response.errorMessage;
        return result;
    }

    // Digest-protected cameras often name themselves only in the realm
    std::string text = response.body;
    auto realm = response.header("www-authenticate");
    if (!realm.empty()) {
        text += "\n" + realm;
    }

    auto assessment = core::DeviceHeuristics::assessHttpPage(text, response.header("server"));
    if (assessment.verdict == core::PageVerdict::Camera) {
        result.decision = decide(core::ProtocolKind::Web, assessment.confidence,
                                 fmt::format("HTTP {}: {}", response.statusCode, assessment.reason));
    } else {
        result.decision = decide(core::ProtocolKind::Rejected, assessment.confidence,
                                 fmt::format("HTTP {} {}: {}", response.statusCode,
                                             core::pageVerdictToString(assessment.verdict),
                                             assessment.reason));
    }
    return result;
}

core::Classification ProtocolDetector::classify(const std::string& host, uint16_t port,
                                                const std::optional<core::Credential>& credential) {
    std::vector<std::string> notes;

    auto finish = [&](const core::Classification& c) {
        if (c.isAccepted()) {
            spdlog::info("{}:{} classified as {} ({:.2f}): {}", host, port,
                         core::protocolKindToString(c.kind), c.confidence, c.detail);
        } else {
            spdlog::info("{}:{} rejected: {}", host, port, c.detail);
        }
        return c;
    };

    auto onvif = checkOnvif(host, port, credential);
    if (onvif.decision) {
        return finish(*onvif.decision);
    }
    if (!onvif.reachable) {
        return finish(core::Classification::inconclusive(onvif.note));
    }
    notes.push_back(onvif.note);

    auto rtsp = checkRtsp(host, port);
    if (rtsp.decision) {
        return finish(*rtsp.decision);
    }
    notes.push_back(rtsp.note);

    if (isProprietaryCandidate(port)) {
        auto vendor = checkProprietary(host, port, credential);
        if (vendor.decision) {
            return finish(*vendor.decision);
        }
        notes.push_back(vendor.note);
    }

    auto web = checkHttp(host, port);
    if (web.decision) {
        return finish(*web.decision);
    }
    notes.push_back(web.note);

    std::string detail = "No structural response";
    for (const auto& note : notes) {
        detail += "; " + note;
    }
    return finish(core::Classification::inconclusive(detail));
}

} // namespace camlink::infra
