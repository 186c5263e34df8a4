#include "infra/protocol/OnvifClient.hpp"

#include "core/discovery/MulticastMessages.hpp"
#include "core/protocol/XmlSupport.hpp"
#include "core/types/Errors.hpp"
#include "infra/crypto/Digest.hpp"
#include "infra/crypto/SecureStorage.hpp"

#include <spdlog/spdlog.h>

#include <ctime>

namespace camlink::infra {

namespace {

constexpr const char* SOAP_CONTENT_TYPE = "application/soap+xml; charset=utf-8";
constexpr size_t NONCE_SIZE = 16;

constexpr const char* GET_DEVICE_INFORMATION =
    R"(<GetDeviceInformation xmlns="http://www.onvif.org/ver10/device/wsdl"/>)";
constexpr const char* GET_SYSTEM_DATE_AND_TIME =
    R"(<GetSystemDateAndTime xmlns="http://www.onvif.org/ver10/device/wsdl"/>)";
constexpr const char* GET_PROFILES = R"(<GetProfiles xmlns="http://www.onvif.org/ver10/media/wsdl"/>)";

bool isAuthorizationFault(const std::string& body) {
    return body.find("NotAuthorized") != std::string::npos ||
           body.find("not authorized") != std::string::npos ||
           body.find("FailedAuthentication") != std::string::npos;
}

} // namespace

OnvifClient::OnvifClient(core::IHttpClient& http) : http_(http) {}

std::string OnvifClient::buildEnvelope(const std::string& body, const std::string& header) {
    std::string envelope = R"(<?xml version="1.0" encoding="utf-8"?>)"
                           R"(<s:Envelope xmlns:s="http://www.w3.org/2003/05/soap-envelope">)";
    if (!header.empty()) {
        envelope += "<s:Header>" + header + "</s:Header>";
    }
    envelope += "<s:Body>" + body + "</s:Body></s:Envelope>";
    return envelope;
}

std::string OnvifClient::passwordDigest(const std::vector<unsigned char>& nonce,
                                        const std::string& created, const std::string& password) {
    std::vector<unsigned char> input(nonce);
    input.insert(input.end(), created.begin(), created.end());
    input.insert(input.end(), password.begin(), password.end());
    return Digest::sha1Base64(input);
}

std::string OnvifClient::buildSecurityHeader(const core::Credential& credential,
                                             const std::vector<unsigned char>& nonce,
                                             const std::string& created) {
    return std::string(
               R"(<Security s:mustUnderstand="1" xmlns="http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-secext-1.0.xsd">)"
               "<UsernameToken><Username>") +
           core::xml::escape(credential.username) +
           R"(</Username><Password Type="http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-username-token-profile-1.0#PasswordDigest">)" +
           passwordDigest(nonce, created, credential.secret) +
           R"(</Password><Nonce EncodingType="http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-soap-message-security-1.0#Base64Binary">)" +
           base64Encode(nonce) +
           R"(</Nonce><Created xmlns="http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-utility-1.0.xsd">)" +
           created + "</Created></UsernameToken></Security>";
}

std::string OnvifClient::formatCreated(std::chrono::system_clock::time_point time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

std::string OnvifClient::pathFromUrl(const std::string& url) {
    auto scheme = url.find("://");
    auto hostStart = scheme == std::string::npos ? 0 : scheme + 3;
    auto slash = url.find('/', hostStart);
    return slash == std::string::npos ? "/" : url.substr(slash);
}

OnvifResponse OnvifClient::call(const std::string& host, uint16_t port, const std::string& path,
                                const std::string& body,
                                const std::optional<core::Credential>& credential,
                                std::chrono::milliseconds timeout) {
    std::string header;
    if (credential && !credential->isEmpty()) {
        header = buildSecurityHeader(*credential, SecureStorage::randomBytes(NONCE_SIZE),
                                     formatCreated(std::chrono::system_clock::now()));
    }

    OnvifResponse response;
    response.http = http_.post(host, port, path, buildEnvelope(body, header), SOAP_CONTENT_TYPE,
                               timeout);
    if (!response.http.success) {
        return response;
    }

    const auto& text = response.http.body;
    response.isSoap = core::xml::containsElement(text, "Envelope");
    response.isFault = response.isSoap && core::xml::containsElement(text, "Fault");
    if (response.isFault) {
        response.faultReason = core::xml::nestedText(text, "Reason", "Text").value_or("SOAP fault");
    }
    response.isAuthFault = response.http.statusCode == 401 ||
                           (response.isFault && isAuthorizationFault(text));
    return response;
}

std::optional<OnvifCapabilities>
OnvifClient::getCapabilities(const std::string& host, uint16_t port,
                             const std::optional<core::Credential>& credential,
                             std::chrono::milliseconds timeout) {
    auto response =
        call(host, port, DEVICE_SERVICE_PATH, GET_CAPABILITIES_REQUEST, credential, timeout);

    if (response.isAuthFault && credential) {
        throw core::AuthenticationError(
            fmt::format("ONVIF service on {}:{} rejected credential for {}", host, port,
                        credential->username));
    }
    if (!response.isSoap || response.isFault) {
        return std::nullopt;
    }

    const auto& body = response.http.body;
    if (!core::xml::containsElement(body, "Capabilities")) {
        return std::nullopt;
    }

    OnvifCapabilities caps;
    caps.deviceXAddr = core::xml::nestedText(body, "Device", "XAddr")
                           .value_or(fmt::format("http://{}:{}{}", host, port, DEVICE_SERVICE_PATH));
    caps.mediaXAddr = core::xml::nestedText(body, "Media", "XAddr");
    caps.eventsXAddr = core::xml::nestedText(body, "Events", "XAddr");
    caps.ptzXAddr = core::xml::nestedText(body, "PTZ", "XAddr");
    return caps;
}

std::optional<OnvifDeviceInfo>
OnvifClient::getDeviceInformation(const std::string& host, uint16_t port,
                                  const std::optional<core::Credential>& credential,
                                  std::chrono::milliseconds timeout) {
    auto response =
        call(host, port, DEVICE_SERVICE_PATH, GET_DEVICE_INFORMATION, credential, timeout);
    if (!response.isSoap || response.isFault) {
        return std::nullopt;
    }

    const auto& body = response.http.body;
    if (!core::xml::containsElement(body, "GetDeviceInformationResponse")) {
        return std::nullopt;
    }

    OnvifDeviceInfo info;
    info.manufacturer = core::xml::firstText(body, "Manufacturer").value_or("");
    info.model = core::xml::firstText(body, "Model").value_or("");
    info.firmwareVersion = core::xml::firstText(body, "FirmwareVersion").value_or("");
    info.serialNumber = core::xml::firstText(body, "SerialNumber").value_or("");
    return info;
}

std::optional<std::string>
OnvifClient::getStreamUri(const std::string& host, uint16_t port, const std::string& mediaPath,
                          const std::optional<core::Credential>& credential,
                          std::chrono::milliseconds timeout) {
    auto profiles = call(host, port, mediaPath, GET_PROFILES, credential, timeout);
    if (!profiles.isSoap || profiles.isFault) {
        spdlog::debug("GetProfiles on {}:{}{} failed: {}", host, port, mediaPath,
                      profiles.isFault ? profiles.faultReason : profiles.http.errorMessage);
        return std::nullopt;
    }

    auto token = core::xml::firstAttribute(profiles.http.body, "Profiles", "token");
    if (!token) {
        return std::nullopt;
    }

    auto body = fmt::format(
        R"(<GetStreamUri xmlns="http://www.onvif.org/ver10/media/wsdl">)"
        R"(<StreamSetup><Stream xmlns="http://www.onvif.org/ver10/schema">RTP-Unicast</Stream>)"
        R"(<Transport xmlns="http://www.onvif.org/ver10/schema"><Protocol>RTSP</Protocol></Transport>)"
        R"(</StreamSetup><ProfileToken>{}</ProfileToken></GetStreamUri>)",
        core::xml::escape(*token));

    auto response = call(host, port, mediaPath, body, credential, timeout);
    if (!response.isSoap || response.isFault) {
        return std::nullopt;
    }

    auto uri = core::xml::nestedText(response.http.body, "MediaUri", "Uri");
    if (!uri || uri->empty()) {
        return std::nullopt;
    }
    return uri;
}

bool OnvifClient::checkHealth(const std::string& host, uint16_t port,
                              std::chrono::milliseconds timeout) {
    auto response =
        call(host, port, DEVICE_SERVICE_PATH, GET_SYSTEM_DATE_AND_TIME, std::nullopt, timeout);
    return response.isSoap;
}

} // namespace camlink::infra
