#pragma once

#include "core/protocol/BinaryProtocolCodec.hpp"
#include "core/protocol/XmlSupport.hpp"
#include "core/services/IHttpClient.hpp"
#include "core/services/ITransport.hpp"
#include "core/types/Errors.hpp"
#include "infra/crypto/Digest.hpp"
#include "infra/crypto/SecureStorage.hpp"
#include "infra/protocol/OnvifClient.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace camlink::testing {

/**
 * @brief What a scripted peer sends back after one write.
 */
struct Reply {
    std::vector<uint8_t> bytes;
    bool close{false}; ///< Peer closes the connection after the reply
};

using Responder = std::function<Reply(const std::vector<uint8_t>& written)>;

/**
 * @brief One HTTP request as a scripted web server sees it.
 */
struct HttpCall {
    std::string method;
    std::string path;
    std::string body;
};

using HttpHandler = std::function<core::HttpResponse(const HttpCall& call)>;

inline std::vector<uint8_t> toBytes(const std::string& text) {
    return {text.begin(), text.end()};
}

inline std::string toText(const std::vector<uint8_t>& bytes) {
    return {bytes.begin(), bytes.end()};
}

/**
 * @brief In-process ITransportFactory and IHttpClient with scripted endpoints.
 *
 * An endpoint can carry a byte-stream responder, an HTTP handler, or both.
 * Connecting to an unknown or dropped endpoint is refused. A stream whose
 * peer has nothing more to say times out immediately instead of waiting.
 * Raw bytes sent to a web-only endpoint get an HTTP 400 and a close; an
 * HTTP request to an endpoint without a handler fails after connecting.
 */
class FakeTransport : public core::ITransportFactory, public core::IHttpClient {
public:
    struct Endpoint {
        Responder responder;
        HttpHandler http;
        std::atomic<bool> down{false};
        std::atomic<int> connects{0};
    };

    class Stream : public core::IByteStream {
    public:
        Stream(std::shared_ptr<Endpoint> endpoint, std::string name, std::mutex& mutex)
            : endpoint_(std::move(endpoint)), name_(std::move(name)), mutex_(mutex) {}

        void write(const std::vector<uint8_t>& data, std::chrono::milliseconds) override {
            if (!isOpen()) {
                throw core::NetworkError("Write to closed stream " + name_);
            }
            Reply reply;
            {
                std::lock_guard lock(mutex_);
                if (endpoint_->responder) {
                    reply = endpoint_->responder(data);
                } else if (endpoint_->http) {
                    reply = {toBytes("HTTP/1.1 400 Bad Request\r\nConnection: close\r\n\r\n"),
                             true};
                } else {
                    reply.close = true;
                }
            }
            inbound_.insert(inbound_.end(), reply.bytes.begin(), reply.bytes.end());
            peerClosed_ = peerClosed_ || reply.close;
        }

        std::vector<uint8_t> readSome(std::chrono::milliseconds) override {
            if (!isOpen() && inbound_.empty()) {
                throw core::NetworkError("Read from closed stream " + name_);
            }
            if (inbound_.empty()) {
                if (peerClosed_) {
                    return {};
                }
                throw core::TimeoutError("Read from " + name_ + " timed out");
            }
            return std::exchange(inbound_, {});
        }

        std::vector<uint8_t> readExactly(size_t size, std::chrono::milliseconds) override {
            if (inbound_.size() < size) {
                if (peerClosed_ || !isOpen()) {
                    throw core::NetworkError(name_ + " closed the connection");
                }
                throw core::TimeoutError("Read from " + name_ + " timed out");
            }
            std::vector<uint8_t> out(inbound_.begin(), inbound_.begin() + size);
            inbound_.erase(inbound_.begin(), inbound_.begin() + size);
            return out;
        }

        void close() override { closed_ = true; }

        bool isOpen() const override { return !closed_ && !endpoint_->down; }

        std::string remoteEndpoint() const override { return name_; }

    private:
        std::shared_ptr<Endpoint> endpoint_;
        std::string name_;
        std::mutex& mutex_;
        std::vector<uint8_t> inbound_;
        bool peerClosed_{false};
        std::atomic<bool> closed_{false};
    };

    /// Replaces the byte-stream peer of an endpoint, keeping its HTTP handler.
    void listen(const std::string& host, uint16_t port, Responder responder) {
        endpoint(host, port)->responder = std::move(responder);
    }

    /// Replaces the HTTP handler of an endpoint, keeping its byte-stream peer.
    void listen(const std::string& host, uint16_t port, HttpHandler handler) {
        endpoint(host, port)->http = std::move(handler);
    }

    /**
     * @brief Simulates socket loss: open streams die and new connects are refused.
     */
    void drop(const std::string& host, uint16_t port) {
        if (auto endpoint = find(host, port)) {
            endpoint->down = true;
        }
    }

    void restore(const std::string& host, uint16_t port) {
        if (auto endpoint = find(host, port)) {
            endpoint->down = false;
        }
    }

    int connects(const std::string& host, uint16_t port) const {
        auto endpoint = find(host, port);
        return endpoint ? endpoint->connects.load() : 0;
    }

    int totalConnects() const { return attempts_.load(); }

    std::unique_ptr<core::IByteStream> connect(const std::string& host, uint16_t port,
                                               std::chrono::milliseconds) override {
        ++attempts_;
        auto name = host + ":" + std::to_string(port);
        auto endpoint = find(host, port);
        if (!endpoint || endpoint->down) {
            throw core::ConnectionRefusedError("Connection to " + name + " refused");
        }
        ++endpoint->connects;
        return std::make_unique<Stream>(endpoint, name, responderMutex_);
    }

    core::HttpResponse get(const std::string& host, uint16_t port, const std::string& path,
                           std::chrono::milliseconds) override {
        return request(host, port, HttpCall{"GET", path, {}});
    }

    core::HttpResponse post(const std::string& host, uint16_t port, const std::string& path,
                            const std::string& body, const std::string&,
                            std::chrono::milliseconds) override {
        return request(host, port, HttpCall{"POST", path, body});
    }

private:
    std::shared_ptr<Endpoint> endpoint(const std::string& host, uint16_t port) {
        std::lock_guard lock(mutex_);
        auto& slot = endpoints_[{host, port}];
        if (!slot) {
            slot = std::make_shared<Endpoint>();
        }
        return slot;
    }

    core::HttpResponse request(const std::string& host, uint16_t port, const HttpCall& call) {
        ++attempts_;
        core::HttpResponse response;
        auto endpoint = find(host, port);
        if (!endpoint || endpoint->down) {
            response.errorMessage = "Could not establish connection";
            return response;
        }
        ++endpoint->connects;
        response.connected = true;
        if (!endpoint->http) {
            response.errorMessage = "Failed to read connection";
            return response;
        }
        std::lock_guard lock(responderMutex_);
        return endpoint->http(call);
    }

    std::shared_ptr<Endpoint> find(const std::string& host, uint16_t port) const {
        std::lock_guard lock(mutex_);
        auto it = endpoints_.find({host, port});
        return it != endpoints_.end() ? it->second : nullptr;
    }

    std::map<std::pair<std::string, uint16_t>, std::shared_ptr<Endpoint>> endpoints_;
    mutable std::mutex mutex_;
    std::mutex responderMutex_;
    std::atomic<int> attempts_{0};
};

// -----------------------------------------------------------------------------
// Scripted peers
// -----------------------------------------------------------------------------

inline core::HttpResponse httpReply(int status, std::string body,
                                    std::map<std::string, std::string> headers = {}) {
    core::HttpResponse response;
    response.statusCode = status;
    response.body = std::move(body);
    response.headers = std::move(headers);
    response.success = true;
    response.connected = true;
    return response;
}

/**
 * @brief Web server answering every request with the same page.
 * @param headers Extra headers, lower-case names.
 */
inline HttpHandler webPage(int status, std::string body,
                           std::map<std::string, std::string> headers = {}) {
    return [status, body = std::move(body), headers = std::move(headers)](const HttpCall&) {
        return httpReply(status, body, headers);
    };
}

/**
 * @brief RTSP server: answers OPTIONS, and DESCRIBE for the stream paths it
 * serves (404 for any other path). Anything else gets a 400.
 */
inline Responder rtspServer(std::vector<std::string> paths = {"/stream1"}) {
    return [paths = std::set<std::string>(paths.begin(), paths.end())](
               const std::vector<uint8_t>& written) {
        auto request = toText(written);
        if (request.find("RTSP/1.0") == std::string::npos) {
            return Reply{toBytes("RTSP/1.0 400 Bad Request\r\nCSeq: 0\r\n\r\n"), true};
        }
        if (request.rfind("OPTIONS", 0) == 0) {
            return Reply{toBytes("RTSP/1.0 200 OK\r\nCSeq: 1\r\n"
                                 "Public: OPTIONS, DESCRIBE, SETUP, PLAY, TEARDOWN\r\n\r\n"),
                         false};
        }
        if (request.rfind("DESCRIBE ", 0) == 0) {
            auto url = request.substr(9, request.find(' ', 9) - 9);
            auto authority = url.find("//");
            auto slash = url.find('/', authority == std::string::npos ? 0 : authority + 2);
            auto path = slash == std::string::npos ? std::string{"/"} : url.substr(slash);
            if (paths.count(path) == 0) {
                return Reply{toBytes("RTSP/1.0 404 Not Found\r\nCSeq: 1\r\n\r\n"), false};
            }
            std::string sdp = "v=0\r\ns=Live\r\nm=video 0 RTP/AVP 96\r\n";
            return Reply{toBytes("RTSP/1.0 200 OK\r\nCSeq: 1\r\n"
                                 "Content-Type: application/sdp\r\n"
                                 "Content-Length: " + std::to_string(sdp.size()) + "\r\n\r\n" +
                                 sdp),
                         false};
        }
        return Reply{toBytes("RTSP/1.0 400 Bad Request\r\nCSeq: 1\r\n\r\n"), true};
    };
}

struct OnvifScript {
    std::string host;
    uint16_t port{80};
    std::string username{"admin"};
    std::string password{"secret"};
    std::string manufacturer{"Acme"};
    std::string model{"IPC-100"};
    std::string streamUri;            ///< Defaults to rtsp://host:554/stream1
    bool anonymousCapabilities{true}; ///< GetCapabilities without a UsernameToken
    bool streamUriSupported{true};    ///< False answers GetStreamUri with a fault
};

inline std::string soapEnvelope(const std::string& body) {
    return R"(<?xml version="1.0" encoding="UTF-8"?>)"
           R"(<SOAP-ENV:Envelope xmlns:SOAP-ENV="http://www.w3.org/2003/05/soap-envelope" )"
           R"(xmlns:tds="http://www.onvif.org/ver10/device/wsdl" )"
           R"(xmlns:trt="http://www.onvif.org/ver10/media/wsdl" )"
           R"(xmlns:tt="http://www.onvif.org/ver10/schema"><SOAP-ENV:Body>)" +
           body + "</SOAP-ENV:Body></SOAP-ENV:Envelope>";
}

inline std::string notAuthorizedFault() {
    return soapEnvelope(
        "<SOAP-ENV:Fault><SOAP-ENV:Code><SOAP-ENV:Value>SOAP-ENV:Sender</SOAP-ENV:Value>"
        "<SOAP-ENV:Subcode><SOAP-ENV:Value>ter:NotAuthorized</SOAP-ENV:Value></SOAP-ENV:Subcode>"
        "</SOAP-ENV:Code><SOAP-ENV:Reason><SOAP-ENV:Text xml:lang=\"en\">Sender not authorized"
        "</SOAP-ENV:Text></SOAP-ENV:Reason></SOAP-ENV:Fault>");
}

/**
 * @brief Checks a WS-Security UsernameToken the way a camera would.
 */
inline bool verifyUsernameToken(const std::string& request, const OnvifScript& script) {
    auto username = core::xml::firstText(request, "Username");
    auto password = core::xml::firstText(request, "Password");
    auto nonce = core::xml::firstText(request, "Nonce");
    auto created = core::xml::firstText(request, "Created");
    if (!username || !password || !nonce || !created || *username != script.username) {
        return false;
    }
    auto expected = infra::OnvifClient::passwordDigest(infra::base64Decode(*nonce), *created,
                                                       script.password);
    return expected == *password;
}

/**
 * @brief ONVIF device and media service.
 */
inline HttpHandler onvifDevice(OnvifScript script) {
    if (script.streamUri.empty()) {
        script.streamUri = "rtsp://" + script.host + ":554/stream1";
    }
    return [script](const HttpCall& call) {
        if (call.method != "POST") {
            return httpReply(405, "");
        }
        const auto& body = call.body;

        bool authorized = verifyUsernameToken(body, script);
        auto base = "http://" + script.host + ":" + std::to_string(script.port);

        if (core::xml::containsElement(body, "GetSystemDateAndTime")) {
            return httpReply(200, soapEnvelope("<tds:GetSystemDateAndTimeResponse>"
                                               "<tds:SystemDateAndTime/>"
                                               "</tds:GetSystemDateAndTimeResponse>"));
        }
        if (core::xml::containsElement(body, "GetCapabilities")) {
            if (!authorized && !script.anonymousCapabilities) {
                return httpReply(400, notAuthorizedFault());
            }
            return httpReply(
                200, soapEnvelope("<tds:GetCapabilitiesResponse><tds:Capabilities>"
                                  "<tt:Device><tt:XAddr>" + base + "/onvif/device_service"
                                  "</tt:XAddr></tt:Device>"
                                  "<tt:Media><tt:XAddr>" + base + "/onvif/media"
                                  "</tt:XAddr></tt:Media>"
                                  "</tds:Capabilities></tds:GetCapabilitiesResponse>"));
        }
        if (!authorized) {
            return httpReply(400, notAuthorizedFault());
        }
        if (core::xml::containsElement(body, "GetDeviceInformation")) {
            return httpReply(200, soapEnvelope("<tds:GetDeviceInformationResponse>"
                                               "<tds:Manufacturer>" + script.manufacturer +
                                               "</tds:Manufacturer><tds:Model>" + script.model +
                                               "</tds:Model><tds:FirmwareVersion>1.0"
                                               "</tds:FirmwareVersion><tds:SerialNumber>SN1"
                                               "</tds:SerialNumber>"
                                               "</tds:GetDeviceInformationResponse>"));
        }
        if (core::xml::containsElement(body, "GetProfiles")) {
            return httpReply(200, soapEnvelope("<trt:GetProfilesResponse>"
                                               "<trt:Profiles token=\"Profile_1\" fixed=\"true\">"
                                               "<tt:Name>main</tt:Name></trt:Profiles>"
                                               "</trt:GetProfilesResponse>"));
        }
        if (core::xml::containsElement(body, "GetStreamUri") && script.streamUriSupported) {
            return httpReply(200, soapEnvelope("<trt:GetStreamUriResponse><trt:MediaUri>"
                                               "<tt:Uri>" + script.streamUri + "</tt:Uri>"
                                               "</trt:MediaUri></trt:GetStreamUriResponse>"));
        }
        return httpReply(400, soapEnvelope("<SOAP-ENV:Fault><SOAP-ENV:Reason><SOAP-ENV:Text>"
                                           "Action not supported</SOAP-ENV:Text>"
                                           "</SOAP-ENV:Reason></SOAP-ENV:Fault>"));
    };
}

struct VendorScript {
    std::string username{"admin"};
    std::string password{"secret"};
    std::string sessionId{"0x0000000A"};
    core::ProtocolConstants constants;
    std::shared_ptr<std::atomic<int>> logins{std::make_shared<std::atomic<int>>(0)};
};

/**
 * @brief Vendor binary protocol server. Closes the connection on anything
 * that is not a frame.
 */
inline Responder vendorDevice(VendorScript script) {
    return [script](const std::vector<uint8_t>& written) {
        core::BinaryProtocolCodec codec(script.constants);
        core::ProtocolFrame frame;
        try {
            frame = codec.decodeFrame(written);
        } catch (const core::ProtocolError&) {
            return Reply{{}, true};
        }

        nlohmann::json reply;
        if (frame.commandId == static_cast<uint32_t>(core::CommandId::Login)) {
            ++*script.logins;
            bool ok = frame.payload.value("UserName", "") == script.username &&
                      frame.payload.value("PassWord", "") ==
                          infra::Digest::md5Hex(script.password);
            reply = ok ? nlohmann::json{{"Ret", script.constants.successCode},
                                        {"SessionID", script.sessionId},
                                        {"AliveInterval", 20}}
                       : nlohmann::json{{"Ret", 205}, {"SessionID", "0x00000000"}};
        } else if (frame.payload.value("SessionID", "") != script.sessionId) {
            reply = {{"Ret", 103}};
        } else {
            reply = {{"Ret", script.constants.successCode},
                     {"SessionID", script.sessionId},
                     {"Name", frame.payload.value("Name", "")}};
            if (frame.commandId == static_cast<uint32_t>(core::CommandId::ListRecordings)) {
                reply["OPFileQuery"] = nlohmann::json::array(
                    {{{"FileName", "/idea0/2024-01-31/001/08.00.00-08.10.00[R][@1][0].h264"},
                      {"BeginTime", "2024-01-31 08:00:00"},
                      {"EndTime", "2024-01-31 08:10:00"}}});
            }
        }
        return Reply{codec.encode(frame.commandId, reply), false};
    };
}

} // namespace camlink::testing
