#include "infra/network/RtspClient.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace camlink::infra {

namespace {

constexpr size_t MAX_HEAD_SIZE = 16 * 1024;
constexpr size_t MAX_BODY_SIZE = 64 * 1024;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::string RtspResponse::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : std::string{};
}

RtspClient::RtspClient(core::ITransportFactory& transport) : transport_(transport) {}

std::string RtspClient::url(const std::string& host, uint16_t port, const std::string& path) {
    std::string suffix = path.empty() || path.front() != '/' ? "/" + path : path;
    return "rtsp://" + host + ":" + std::to_string(port) + suffix;
}

std::string RtspClient::buildRequest(const std::string& method, const std::string& url,
                                     int cseq) {
    std::ostringstream oss;
    oss << method << " " << url << " RTSP/1.0\r\n";
    oss << "CSeq: " << cseq << "\r\n";
    oss << "User-Agent: CamLink/1.0\r\n";
    if (method == "DESCRIBE") {
        oss << "Accept: application/sdp\r\n";
    }
    oss << "\r\n";
    return oss.str();
}

std::optional<RtspResponse> RtspClient::parseHead(const std::string& head) {
    std::istringstream stream(head);
    std::string statusLine;
    if (!std::getline(stream, statusLine)) {
        return std::nullopt;
    }
    statusLine = trim(statusLine);
    if (statusLine.rfind("RTSP/", 0) != 0) {
        return std::nullopt;
    }

    auto firstSpace = statusLine.find(' ');
    if (firstSpace == std::string::npos) {
        return std::nullopt;
    }

    RtspResponse response;
    response.protocol = statusLine.substr(0, firstSpace);

    auto codeStart = firstSpace + 1;
    auto codeEnd = statusLine.find(' ', codeStart);
    std::string code = statusLine.substr(
        codeStart, codeEnd == std::string::npos ? std::string::npos : codeEnd - codeStart);
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), response.statusCode);
    if (ec != std::errc{} || response.statusCode < 100 || response.statusCode > 599) {
        return std::nullopt;
    }

    std::string line;
    while (std::getline(stream, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        response.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return response;
}

RtspResponse RtspClient::send(const std::string& host, uint16_t port, const std::string& method,
                              const std::string& target, std::chrono::milliseconds timeout) {
    RtspResponse response;

    try {
        auto stream = transport_.connect(host, port, timeout);
        response.connected = true;

        auto raw = buildRequest(method, target, 1);
        stream->write(std::vector<uint8_t>(raw.begin(), raw.end()), timeout);

        std::string data;
        size_t headEnd = std::string::npos;
        while ((headEnd = data.find("\r\n\r\n")) == std::string::npos) {
            if (data.size() > MAX_HEAD_SIZE) {
                throw core::ProtocolError("RTSP reply head exceeds size limit");
            }
            auto chunk = stream->readSome(timeout);
            if (chunk.empty()) {
                break;
            }
            data.append(chunk.begin(), chunk.end());
        }

        if (headEnd == std::string::npos) {
            response.errorMessage = data.empty() ? "Empty reply" : "Incomplete reply head";
            stream->close();
            return response;
        }

        auto parsed = parseHead(data.substr(0, headEnd + 4));
        if (!parsed) {
            response.errorMessage = "Not an RTSP reply";
            stream->close();
            return response;
        }
        response = std::move(*parsed);
        response.connected = true;
        response.body = data.substr(headEnd + 4);

        auto contentLength = response.header("content-length");
        if (!contentLength.empty()) {
            size_t expected = 0;
            auto [end, ec] = std::from_chars(
                contentLength.data(), contentLength.data() + contentLength.size(), expected);
            if (ec != std::errc{} || expected > MAX_BODY_SIZE) {
                throw core::ProtocolError("Invalid Content-Length '" + contentLength + "'");
            }
            while (response.body.size() < expected) {
                auto chunk = stream->readSome(timeout);
                if (chunk.empty()) {
                    break;
                }
                response.body.append(chunk.begin(), chunk.end());
            }
            if (response.body.size() > expected) {
                response.body.resize(expected);
            }
        }

        response.success = true;
        stream->close();
    } catch (const std::exception& e) {
        response.success = false;
        response.errorMessage = e.what();
        spdlog::debug("RTSP {} {} failed: {}", method, target, e.what());
    }

    return response;
}

RtspResponse RtspClient::options(const std::string& host, uint16_t port,
                                 std::chrono::milliseconds timeout) {
    return send(host, port, "OPTIONS", url(host, port, "/"), timeout);
}

RtspResponse RtspClient::describe(const std::string& host, uint16_t port,
                                  const std::string& path, std::chrono::milliseconds timeout) {
    return send(host, port, "DESCRIBE", url(host, port, path), timeout);
}

std::optional<std::string> RtspClient::resolveStreamUrl(const std::string& host, uint16_t port,
                                                        const std::vector<std::string>& paths,
                                                        std::chrono::milliseconds timeout) {
    for (const auto& path : paths) {
        auto response = describe(host, port, path, timeout);
        if (!response.success) {
            spdlog::debug("{}:{} stopped answering DESCRIBE at {}: {}", host, port, path,
                          response.errorMessage);
            return std::nullopt;
        }
        if (response.statusCode == 200 || response.statusCode == 401) {
            auto found = url(host, port, path);
            spdlog::debug("{}:{} serves {} ({})", host, port, path, response.statusCode);
            return found;
        }
    }
    return std::nullopt;
}

} // namespace camlink::infra
