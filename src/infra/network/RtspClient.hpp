#pragma once

#include "core/services/ITransport.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace camlink::infra {

/**
 * @brief Status line, headers and body of an RTSP reply.
 */
struct RtspResponse {
    std::string protocol;                       ///< "RTSP/1.0"
    int statusCode{0};
    std::map<std::string, std::string> headers; ///< Lower-case names
    std::string body;                           ///< SDP for DESCRIBE
    std::string errorMessage;
    bool success{false};   ///< A well-formed RTSP reply arrived
    bool connected{false}; ///< The TCP connection was established

    [[nodiscard]] std::string header(const std::string& name) const;
};

/**
 * @brief RTSP/1.0 requests over ITransportFactory, one connection per request.
 *
 * Only the handshake part of RTSP is covered: OPTIONS to tell a media
 * server from anything else, DESCRIBE to find a stream path that exists.
 */
class RtspClient {
public:
    explicit RtspClient(core::ITransportFactory& transport);

    RtspResponse options(const std::string& host, uint16_t port,
                         std::chrono::milliseconds timeout);

    RtspResponse describe(const std::string& host, uint16_t port, const std::string& path,
                          std::chrono::milliseconds timeout);

    /**
     * @brief Walks candidate paths with DESCRIBE.
     *
     * A path counts when the server answers 200 or 401 for it. The walk
     * stops early once the server stops answering.
     *
     * @return rtsp://host:port<path> of the first path that counts, or nullopt.
     */
    std::optional<std::string> resolveStreamUrl(const std::string& host, uint16_t port,
                                                const std::vector<std::string>& paths,
                                                std::chrono::milliseconds timeout);

    static std::string buildRequest(const std::string& method, const std::string& url,
                                    int cseq);

    /**
     * @brief Parses the status line and headers of an RTSP reply.
     * @return Reply without body, or nullopt if it is not RTSP.
     */
    static std::optional<RtspResponse> parseHead(const std::string& head);

    static std::string url(const std::string& host, uint16_t port, const std::string& path);

private:
    RtspResponse send(const std::string& host, uint16_t port, const std::string& method,
                      const std::string& target, std::chrono::milliseconds timeout);

    core::ITransportFactory& transport_;
};

} // namespace camlink::infra
