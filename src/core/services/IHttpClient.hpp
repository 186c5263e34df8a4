/**
 * @file IHttpClient.hpp
 * @brief Interface for the HTTP requests of the ONVIF and web checks.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace camlink::core {

/**
 * @brief Response data from an HTTP request.
 */
struct HttpResponse {
    int statusCode{0};                          ///< Status code (e.g., 200, 401).
    std::map<std::string, std::string> headers; ///< Headers with lower-case names.
    std::string body;                           ///< Response body content.
    std::string errorMessage;                   ///< Error message if request failed.
    bool success{false};                        ///< True if a well-formed response arrived.
    bool connected{false};                      ///< True once the TCP connection was established.

    /**
     * @brief Looks up a header value.
     * @param name Header name (case-insensitive).
     * @return Header value, or empty string if absent.
     */
    [[nodiscard]] std::string header(std::string name) const {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = headers.find(name);
        return it != headers.end() ? it->second : std::string{};
    }

    [[nodiscard]] bool isOk() const { return success && statusCode >= 200 && statusCode < 300; }
};

/**
 * @brief Synchronous HTTP/1.1 client, one connection per request.
 *
 * Failures are reported in the response (success false, errorMessage set)
 * rather than thrown. connected tells a refused or unreachable endpoint
 * apart from one that accepted the connection and then misbehaved.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(const std::string& host, uint16_t port, const std::string& path,
                             std::chrono::milliseconds timeout) = 0;

    virtual HttpResponse post(const std::string& host, uint16_t port, const std::string& path,
                              const std::string& body, const std::string& contentType,
                              std::chrono::milliseconds timeout) = 0;
};

} // namespace camlink::core
