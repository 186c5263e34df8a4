#pragma once

#include "core/services/IHttpClient.hpp"

#include <chrono>
#include <string>

namespace camlink::infra {

/**
 * @brief IHttpClient on top of cpp-httplib.
 *
 * A fresh httplib::Client per request, keep-alive off, connect and read
 * timeouts both set to the request budget.
 */
class HttpClient : public core::IHttpClient {
public:
    HttpClient() = default;

    core::HttpResponse get(const std::string& host, uint16_t port, const std::string& path,
                           std::chrono::milliseconds timeout) override;

    core::HttpResponse post(const std::string& host, uint16_t port, const std::string& path,
                            const std::string& body, const std::string& contentType,
                            std::chrono::milliseconds timeout) override;

    /// Sent with every request.
    static constexpr const char* USER_AGENT = "CamLink/1.0";
};

} // namespace camlink::infra
