#include "infra/network/HttpClient.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <functional>

namespace camlink::infra {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void configure(httplib::Client& client, std::chrono::milliseconds timeout) {
    auto seconds = static_cast<time_t>(timeout.count() / 1000);
    auto micros = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client.set_connection_timeout(seconds, micros);
    client.set_read_timeout(seconds, micros);
    client.set_write_timeout(seconds, micros);
    client.set_keep_alive(false);
}

core::HttpResponse execute(const std::string& method, const std::string& host, uint16_t port,
                           const std::string& path, std::chrono::milliseconds timeout,
                           const std::function<httplib::Result(httplib::Client&)>& send) {
    core::HttpResponse response;

    try {
        httplib::Client client(host, port);
        configure(client, timeout);

        auto result = send(client);
        if (!result) {
            auto error = result.error();
            response.connected = error != httplib::Error::Connection;
            response.errorMessage = httplib::to_string(error);
            spdlog::debug("{} {}:{}{} failed: {}", method, host, port, path,
                          response.errorMessage);
            return response;
        }

        response.connected = true;
        response.success = true;
        response.statusCode = result->status;
        response.body = result->body;
        for (const auto& [name, value] : result->headers) {
            response.headers[toLower(name)] = value;
        }
    } catch (const std::exception& e) {
        response.success = false;
        response.errorMessage = e.what();
        spdlog::debug("{} {}:{}{} failed: {}", method, host, port, path, e.what());
    }

    return response;
}

} // namespace

core::HttpResponse HttpClient::get(const std::string& host, uint16_t port,
                                   const std::string& path, std::chrono::milliseconds timeout) {
    return execute("GET", host, port, path, timeout, [&](httplib::Client& client) {
        httplib::Headers headers{{"User-Agent", USER_AGENT}};
        return client.Get(path, headers);
    });
}

core::HttpResponse HttpClient::post(const std::string& host, uint16_t port,
                                    const std::string& path, const std::string& body,
                                    const std::string& contentType,
                                    std::chrono::milliseconds timeout) {
    return execute("POST", host, port, path, timeout, [&](httplib::Client& client) {
        httplib::Headers headers{{"User-Agent", USER_AGENT}};
        return client.Post(path, headers, body, contentType);
    });
}

} // namespace camlink::infra
