#include <catch2/catch_test_macros.hpp>

#include "infra/network/HttpClient.hpp"

#include <httplib.h>

#include <chrono>
#include <mutex>
#include <thread>

using namespace camlink::infra;
using namespace std::chrono_literals;

namespace {

/**
 * @brief httplib::Server on a loopback port, listening on its own thread.
 */
class LocalServer {
public:
    LocalServer() {
        server.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
            remember(req);
            res.set_header("Server", "thttpd");
            res.set_content("<title>IPCam</title>", "text/html");
        });
        server.Get("/protected", [this](const httplib::Request& req, httplib::Response& res) {
            remember(req);
            res.status = 401;
            res.set_header("WWW-Authenticate", "Digest realm=\"IPCAM\"");
            res.set_content("Unauthorized", "text/plain");
        });
        server.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(600ms);
            res.set_content("late", "text/plain");
        });
        server.Post("/onvif/device_service",
                    [this](const httplib::Request& req, httplib::Response& res) {
                        remember(req);
                        res.set_content(req.body, "application/soap+xml");
                    });

        port = static_cast<uint16_t>(server.bind_to_any_port("127.0.0.1"));
        thread_ = std::thread([this] { server.listen_after_bind(); });
        while (!server.is_running()) {
            std::this_thread::sleep_for(1ms);
        }
    }

    ~LocalServer() {
        server.stop();
        thread_.join();
    }

    std::string lastHeader(const std::string& name) {
        std::lock_guard lock(mutex_);
        auto it = lastHeaders_.find(name);
        return it != lastHeaders_.end() ? it->second : std::string{};
    }

    httplib::Server server;
    uint16_t port{0};

private:
    void remember(const httplib::Request& req) {
        std::lock_guard lock(mutex_);
        lastHeaders_ = req.headers;
    }

    std::thread thread_;
    std::mutex mutex_;
    httplib::Headers lastHeaders_;
};

} // namespace

TEST_CASE("HttpClient against a local server", "[HttpClient]") {
    LocalServer server;
    HttpClient client;

    SECTION("GET returns status, body and headers") {
        auto response = client.get("127.0.0.1", server.port, "/", 2000ms);
        REQUIRE(response.connected);
        REQUIRE(response.success);
        REQUIRE(response.isOk());
        REQUIRE(response.statusCode == 200);
        REQUIRE(response.body == "<title>IPCam</title>");
        REQUIRE(response.header("Server") == "thttpd");
        REQUIRE(response.header("server") == "thttpd");
        REQUIRE(response.header("X-Missing").empty());
        REQUIRE(server.lastHeader("User-Agent") == HttpClient::USER_AGENT);
    }

    SECTION("Error statuses are answers, not failures") {
        auto response = client.get("127.0.0.1", server.port, "/protected", 2000ms);
        REQUIRE(response.success);
        REQUIRE_FALSE(response.isOk());
        REQUIRE(response.statusCode == 401);
        REQUIRE(response.header("www-authenticate") == "Digest realm=\"IPCAM\"");
    }

    SECTION("POST carries body and content type") {
        auto response = client.post("127.0.0.1", server.port, "/onvif/device_service",
                                    "<Envelope/>", "application/soap+xml; charset=utf-8",
                                    2000ms);
        REQUIRE(response.isOk());
        REQUIRE(response.body == "<Envelope/>");
        REQUIRE(server.lastHeader("Content-Type") == "application/soap+xml; charset=utf-8");
    }

    SECTION("Slow replies time out after connecting") {
        auto response = client.get("127.0.0.1", server.port, "/slow", 100ms);
        REQUIRE(response.connected);
        REQUIRE_FALSE(response.success);
        REQUIRE_FALSE(response.errorMessage.empty());
    }
}

TEST_CASE("HttpClient against a closed port", "[HttpClient]") {
    uint16_t port = 0;
    {
        LocalServer server;
        port = server.port;
    }

    HttpClient client;
    auto response = client.get("127.0.0.1", port, "/", 500ms);
    REQUIRE_FALSE(response.connected);
    REQUIRE_FALSE(response.success);
    REQUIRE_FALSE(response.errorMessage.empty());
}
