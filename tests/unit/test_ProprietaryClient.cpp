#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infra/protocol/ProprietaryClient.hpp"
#include "support/FakeTransport.hpp"

using namespace camlink::core;
using namespace camlink::infra;
using namespace camlink::testing;
using namespace std::chrono_literals;

TEST_CASE("ProprietaryClient login", "[ProprietaryClient]") {
    FakeTransport transport;
    ProprietaryClient client(transport);
    VendorScript script;
    transport.listen("192.168.1.50", 34567, vendorDevice(script));

    SECTION("Valid credential yields a session token") {
        auto session = client.login("192.168.1.50", 34567, Credential{"admin", "secret"}, 500ms);
        REQUIRE(session);
        REQUIRE(session->token() == "0x0000000A");
        REQUIRE(session->isOpen());
        REQUIRE(*script.logins == 1);
    }

    SECTION("Wrong secret is an authentication error") {
        REQUIRE_THROWS_AS(
            client.login("192.168.1.50", 34567, Credential{"admin", "wrong"}, 500ms),
            AuthenticationError);
    }

    SECTION("Closed port is a network error") {
        REQUIRE_THROWS_AS(client.login("192.168.1.50", 34568, Credential{"admin", "secret"}, 500ms),
                          NetworkError);
    }

    SECTION("Non-vendor peers produce malformed frames") {
        transport.listen("192.168.1.60", 34567, webPage(400, "Bad Request"));
        REQUIRE_THROWS_AS(
            client.login("192.168.1.60", 34567, Credential{"admin", "secret"}, 500ms),
            FrameMalformedError);
    }
}

TEST_CASE("ProprietarySession commands", "[ProprietaryClient]") {
    FakeTransport transport;
    ProprietaryClient client(transport);
    transport.listen("192.168.1.50", 34567, vendorDevice(VendorScript{}));
    auto session = client.login("192.168.1.50", 34567, Credential{"admin", "secret"}, 500ms);

    SECTION("Keep-alive and system info") {
        REQUIRE(session->keepAlive(500ms));
        REQUIRE(session->systemInfo(500ms)["Name"] == "SystemInfo");
    }

    SECTION("Recordings, playback and PTZ") {
        auto files = session->listRecordings("2024-01-31 00:00:00", "2024-01-31 23:59:59", 0, 500ms);
        REQUIRE(files["OPFileQuery"].size() == 1);
        REQUIRE(session->startPlayback("/idea0/file.h264", 0, 500ms)["Name"] == "OPPlayBack");
        REQUIRE(session->ptzControl("DirectionUp", 3, 0, 500ms)["Name"] == "OPPTZControl");
    }

    SECTION("Extension commands must be above the catalog") {
        REQUIRE(session->sendExtension(EXTENSION_COMMAND_BASE + 1, {{"Name", "Custom"}}, 500ms)
                    ["Name"] == "Custom");
        REQUIRE_THROWS_AS(session->sendExtension(1500, {}, 500ms), UnsupportedCommandError);
    }

    SECTION("Socket loss closes the session") {
        transport.drop("192.168.1.50", 34567);
        REQUIRE_FALSE(session->isOpen());
        REQUIRE_FALSE(session->keepAlive(500ms));
        REQUIRE_THROWS_AS(session->systemInfo(500ms), NetworkError);
    }

    SECTION("close is idempotent") {
        session->close();
        session->close();
        REQUIRE_FALSE(session->isOpen());
    }
}

TEST_CASE("ProprietarySession rejects foreign tokens", "[ProprietaryClient]") {
    FakeTransport transport;
    transport.listen("192.168.1.50", 34567, vendorDevice(VendorScript{}));
    BinaryProtocolCodec codec;

    ProprietarySession session(transport.connect("192.168.1.50", 34567, 500ms), codec,
                               "0xDEADBEEF");
    REQUIRE_THROWS_AS(session.systemInfo(500ms), ProtocolError);
}

TEST_CASE("ProprietarySession closes on an out-of-step stream", "[ProprietaryClient]") {
    FakeTransport transport;
    BinaryProtocolCodec codec;

    SECTION("Garbled reply") {
        transport.listen("192.168.1.61", 34567, [](const std::vector<uint8_t>&) {
            return Reply{toBytes("garbage that is not a frame header"), false};
        });
        ProprietarySession session(transport.connect("192.168.1.61", 34567, 500ms), codec,
                                   "0x0000000A");

        REQUIRE_THROWS_AS(session.systemInfo(500ms), FrameMalformedError);
        REQUIRE_FALSE(session.isOpen());
        REQUIRE_THROWS_AS(session.systemInfo(500ms), NetworkError);
    }

    SECTION("Reply cut short") {
        transport.listen("192.168.1.62", 34567, [](const std::vector<uint8_t>&) {
            auto full = BinaryProtocolCodec{}.encode(
                CommandId::SystemInfo, nlohmann::json{{"Ret", 100}, {"Name", "SystemInfo"}});
            return Reply{std::vector<uint8_t>(full.begin(), full.begin() + 20), false};
        });
        ProprietarySession session(transport.connect("192.168.1.62", 34567, 500ms), codec,
                                   "0x0000000A");

        REQUIRE_THROWS_AS(session.systemInfo(500ms), TimeoutError);
        REQUIRE_FALSE(session.isOpen());
        REQUIRE_FALSE(session.keepAlive(500ms));
        REQUIRE_THROWS_AS(session.systemInfo(500ms), NetworkError);
    }

    SECTION("Unserializable parameters leave the session usable") {
        transport.listen("192.168.1.50", 34567, vendorDevice(VendorScript{}));
        ProprietaryClient client(transport);
        auto session = client.login("192.168.1.50", 34567, Credential{"admin", "secret"}, 500ms);

        REQUIRE_THROWS_AS(
            session->sendExtension(EXTENSION_COMMAND_BASE + 1, {{"Name", "Jos\xE9"}}, 500ms),
            PayloadInvalidError);
        REQUIRE(session->isOpen());
        REQUIRE(session->keepAlive(500ms));
    }
}
