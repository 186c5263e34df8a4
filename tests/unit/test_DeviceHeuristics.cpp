#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/detection/DeviceHeuristics.hpp"

using namespace camlink::core;
using Catch::Matchers::WithinAbs;

TEST_CASE("DeviceHeuristics router pages", "[DeviceHeuristics]") {
    SECTION("Router title wins over everything") {
        auto a = DeviceHeuristics::assessHttpPage(
            "<html><head><title>TP-LINK Wireless Router</title></head>"
            "<body>Login</body></html>",
            "");
        REQUIRE(a.verdict == PageVerdict::Router);
        REQUIRE(a.confidence == 0.0);
        REQUIRE(a.reason.find("router title") != std::string::npos);
    }

    SECTION("Admin phrases identify gateways and printers") {
        REQUIRE(DeviceHeuristics::assessHttpPage("<h1>Port Forwarding</h1>", "").verdict ==
                PageVerdict::Router);
        REQUIRE(DeviceHeuristics::assessHttpPage("<p>Toner levels: 40%</p>", "").verdict ==
                PageVerdict::Router);
    }

    SECTION("Known admin paths") {
        auto a = DeviceHeuristics::assessHttpPage(
            "<script>location='/cgi-bin/luci'</script>", "");
        REQUIRE(a.verdict == PageVerdict::Router);
    }

    SECTION("Embedded server with admin page and no camera markers") {
        auto a = DeviceHeuristics::assessHttpPage("<html>Admin setup</html>", "lighttpd/1.4");
        REQUIRE(a.verdict == PageVerdict::Router);
    }

    SECTION("Embedded server serving a camera page is not a router") {
        auto a = DeviceHeuristics::assessHttpPage("<html>Admin setup for IPCam</html>",
                                                  "lighttpd/1.4");
        REQUIRE(a.verdict == PageVerdict::Camera);
    }
}

TEST_CASE("DeviceHeuristics camera pages", "[DeviceHeuristics]") {
    SECTION("Confidence grows with distinct markers") {
        auto one = DeviceHeuristics::assessHttpPage("<title>Webcam</title>", "");
        auto three = DeviceHeuristics::assessHttpPage(
            "<title>IPCam</title><a href='rtsp://x'>Live View</a>", "");

        REQUIRE(one.verdict == PageVerdict::Camera);
        REQUIRE_THAT(one.confidence, WithinAbs(0.45, 1e-9));
        REQUIRE(three.cameraMarkers == 3);
        REQUIRE_THAT(three.confidence, WithinAbs(0.75, 1e-9));
    }

    SECTION("Confidence is capped") {
        auto a = DeviceHeuristics::assessHttpPage(
            "camera ipcam webcam video stream onvif ptz snapshot nvr dvr", "");
        REQUIRE_THAT(a.confidence, WithinAbs(0.9, 1e-9));
    }

    SECTION("Markers are case-insensitive") {
        REQUIRE(DeviceHeuristics::countCameraMarkers("NETSURVEILLANCE WEB") >= 1);
    }
}

TEST_CASE("DeviceHeuristics other pages", "[DeviceHeuristics]") {
    SECTION("Bare login forms are not cameras") {
        auto a = DeviceHeuristics::assessHttpPage(
            "<form action=\"/auth\"><input type=\"password\" name=\"pw\"></form>", "");
        REQUIRE(a.verdict == PageVerdict::LoginOnly);
        REQUIRE_FALSE(a.reason.empty());
    }

    SECTION("Pages without markers") {
        auto a = DeviceHeuristics::assessHttpPage("<h1>It works!</h1>", "Apache");
        REQUIRE(a.verdict == PageVerdict::NonCamera);
        REQUIRE(pageVerdictToString(a.verdict) == "NonCamera");
    }
}

TEST_CASE("DeviceHeuristics manufacturer blacklist", "[DeviceHeuristics]") {
    REQUIRE(DeviceHeuristics::isBlacklistedManufacturer("NETGEAR Inc."));
    REQUIRE(DeviceHeuristics::isBlacklistedManufacturer("Brother Industries"));
    REQUIRE_FALSE(DeviceHeuristics::isBlacklistedManufacturer("Hikvision"));
    REQUIRE_FALSE(DeviceHeuristics::isBlacklistedManufacturer(""));
}
