#include <catch2/catch_test_macros.hpp>

#include "core/types/NetworkInfo.hpp"

#include <algorithm>
#include <stdexcept>

using namespace camlink::core;

TEST_CASE("ipv4 helpers", "[NetworkInfo]") {
    SECTION("Parses dotted quads") {
        REQUIRE(ipv4::parse("192.168.1.1") == 0xC0A80101u);
        REQUIRE(ipv4::parse("0.0.0.0") == 0u);
    }

    SECTION("Rejects malformed addresses") {
        REQUIRE_FALSE(ipv4::parse("256.1.1.1"));
        REQUIRE_FALSE(ipv4::parse("1.2.3"));
        REQUIRE_FALSE(ipv4::parse("1.2.3.4.5"));
        REQUIRE_FALSE(ipv4::parse("a.b.c.d"));
        REQUIRE_FALSE(ipv4::parse(""));
    }

    SECTION("Masks and prefixes") {
        REQUIRE(ipv4::format(0xC0A80101u) == "192.168.1.1");
        REQUIRE(ipv4::prefixLengthFromMask(0xFFFFFF00u) == 24);
        REQUIRE(ipv4::maskFromPrefixLength(16) == 0xFFFF0000u);
        REQUIRE(ipv4::maskFromPrefixLength(0) == 0u);
        REQUIRE(ipv4::maskFromPrefixLength(32) == 0xFFFFFFFFu);
    }
}

TEST_CASE("NetworkInfo", "[NetworkInfo]") {
    auto info = NetworkInfo::fromAddress("192.168.1.20", "255.255.255.0");

    SECTION("Derives network and prefix") {
        REQUIRE(info.networkAddress == "192.168.1.0");
        REQUIRE(info.prefixLength == 24);
        REQUIRE(info.cidr() == "192.168.1.0/24");
    }

    SECTION("Host addresses skip network, broadcast and self") {
        auto hosts = info.hostAddresses();
        REQUIRE(hosts.size() == 253);
        REQUIRE(hosts.front() == "192.168.1.1");
        REQUIRE(hosts.back() == "192.168.1.254");
        REQUIRE(std::find(hosts.begin(), hosts.end(), "192.168.1.20") == hosts.end());
    }

    SECTION("Host addresses honour the limit") {
        REQUIRE(info.hostAddresses(10).size() == 10);
    }

    SECTION("contains checks subnet membership") {
        REQUIRE(info.contains("192.168.1.200"));
        REQUIRE_FALSE(info.contains("192.168.2.1"));
        REQUIRE_FALSE(info.contains("garbage"));
    }

    SECTION("Invalid input throws") {
        REQUIRE_THROWS_AS(NetworkInfo::fromAddress("1.2.3", "255.0.0.0"), std::invalid_argument);
    }

    SECTION("Interface usability") {
        NetworkInterface eth{"eth0", "192.168.1.20", "255.255.255.0", true, false};
        NetworkInterface lo{"lo", "127.0.0.1", "255.0.0.0", true, true};
        NetworkInterface down{"eth1", "10.0.0.1", "255.0.0.0", false, false};

        REQUIRE(eth.isUsable());
        REQUIRE_FALSE(lo.isUsable());
        REQUIRE_FALSE(down.isUsable());
    }
}
