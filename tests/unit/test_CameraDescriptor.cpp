#include <catch2/catch_test_macros.hpp>

#include "core/types/CameraDescriptor.hpp"
#include "core/types/ProtocolStrategy.hpp"

#include <algorithm>

using namespace camlink::core;

TEST_CASE("CameraDescriptor construction", "[CameraDescriptor]") {
    SECTION("forHost fills identity and fallback ports") {
        auto descriptor = CameraDescriptor::forHost("192.168.1.50");

        REQUIRE(descriptor.id == "192.168.1.50");
        REQUIRE(descriptor.name == "192.168.1.50");
        REQUIRE(descriptor.protocolType == ProtocolType::Undetermined);
        REQUIRE(descriptor.autoDetect);
        REQUIRE(descriptor.fallbackPorts == CameraDescriptor::defaultFallbackPorts());
        REQUIRE(descriptor.isValid());
    }

    SECTION("ensureFallbackPorts keeps custom ports first and adds no duplicates") {
        CameraDescriptor descriptor;
        descriptor.fallbackPorts = {9000, 554};
        descriptor.ensureFallbackPorts();

        REQUIRE(descriptor.fallbackPorts.front() == 9000);
        REQUIRE(std::count(descriptor.fallbackPorts.begin(), descriptor.fallbackPorts.end(),
                           554) == 1);
        REQUIRE(descriptor.fallbackPorts.size() ==
                CameraDescriptor::defaultFallbackPorts().size() + 1);
    }

    SECTION("Port zero or missing host is invalid") {
        auto descriptor = CameraDescriptor::forHost("10.0.0.2");
        descriptor.mediaPort = 0;
        REQUIRE_FALSE(descriptor.isValid());

        REQUIRE_FALSE(CameraDescriptor{}.isValid());
    }

    SECTION("candidatePorts lists explicit ports before fallbacks") {
        auto descriptor = CameraDescriptor::forHost("10.0.0.2");
        descriptor.controlPort = 8899;
        descriptor.proprietaryPort = 34567;

        auto ports = descriptor.candidatePorts();
        REQUIRE(ports[0] == 8899);
        REQUIRE(ports[1] == 34567);
        REQUIRE(std::count(ports.begin(), ports.end(), 34567) == 1);
    }
}

TEST_CASE("CameraDescriptor JSON", "[CameraDescriptor]") {
    auto descriptor = CameraDescriptor::forHost("192.168.1.51");
    descriptor.name = "Garage";
    descriptor.controlPort = 80;
    descriptor.mediaPort = 554;
    descriptor.protocolType = ProtocolType::Hybrid;
    descriptor.manufacturer = "Acme";

    SECTION("Keeps every field") {
        auto restored = CameraDescriptor::fromJson(descriptor.toJson());
        REQUIRE(restored == descriptor);
    }

    SECTION("Absent ports serialize as null") {
        auto j = descriptor.toJson();
        REQUIRE(j["proprietary_port"].is_null());
        REQUIRE(j["protocol_type"] == "Hybrid");
    }

    SECTION("Minimal objects get defaults") {
        auto restored = CameraDescriptor::fromJson({{"host", "10.1.1.1"}});
        REQUIRE(restored.id == "10.1.1.1");
        REQUIRE(restored.protocolType == ProtocolType::Undetermined);
        REQUIRE_FALSE(restored.fallbackPorts.empty());
    }

    SECTION("Unknown protocol names fall back to Undetermined") {
        REQUIRE(protocolTypeFromString("Telnet") == ProtocolType::Undetermined);
    }
}

TEST_CASE("selectStrategy", "[CameraDescriptor][ProtocolStrategy]") {
    auto descriptor = CameraDescriptor::forHost("192.168.1.60");

    SECTION("Standards uses descriptor ports or defaults") {
        descriptor.protocolType = ProtocolType::Standards;
        descriptor.controlPort = 8080;

        auto strategy = selectStrategy(descriptor);
        REQUIRE(std::holds_alternative<StandardsStrategy>(strategy));
        REQUIRE(std::get<StandardsStrategy>(strategy).controlPort == 8080);
        REQUIRE(std::get<StandardsStrategy>(strategy).mediaPort == DEFAULT_MEDIA_PORT);
    }

    SECTION("Proprietary defaults to the vendor port") {
        descriptor.protocolType = ProtocolType::Proprietary;
        auto strategy = selectStrategy(descriptor);
        REQUIRE(std::get<ProprietaryStrategy>(strategy).port == DEFAULT_PROPRIETARY_PORT);
        REQUIRE(strategyName(strategy) == "proprietary");
    }

    SECTION("Hybrid carries both paths") {
        descriptor.protocolType = ProtocolType::Hybrid;
        descriptor.proprietaryPort = 34568;
        auto strategy = selectStrategy(descriptor);
        REQUIRE(std::get<HybridStrategy>(strategy).proprietary.port == 34568);
    }

    SECTION("Undetermined with auto-detect falls back across ports") {
        auto strategy = selectStrategy(descriptor);
        REQUIRE(strategyName(strategy) == "auto-fallback");
        REQUIRE(std::get<AutoFallbackStrategy>(strategy).fallbackPorts ==
                CameraDescriptor::defaultFallbackPorts());
    }

    SECTION("Undetermined without auto-detect is standards only") {
        descriptor.autoDetect = false;
        REQUIRE(std::holds_alternative<StandardsStrategy>(selectStrategy(descriptor)));
    }
}
