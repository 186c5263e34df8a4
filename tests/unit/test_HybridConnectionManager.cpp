#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infra/connection/HybridConnectionManager.hpp"
#include "infra/discovery/DiscoveryCache.hpp"
#include "support/FakeTransport.hpp"

using namespace camlink::core;
using namespace camlink::infra;
using namespace camlink::testing;
using namespace std::chrono_literals;

namespace {

const Credential ADMIN{"admin", "secret"};

ConnectionOptions fastOptions() {
    ConnectionOptions options;
    options.pathTimeout = 200ms;
    return options;
}

/**
 * @brief Camera answering ONVIF on 80, RTSP on 554 and the vendor protocol on 34567.
 */
void listenHybrid(FakeTransport& transport, const std::string& host, VendorScript vendor = {}) {
    OnvifScript onvif;
    onvif.host = host;
    transport.listen(host, 80, onvifDevice(onvif));
    transport.listen(host, 554, rtspServer());
    transport.listen(host, 34567, vendorDevice(std::move(vendor)));
}

} // namespace

TEST_CASE("HybridConnectionManager explicit strategies", "[HybridConnectionManager]") {
    AsioContext context(1);
    FakeTransport transport;
    HybridConnectionManager manager(context, transport, transport, fastOptions());

    SECTION("Proprietary camera gets a session token") {
        transport.listen("192.168.1.50", 34567, vendorDevice(VendorScript{}));

        auto descriptor = CameraDescriptor::forHost("192.168.1.50");
        descriptor.protocolType = ProtocolType::Proprietary;

        auto session = manager.connect(descriptor, ADMIN);
        REQUIRE(session->isOpen());
        REQUIRE(session->hasProprietary());
        REQUIRE_FALSE(session->hasStandards());
        REQUIRE(session->sessionToken() == "0x0000000A");
        REQUIRE_FALSE(session->mediaUrl().has_value());
        REQUIRE(descriptor.proprietaryPort == 34567);
    }

    SECTION("Standards camera resolves its stream URI") {
        OnvifScript onvif;
        onvif.host = "192.168.1.51";
        transport.listen(onvif.host, 80, onvifDevice(onvif));

        auto descriptor = CameraDescriptor::forHost(onvif.host);
        descriptor.protocolType = ProtocolType::Standards;

        auto session = manager.connect(descriptor, ADMIN);
        REQUIRE(session->hasStandards());
        REQUIRE_FALSE(session->hasProprietary());
        REQUIRE(session->mediaUrl() == "rtsp://192.168.1.51:554/stream1");
        REQUIRE(descriptor.controlPort == 80);
        REQUIRE(descriptor.mediaPort == 554);
    }

    SECTION("Without GetStreamUri the first stream path that exists is used") {
        OnvifScript onvif;
        onvif.host = "192.168.1.52";
        onvif.streamUriSupported = false;
        transport.listen(onvif.host, 80, onvifDevice(onvif));
        transport.listen(onvif.host, 554, rtspServer({"/Streaming/Channels/101"}));

        auto descriptor = CameraDescriptor::forHost(onvif.host);
        descriptor.protocolType = ProtocolType::Standards;

        auto session = manager.connect(descriptor, ADMIN);
        REQUIRE(session->hasStandards());
        REQUIRE(session->mediaUrl() == "rtsp://192.168.1.52:554/Streaming/Channels/101");
    }

    SECTION("No stream path exists") {
        transport.listen("192.168.1.53", 554, rtspServer({"/private/feed"}));

        auto descriptor = CameraDescriptor::forHost("192.168.1.53");
        descriptor.protocolType = ProtocolType::Standards;

        auto session = manager.connect(descriptor, ADMIN);
        REQUIRE(session->hasStandards());
        REQUIRE(descriptor.mediaPort == 554);
        REQUIRE_FALSE(session->mediaUrl().has_value());
    }

    SECTION("Hybrid strategy needs both paths") {
        transport.listen("192.168.1.51", 554, rtspServer());

        auto descriptor = CameraDescriptor::forHost("192.168.1.51");
        descriptor.protocolType = ProtocolType::Hybrid;

        REQUIRE_THROWS_AS(manager.connect(descriptor, ADMIN), ConnectionError);
        REQUIRE(manager.activeSessions() == 0);
    }

    SECTION("Unreachable vendor port") {
        auto descriptor = CameraDescriptor::forHost("192.168.1.60");
        descriptor.protocolType = ProtocolType::Proprietary;

        REQUIRE_THROWS_AS(manager.connect(descriptor, ADMIN), ConnectionError);
    }
}

TEST_CASE("HybridConnectionManager auto fallback", "[HybridConnectionManager]") {
    AsioContext context(1);
    FakeTransport transport;
    DiscoveryCache cache(1h);
    HybridConnectionManager manager(context, transport, transport, fastOptions(), &cache);

    SECTION("Both paths answer") {
        listenHybrid(transport, "192.168.1.51");

        auto descriptor = CameraDescriptor::forHost("192.168.1.51");
        auto session = manager.connect(descriptor, ADMIN);

        REQUIRE(descriptor.protocolType == ProtocolType::Hybrid);
        REQUIRE(descriptor.controlPort == 80);
        REQUIRE(descriptor.mediaPort == 554);
        REQUIRE(descriptor.proprietaryPort == 34567);
        REQUIRE(session->hasStandards());
        REQUIRE(session->hasProprietary());
        REQUIRE(session->mediaUrl() == "rtsp://192.168.1.51:554/stream1");
        REQUIRE(session->sessionToken() == "0x0000000A");

        REQUIRE(cache.lookup("192.168.1.51", 80) == CacheLookup::FreshHit);
        REQUIRE(cache.freshEntry("192.168.1.51", 80)->kind == ProtocolKind::Standards);
        REQUIRE(cache.freshEntry("192.168.1.51", 34567)->kind == ProtocolKind::Proprietary);
    }

    SECTION("Vendor-only camera") {
        transport.listen("192.168.1.50", 34567, vendorDevice(VendorScript{}));

        auto descriptor = CameraDescriptor::forHost("192.168.1.50");
        auto session = manager.connect(descriptor, ADMIN);

        REQUIRE(descriptor.protocolType == ProtocolType::Proprietary);
        REQUIRE_FALSE(session->hasStandards());
        REQUIRE(cache.lookup("192.168.1.50", 34567) == CacheLookup::FreshHit);
    }

    SECTION("RTSP only on a fallback port") {
        transport.listen("192.168.1.70", 8554, rtspServer());

        auto descriptor = CameraDescriptor::forHost("192.168.1.70");
        auto session = manager.connect(descriptor, ADMIN);

        REQUIRE(descriptor.protocolType == ProtocolType::Standards);
        REQUIRE(descriptor.mediaPort == 8554);
        REQUIRE_FALSE(descriptor.controlPort.has_value());
        REQUIRE(session->mediaUrl() == "rtsp://192.168.1.70:8554/stream1");
        REQUIRE(cache.freshEntry("192.168.1.70", 8554)->kind == ProtocolKind::Media);
    }

    SECTION("Nothing answers") {
        auto descriptor = CameraDescriptor::forHost("192.168.1.99");

        REQUIRE_THROWS_AS(manager.connect(descriptor, ADMIN), ConnectionError);
        REQUIRE(descriptor.protocolType == ProtocolType::Undetermined);
        REQUIRE(manager.activeSessions() == 0);
    }

    SECTION("Credential rejected by every path") {
        OnvifScript onvif;
        onvif.host = "192.168.1.51";
        onvif.anonymousCapabilities = false;
        transport.listen(onvif.host, 80, onvifDevice(onvif));
        transport.listen(onvif.host, 34567, vendorDevice(VendorScript{}));

        auto descriptor = CameraDescriptor::forHost(onvif.host);
        REQUIRE_THROWS_AS(manager.connect(descriptor, Credential{"admin", "wrong"}),
                          AuthenticationError);
        REQUIRE(manager.activeSessions() == 0);
    }

    SECTION("One path rejecting the credential keeps the other") {
        OnvifScript onvif;
        onvif.host = "192.168.1.51";
        onvif.anonymousCapabilities = false;
        onvif.password = "other";
        transport.listen(onvif.host, 80, onvifDevice(onvif));
        transport.listen(onvif.host, 34567, vendorDevice(VendorScript{}));

        auto descriptor = CameraDescriptor::forHost(onvif.host);
        auto session = manager.connect(descriptor, ADMIN);

        REQUIRE(descriptor.protocolType == ProtocolType::Proprietary);
        REQUIRE(session->hasProprietary());
        REQUIRE_FALSE(session->hasStandards());
    }
}

TEST_CASE("HybridConnectionManager session table", "[HybridConnectionManager]") {
    AsioContext context(1);
    FakeTransport transport;
    HybridConnectionManager manager(context, transport, transport, fastOptions());

    VendorScript vendor;
    auto logins = vendor.logins;
    listenHybrid(transport, "192.168.1.51", vendor);

    auto descriptor = CameraDescriptor::forHost("192.168.1.51");

    SECTION("Open sessions are reused per host and user") {
        auto first = manager.connect(descriptor, ADMIN);
        auto second = manager.connect(descriptor, ADMIN);

        REQUIRE(first == second);
        REQUIRE(logins->load() == 1);
        REQUIRE(manager.activeSessions() == 1);
        REQUIRE(manager.find("192.168.1.51", "admin") != nullptr);
        REQUIRE(manager.find("192.168.1.51", "guest") == nullptr);
    }

    SECTION("A reused session fills in the caller's descriptor") {
        auto first = manager.connect(descriptor, ADMIN);
        REQUIRE(descriptor.protocolType == ProtocolType::Hybrid);

        auto fresh = CameraDescriptor::forHost("192.168.1.51");
        REQUIRE(fresh.protocolType == ProtocolType::Undetermined);
        auto second = manager.connect(fresh, ADMIN);

        REQUIRE(first == second);
        REQUIRE(logins->load() == 1);
        REQUIRE(fresh.protocolType == ProtocolType::Hybrid);
        REQUIRE(fresh.controlPort == 80);
        REQUIRE(fresh.mediaPort == 554);
        REQUIRE(fresh.proprietaryPort == 34567);
    }

    SECTION("Disconnect closes and forgets the session") {
        auto session = manager.connect(descriptor, ADMIN);
        manager.disconnect(session);

        REQUIRE_FALSE(session->isOpen());
        REQUIRE(manager.activeSessions() == 0);
        REQUIRE(manager.find("192.168.1.51", "admin") == nullptr);

        // Second disconnect is a no-op
        REQUIRE_NOTHROW(manager.disconnect(session));
        REQUIRE_NOTHROW(manager.disconnect(nullptr));
    }

    SECTION("A dead session is replaced on the next connect") {
        auto first = manager.connect(descriptor, ADMIN);
        transport.drop("192.168.1.51", 34567);
        REQUIRE_FALSE(first->isOpen());
        REQUIRE(manager.find("192.168.1.51", "admin") == nullptr);

        transport.restore("192.168.1.51", 34567);
        auto second = manager.connect(descriptor, ADMIN);
        REQUIRE(second != first);
        REQUIRE(second->isOpen());
        REQUIRE(logins->load() == 2);
    }

    SECTION("disconnectAll closes everything") {
        auto session = manager.connect(descriptor, ADMIN);
        manager.disconnectAll();

        REQUIRE_FALSE(session->isOpen());
        REQUIRE(manager.activeSessions() == 0);
    }
}

TEST_CASE("HybridConnectionManager connectAsync", "[HybridConnectionManager]") {
    AsioContext context(2);
    context.start();
    FakeTransport transport;
    HybridConnectionManager manager(context, transport, transport, fastOptions());
    listenHybrid(transport, "192.168.1.51");

    auto future = manager.connectAsync(CameraDescriptor::forHost("192.168.1.51"), ADMIN);
    REQUIRE(future.wait_for(5s) == std::future_status::ready);

    auto [session, descriptor] = future.get();
    REQUIRE(session->isOpen());
    REQUIRE(descriptor.protocolType == ProtocolType::Hybrid);

    manager.disconnectAll();
    context.stop();
}
