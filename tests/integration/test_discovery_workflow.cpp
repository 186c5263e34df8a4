#include <catch2/catch_test_macros.hpp>

#include "infra/database/Database.hpp"
#include "infra/database/DiscoveryCacheRepository.hpp"
#include "infra/detection/ProtocolDetector.hpp"
#include "infra/discovery/CameraRegistry.hpp"
#include "infra/discovery/DiscoveryCache.hpp"
#include "infra/discovery/DiscoveryCoordinator.hpp"
#include "support/FakeLan.hpp"

#include <algorithm>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <set>

using namespace camlink::core;
using namespace camlink::infra;
using namespace camlink::testing;
using namespace std::chrono_literals;

namespace {

const NetworkInfo LAN = NetworkInfo::fromAddress("192.168.1.10", "255.255.255.0");

class IntegrationTestDatabase {
public:
    IntegrationTestDatabase()
        : dbPath_(std::filesystem::temp_directory_path() / "camlink_discovery_integration_test.db") {
        std::filesystem::remove(dbPath_);
        db_ = std::make_shared<Database>(dbPath_.string());
        db_->runMigrations();
    }

    ~IntegrationTestDatabase() {
        db_.reset();
        std::filesystem::remove(dbPath_);
    }

    std::shared_ptr<Database> get() { return db_; }

private:
    std::filesystem::path dbPath_;
    std::shared_ptr<Database> db_;
};

CoordinatorOptions workflowOptions() {
    CoordinatorOptions options;
    options.multicastTimeout = 50ms;
    options.priorityScanBudget = 200ms;
    options.fullScanBudget = 200ms;
    options.detectorParallelism = 8;
    options.loginCredential = Credential{"admin", "secret"};
    return options;
}

DetectorOptions detectorOptions() {
    DetectorOptions options;
    options.timeout = 200ms;
    return options;
}

void populate(FakeLan& lan) {
    lan.addProprietaryCamera("192.168.1.50");
    lan.addHybridCamera("192.168.1.51");
    lan.addRouter("192.168.1.1");
    lan.announce("192.168.1.51", 80, DiscoveryMethod::MulticastA);
}

} // namespace

// =============================================================================
// Discovery Workflow Integration Tests
// =============================================================================

TEST_CASE("Discovery workflow - repeated sessions reuse the cache",
          "[Integration][Discovery][Cache]") {
    FakeLan lan;
    populate(lan);

    DiscoveryCache cache(std::chrono::hours(1));
    CameraRegistry registry;
    ProtocolDetector detector(lan.transport, lan.transport, detectorOptions());
    DiscoveryCoordinator coordinator(lan.adapters(), detector, cache, registry, workflowOptions());

    auto first = coordinator.discover(LAN);
    REQUIRE(first.status == DiscoveryStatus::Completed);
    REQUIRE(first.devicesFound == 2);
    REQUIRE(first.checksIssued > 0);

    int connectsAfterFirst = lan.transport.totalConnects();
    REQUIRE(connectsAfterFirst > 0);

    SECTION("Second session issues no checks") {
        auto second = coordinator.discover(LAN);

        REQUIRE(second.status == DiscoveryStatus::Completed);
        REQUIRE(second.checksIssued == 0);
        REQUIRE(lan.transport.totalConnects() == connectsAfterFirst);
        REQUIRE(registry.size() == 2);
        REQUIRE(second.id != first.id);
    }

    SECTION("Confirmed hosts are left out of the port scans") {
        int vendorConnects = lan.transport.connects("192.168.1.50", DEFAULT_PROPRIETARY_PORT);
        int webConnects = lan.transport.connects("192.168.1.51", 80);

        coordinator.discover(LAN);
        REQUIRE(lan.transport.connects("192.168.1.50", DEFAULT_PROPRIETARY_PORT) ==
                vendorConnects);
        REQUIRE(lan.transport.connects("192.168.1.51", 80) == webConnects);
        REQUIRE(cache.confirmedHosts() ==
                std::set<std::string>{"192.168.1.50", "192.168.1.51"});
    }

    SECTION("A new camera is picked up without re-probing the known ones") {
        lan.addProprietaryCamera("192.168.1.52");
        int knownBefore = lan.transport.connects("192.168.1.50", DEFAULT_PROPRIETARY_PORT);

        auto third = coordinator.discover(LAN);

        REQUIRE(registry.contains("192.168.1.52"));
        REQUIRE(third.checksIssued == 1);
        REQUIRE(lan.transport.connects("192.168.1.50", DEFAULT_PROPRIETARY_PORT) == knownBefore);
    }

    SECTION("Expired entries are classified again") {
        cache.clear();
        auto again = coordinator.discover(LAN);

        // Roster hosts stay excluded from scans, only multicast responders are classified again
        REQUIRE(again.checksIssued > 0);
        REQUIRE(lan.transport.totalConnects() > connectsAfterFirst);
    }
}

TEST_CASE("Discovery workflow - persistence across restarts",
          "[Integration][Discovery][Persistence]") {
    IntegrationTestDatabase testDb;
    auto db = testDb.get();
    DiscoveryCacheRepository repository(db);

    FakeLan lan;
    populate(lan);

    std::string firstId;
    {
        DiscoveryCache cache(std::chrono::hours(1));
        CameraRegistry registry;
        ProtocolDetector detector(lan.transport, lan.transport, detectorOptions());
        DiscoveryCoordinator coordinator(lan.adapters(), detector, cache, registry,
                                         workflowOptions(), &repository);
        firstId = coordinator.discover(LAN).id;
    }

    SECTION("Sessions are recorded") {
        auto sessions = repository.recentSessions();
        REQUIRE(sessions.size() == 1);
        REQUIRE(sessions[0].id == firstId);
        REQUIRE(sessions[0].status == DiscoveryStatus::Completed);
        REQUIRE(sessions[0].subnet == "192.168.1.0/24");
        REQUIRE(sessions[0].devicesFound == 2);
    }

    SECTION("Restored cache avoids probing after a restart") {
        auto stored = repository.loadAll();
        REQUIRE_FALSE(stored.empty());

        DiscoveryCache cache(std::chrono::hours(1));
        cache.restore(stored);
        REQUIRE(cache.lookup("192.168.1.1", 80) == CacheLookup::FreshMiss);
        REQUIRE(cache.lookup("192.168.1.50", DEFAULT_PROPRIETARY_PORT) == CacheLookup::FreshHit);

        CameraRegistry registry;
        ProtocolDetector detector(lan.transport, lan.transport, detectorOptions());
        DiscoveryCoordinator coordinator(lan.adapters(), detector, cache, registry,
                                         workflowOptions(), &repository);

        int connectsBefore = lan.transport.totalConnects();
        auto session = coordinator.discover(LAN);

        REQUIRE(session.checksIssued == 0);
        REQUIRE(lan.transport.totalConnects() == connectsBefore);
        REQUIRE_FALSE(registry.contains("192.168.1.1"));
        // Multicast responders come back from the cache, scanned hosts stay excluded
        REQUIRE(registry.contains("192.168.1.51"));
        REQUIRE(repository.recentSessions().size() == 2);
    }
}

TEST_CASE("Discovery workflow - asynchronous session", "[Integration][Discovery][Async]") {
    FakeLan lan;
    populate(lan);

    DiscoveryCache cache(std::chrono::hours(1));
    CameraRegistry registry;
    ProtocolDetector detector(lan.transport, lan.transport, detectorOptions());
    DiscoveryCoordinator coordinator(lan.adapters(), detector, cache, registry, workflowOptions());

    std::vector<DiscoveryProgress> progress;
    std::mutex progressMutex;
    coordinator.setProgressCallback([&](const DiscoveryProgress& p) {
        std::lock_guard lock(progressMutex);
        progress.push_back(p);
    });

    std::vector<std::string> roster;
    registry.setRosterCallback([&](const CameraDescriptor& d) {
        std::lock_guard lock(progressMutex);
        roster.push_back(d.host);
    });

    auto future = coordinator.discoverAsync(LAN);
    REQUIRE(future.wait_for(10s) == std::future_status::ready);
    auto session = future.get();

    REQUIRE(session.status == DiscoveryStatus::Completed);
    std::lock_guard lock(progressMutex);
    REQUIRE(progress.back().percentComplete == 100.0);
    REQUIRE(progress.back().devicesFound == 2);
    REQUIRE(std::find(roster.begin(), roster.end(), "192.168.1.1") == roster.end());
    REQUIRE(std::find(roster.begin(), roster.end(), "192.168.1.50") != roster.end());
}
