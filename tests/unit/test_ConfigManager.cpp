#include <catch2/catch_test_macros.hpp>

#include "infra/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>

using namespace camlink::infra;
using namespace camlink::core;
using namespace std::chrono_literals;

namespace {

class TestConfigDir {
public:
    TestConfigDir() : configDir_(std::filesystem::temp_directory_path() / "camlink_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

} // namespace

TEST_CASE("ConfigManager paths", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "camlink_config_new_test";
        std::filesystem::remove_all(tempPath);

        ConfigManager manager(tempPath);
        REQUIRE(std::filesystem::is_directory(tempPath));

        std::filesystem::remove_all(tempPath);
    }

    SECTION("Derived paths live in the config directory") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());

        REQUIRE(manager.configPath() == testDir.path() / "config.json");
        REQUIRE(manager.databasePath() == testDir.path() / "camlink.db");
        REQUIRE(manager.logPath() == testDir.path() / "logs" / "camlink.log");
    }
}

TEST_CASE("ConfigManager defaults", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path());

    SECTION("Load without a file writes defaults") {
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));
    }

    SECTION("Default values") {
        const auto& config = manager.config();
        REQUIRE(config.logLevel == "info");
        REQUIRE(config.discovery.multicastTimeoutMs == 3000);
        REQUIRE(config.discovery.priorityScanBudgetMs == 15000);
        REQUIRE(config.discovery.fullScanBudgetMs == 30000);
        REQUIRE(config.cacheTtlHours == 24);
        REQUIRE(config.protocol.magic == 0xFF010000u);
        REQUIRE(config.protocol.successCode == 100);
        REQUIRE(config.proprietaryPorts == std::vector<uint16_t>{34567});
        REQUIRE(config.reconnection.maxAttempts == 10);
        REQUIRE(config.cameras.empty());
    }
}

TEST_CASE("ConfigManager save and load", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Values survive a round trip through the file") {
        {
            ConfigManager manager(testDir.path());
            auto& config = manager.config();
            config.logLevel = "debug";
            config.discovery.ssdpEnabled = false;
            config.discovery.extraPorts = {10554};
            config.cacheTtlHours = 6;
            config.protocol.successCode = 0;
            config.reconnection.baseDelay = 250ms;
            config.reconnection.maxAttempts = 3;

            auto camera = CameraDescriptor::forHost("192.168.1.50");
            camera.protocolType = ProtocolType::Proprietary;
            camera.proprietaryPort = 34567;
            manager.upsertCamera(camera);
            REQUIRE(manager.save());
        }

        ConfigManager reloaded(testDir.path());
        REQUIRE(reloaded.load());
        const auto& config = reloaded.config();
        REQUIRE(config.logLevel == "debug");
        REQUIRE_FALSE(config.discovery.ssdpEnabled);
        REQUIRE(config.discovery.extraPorts == std::vector<uint16_t>{10554});
        REQUIRE(config.cacheTtlHours == 6);
        REQUIRE(config.protocol.successCode == 0);
        REQUIRE(config.reconnection.baseDelay == 250ms);
        REQUIRE(config.reconnection.maxAttempts == 3);
        REQUIRE(config.cameras.size() == 1);
        REQUIRE(config.cameras[0].proprietaryPort == 34567);
    }

    SECTION("Missing sections keep their defaults") {
        {
            std::ofstream file(testDir.path() / "config.json");
            file << R"({"general": {"log_level": "warn"}})";
        }

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().logLevel == "warn");
        REQUIRE(manager.config().discovery.scanConcurrency == 64);
    }

    SECTION("Malformed files fail to load") {
        {
            std::ofstream file(testDir.path() / "config.json");
            file << "{ not json";
        }

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
    }

    SECTION("upsertCamera replaces by id") {
        ConfigManager manager(testDir.path());
        auto camera = CameraDescriptor::forHost("192.168.1.51");
        manager.upsertCamera(camera);
        camera.name = "Garage";
        manager.upsertCamera(camera);

        REQUIRE(manager.config().cameras.size() == 1);
        REQUIRE(manager.config().cameras[0].name == "Garage");
    }
}

TEST_CASE("ConfigManager credentials", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Credentials are sealed in the file and survive a reload") {
        {
            ConfigManager manager(testDir.path());
            manager.setCredential("192.168.1.50", Credential{"admin", "secret"});
        }

        std::ifstream file(testDir.path() / "config.json");
        std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        REQUIRE(text.find("secret\"") == std::string::npos);

        ConfigManager reloaded(testDir.path());
        REQUIRE(reloaded.load());
        auto credential = reloaded.credential("192.168.1.50");
        REQUIRE(credential);
        REQUIRE(credential->username == "admin");
        REQUIRE(credential->secret == "secret");
    }

    SECTION("Unknown cameras have no credential") {
        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.credential("10.0.0.1"));
    }

    SECTION("Secure values") {
        ConfigManager manager(testDir.path());
        manager.setSecureValue("token", "abc");
        REQUIRE(manager.getSecureValue("token") == "abc");
        REQUIRE_FALSE(manager.getSecureValue("missing"));
    }
}
