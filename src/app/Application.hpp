#pragma once

#include "infra/config/ConfigManager.hpp"
#include "infra/connection/AutoReconnector.hpp"
#include "infra/connection/HybridConnectionManager.hpp"
#include "infra/database/Database.hpp"
#include "infra/database/DiscoveryCacheRepository.hpp"
#include "infra/detection/ProtocolDetector.hpp"
#include "infra/discovery/CameraRegistry.hpp"
#include "infra/discovery/DiscoveryCache.hpp"
#include "infra/discovery/DiscoveryCoordinator.hpp"
#include "infra/network/AsioContext.hpp"
#include "infra/network/HttpClient.hpp"
#include "infra/network/NetworkAnalyzer.hpp"
#include "infra/network/TcpTransport.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace camlink::app {

/**
 * @brief Command-line front end wiring discovery, connection and reconnection.
 *
 * Commands:
 *  - discover: run one discovery session and print the roster
 *  - connect <host> <user> <secret>: connect, store the credential, supervise until signalled
 *  - run: discover, then supervise every camera with a stored credential
 */
class Application {
public:
    /**
     * @brief Constructs the application.
     * @param args Command-line arguments without the program name.
     * @param configDir Configuration directory (empty for the default location).
     */
    explicit Application(std::vector<std::string> args, std::filesystem::path configDir = {});
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Executes the command.
     * @return Process exit code.
     */
    int run();

    infra::ConfigManager& config() { return *config_; }
    infra::AsioContext& asioContext() { return *asioContext_; }
    infra::CameraRegistry& registry() { return *registry_; }
    infra::DiscoveryCoordinator& coordinator() { return *coordinator_; }
    infra::HybridConnectionManager& connectionManager() { return *connectionManager_; }
    infra::AutoReconnector& reconnector() { return *reconnector_; }

    /**
     * @brief Default configuration directory ($CAMLINK_CONFIG_DIR, then XDG, then ~/.config).
     */
    static std::filesystem::path defaultConfigDir();

    static void printUsage();

private:
    void initializeLogging();
    void initializeComponents();
    void restoreCache();
    infra::AdapterFactory makeAdapterFactory();

    int runDiscover();
    int runConnect(const std::string& host, const std::string& username,
                   const std::string& secret);
    int runSupervised();

    /**
     * @brief Blocks until SIGINT or SIGTERM arrives.
     */
    void waitForShutdown();

    void rememberCamera(const core::CameraDescriptor& descriptor);

    std::vector<std::string> args_;
    std::filesystem::path configDir_;

    std::unique_ptr<infra::ConfigManager> config_;
    std::shared_ptr<infra::Database> database_;
    std::unique_ptr<infra::DiscoveryCacheRepository> cacheRepository_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<infra::TcpTransport> transport_;
    std::unique_ptr<infra::HttpClient> http_;
    std::unique_ptr<infra::DiscoveryCache> cache_;
    std::unique_ptr<infra::CameraRegistry> registry_;
    std::unique_ptr<infra::ProtocolDetector> detector_;
    std::unique_ptr<infra::DiscoveryCoordinator> coordinator_;
    std::unique_ptr<infra::HybridConnectionManager> connectionManager_;
    std::unique_ptr<infra::AutoReconnector> reconnector_;
};

} // namespace camlink::app
