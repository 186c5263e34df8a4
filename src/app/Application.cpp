#include "app/Application.hpp"

#include "core/types/CameraPorts.hpp"
#include "core/types/Errors.hpp"
#include "infra/discovery/MdnsAdapter.hpp"
#include "infra/discovery/PortScanner.hpp"
#include "infra/discovery/SsdpAdapter.hpp"
#include "infra/discovery/WsDiscoveryAdapter.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <future>

namespace camlink::app {

namespace {

constexpr const char* VERSION = "1.0.0";
constexpr size_t WORKER_THREADS = 4;

} // namespace

Application::Application(std::vector<std::string> args, std::filesystem::path configDir)
    : args_(std::move(args)),
      configDir_(configDir.empty() ? defaultConfigDir() : std::move(configDir)) {
    std::filesystem::create_directories(configDir_);

    config_ = std::make_unique<infra::ConfigManager>(configDir_);
    config_->load();

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (coordinator_) {
        coordinator_->cancel();
    }
    if (reconnector_) {
        reconnector_->stopAll();
    }
    if (connectionManager_) {
        connectionManager_->disconnectAll();
    }
    if (asioContext_) {
        asioContext_->stop();
    }

    if (cacheRepository_ && cache_) {
        try {
            cacheRepository_->saveAll(cache_->entries());
        } catch (const std::exception& e) {
            spdlog::warn("Failed to save discovery cache: {}", e.what());
        }
    }
}

std::filesystem::path Application::defaultConfigDir() {
    if (const char* dir = std::getenv("CAMLINK_CONFIG_DIR"); dir && *dir) {
        return dir;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "camlink";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "camlink";
    }
    return std::filesystem::current_path() / ".camlink";
}

void Application::initializeLogging() {
    const auto& cfg = config_->config();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::from_str(cfg.logLevel));

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    if (cfg.logToFile) {
        auto logPath = config_->logPath();
        std::filesystem::create_directories(logPath.parent_path());
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("camlink", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("CamLink {} starting...", VERSION);
    if (cfg.logToFile) {
        spdlog::info("Log file: {}", config_->logPath().string());
    }
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Asio context
    asioContext_ = std::make_unique<infra::AsioContext>(WORKER_THREADS);
    asioContext_->start();

    transport_ = std::make_unique<infra::TcpTransport>();
    http_ = std::make_unique<infra::HttpClient>();

    // Discovery cache, warm from the database
    cache_ = std::make_unique<infra::DiscoveryCache>(std::chrono::hours(cfg.cacheTtlHours));
    if (cfg.persistCache) {
        database_ = std::make_shared<infra::Database>(config_->databasePath().string());
        database_->runMigrations();
        cacheRepository_ = std::make_unique<infra::DiscoveryCacheRepository>(database_);
        restoreCache();
    }

    registry_ = std::make_unique<infra::CameraRegistry>();
    registry_->setRosterCallback([](const core::CameraDescriptor& descriptor) {
        spdlog::info("Roster: {} {} ({})", descriptor.host,
                     core::protocolTypeToString(descriptor.protocolType), descriptor.name);
    });

    // Detection and discovery
    infra::DetectorOptions detectorOptions;
    detectorOptions.timeout = std::chrono::milliseconds(cfg.discovery.detectorTimeoutMs);
    detectorOptions.proprietaryPorts = cfg.proprietaryPorts;
    detectorOptions.constants = cfg.protocol;
    detector_ = std::make_unique<infra::ProtocolDetector>(*transport_, *http_, detectorOptions);

    infra::CoordinatorOptions coordinatorOptions;
    coordinatorOptions.multicastTimeout =
        std::chrono::milliseconds(cfg.discovery.multicastTimeoutMs);
    coordinatorOptions.priorityScanBudget =
        std::chrono::milliseconds(cfg.discovery.priorityScanBudgetMs);
    coordinatorOptions.fullScanBudget = std::chrono::milliseconds(cfg.discovery.fullScanBudgetMs);
    coordinatorOptions.fullCatalog = core::CameraPorts::fullCatalog(cfg.discovery.extraPorts);
    coordinatorOptions.detectorParallelism = cfg.discovery.detectorParallelism;
    coordinatorOptions.portScanEnabled = cfg.discovery.portScanEnabled;
    coordinatorOptions.fullScanEnabled = cfg.discovery.fullScanEnabled;
    coordinator_ = std::make_unique<infra::DiscoveryCoordinator>(
        makeAdapterFactory(), *detector_, *cache_, *registry_, coordinatorOptions,
        cacheRepository_.get());
    coordinator_->setProgressCallback([](const core::DiscoveryProgress& progress) {
        spdlog::debug("Discovery {} {:.0f}%: {} cameras",
                      core::discoveryPhaseToString(progress.phase), progress.percentComplete,
                      progress.devicesFound);
    });

    // Connections
    infra::ConnectionOptions connectionOptions;
    connectionOptions.pathTimeout = std::chrono::milliseconds(cfg.connectionPathTimeoutMs);
    connectionOptions.constants = cfg.protocol;
    connectionManager_ = std::make_unique<infra::HybridConnectionManager>(
        *asioContext_, *transport_, *http_, connectionOptions, cache_.get());

    reconnector_ = std::make_unique<infra::AutoReconnector>(*asioContext_, *connectionManager_,
                                                            cfg.reconnection);
    reconnector_->setStateCallback([](const std::string& cameraId, core::ConnectionState state) {
        fmt::print("{}: {}\n", cameraId, core::connectionStateToString(state));
    });

    spdlog::info("Application components initialized");
}

void Application::restoreCache() {
    try {
        auto cutoff = std::chrono::system_clock::now() - cache_->ttl();
        auto removed = cacheRepository_->removeOlderThan(cutoff);
        cache_->restore(cacheRepository_->loadAll());
        spdlog::info("Restored {} discovery cache entries ({} expired removed)", cache_->size(),
                     removed);
    } catch (const std::exception& e) {
        spdlog::warn("Starting with an empty discovery cache: {}", e.what());
    }
}

infra::AdapterFactory Application::makeAdapterFactory() {
    const auto discovery = config_->config().discovery;
    infra::AdapterFactory factory;

    factory.multicast = [discovery] {
        std::vector<std::unique_ptr<core::IDiscoveryAdapter>> adapters;
        if (discovery.wsDiscoveryEnabled) {
            adapters.push_back(std::make_unique<infra::WsDiscoveryAdapter>());
        }
        if (discovery.ssdpEnabled) {
            adapters.push_back(std::make_unique<infra::SsdpAdapter>());
        }
        if (discovery.mdnsEnabled) {
            adapters.push_back(std::make_unique<infra::MdnsAdapter>());
        }
        return adapters;
    };

    factory.portScan = [this, discovery](const std::vector<uint16_t>& ports,
                                         const std::set<std::string>& excluded)
        -> std::unique_ptr<core::IDiscoveryAdapter> {
        auto scanner = std::make_unique<infra::PortScanner>(
            *asioContext_, ports, std::chrono::milliseconds(discovery.connectTimeoutMs),
            discovery.scanConcurrency, static_cast<size_t>(discovery.hostLimit));
        scanner->setExcludedHosts(excluded);
        return scanner;
    };

    return factory;
}

void Application::printUsage() {
    fmt::print("Usage: camlink <command>\n\n"
               "Commands:\n"
               "  discover                       Discover cameras on the local subnet\n"
               "  connect <host> <user> <secret> Connect to a camera and keep it connected\n"
               "  run                            Discover, then supervise all known cameras\n");
}

void Application::rememberCamera(const core::CameraDescriptor& descriptor) {
    config_->upsertCamera(descriptor);
    if (!config_->save()) {
        spdlog::warn("Could not save camera {} to {}", descriptor.id,
                     config_->configPath().string());
    }
}

int Application::runDiscover() {
    core::NetworkInfo network;
    try {
        infra::NetworkAnalyzer analyzer(config_->config().preferredInterface);
        network = analyzer.analyze();
    } catch (const core::NoActiveInterfaceError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    auto session = coordinator_->discoverAsync(network).get();

    auto roster = registry_->roster();
    fmt::print("Session {} {} in {}ms, {} checks\n", session.id,
               core::discoveryStatusToString(session.status), session.duration().count(),
               session.checksIssued);
    for (const auto& descriptor : roster) {
        fmt::print("  {:<16} {:<12} control {} media {} vendor {} web {}\n", descriptor.host,
                   core::protocolTypeToString(descriptor.protocolType),
                   descriptor.controlPort.value_or(0), descriptor.mediaPort.value_or(0),
                   descriptor.proprietaryPort.value_or(0), descriptor.httpPort.value_or(0));
        rememberCamera(descriptor);
    }
    if (roster.empty()) {
        fmt::print("  no cameras found\n");
    }
    return 0;
}

int Application::runConnect(const std::string& host, const std::string& username,
                            const std::string& secret) {
    auto descriptor = core::CameraDescriptor::forHost(host);
    for (const auto& known : config_->config().cameras) {
        if (known.host == host) {
            descriptor = known;
            break;
        }
    }
    if (auto discovered = registry_->find(host)) {
        descriptor = *discovered;
    }

    core::Credential credential{username, secret};
    std::shared_ptr<core::ICameraSession> session;
    try {
        session = connectionManager_->connect(descriptor, credential);
    } catch (const core::AuthenticationError& e) {
        fmt::print("Authentication failed: {}\n", e.what());
        return 1;
    } catch (const core::ConnectionError& e) {
        fmt::print("Connection failed: {}\n", e.what());
        return 1;
    }

    fmt::print("Connected to {} ({})\n", host, core::protocolTypeToString(descriptor.protocolType));
    if (auto url = session->mediaUrl()) {
        fmt::print("  media: {}\n", *url);
    }
    if (auto token = session->sessionToken()) {
        fmt::print("  vendor session: {}\n", *token);
    }

    config_->setCredential(descriptor.id, credential);
    rememberCamera(descriptor);

    reconnector_->supervise(descriptor.id, descriptor, credential, session);
    waitForShutdown();
    reconnector_->disconnect(descriptor.id);
    return 0;
}

int Application::runSupervised() {
    if (runDiscover() != 0) {
        spdlog::warn("Discovery failed, supervising configured cameras only");
    }

    int supervised = 0;
    for (const auto& descriptor : config_->config().cameras) {
        auto credential = config_->credential(descriptor.id);
        if (!credential) {
            spdlog::info("No stored credential for {}, skipping", descriptor.id);
            continue;
        }
        reconnector_->supervise(descriptor.id, descriptor, *credential, nullptr);
        ++supervised;
    }

    if (supervised == 0) {
        fmt::print("No cameras with stored credentials, use 'camlink connect' first\n");
        return 1;
    }

    fmt::print("Supervising {} cameras, press Ctrl+C to stop\n", supervised);
    waitForShutdown();
    reconnector_->stopAll();
    return 0;
}

void Application::waitForShutdown() {
    auto stopped = std::make_shared<std::promise<int>>();
    auto future = stopped->get_future();

    asio::signal_set signals(asioContext_->getContext(), SIGINT, SIGTERM);
    signals.async_wait([stopped](const asio::error_code& ec, int signal) {
        if (!ec) {
            stopped->set_value(signal);
        }
    });

    int signal = future.get();
    spdlog::info("Received signal {}", signal);
}

int Application::run() {
    if (args_.empty()) {
        printUsage();
        return 1;
    }

    const auto& command = args_.front();
    if (command == "discover") {
        return runDiscover();
    }
    if (command == "connect") {
        if (args_.size() != 4) {
            printUsage();
            return 1;
        }
        return runConnect(args_[1], args_[2], args_[3]);
    }
    if (command == "run") {
        return runSupervised();
    }

    fmt::print("Unknown command '{}'\n", command);
    printUsage();
    return 1;
}

} // namespace camlink::app
