#pragma once

#include "core/protocol/BinaryProtocolCodec.hpp"
#include "core/types/CameraDescriptor.hpp"
#include "core/types/ReconnectionPolicy.hpp"
#include "infra/crypto/SecureStorage.hpp"

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace camlink::infra {

/**
 * @brief Discovery engine settings.
 */
struct DiscoveryConfig {
    int multicastTimeoutMs{3000};     ///< Listen window of each multicast adapter (phase 1).
    int priorityScanBudgetMs{15000};  ///< Target duration of phase 2.
    int fullScanBudgetMs{30000};      ///< Target duration of phase 3.
    int scanConcurrency{64};          ///< Maximum concurrent TCP connects.
    int connectTimeoutMs{500};        ///< Timeout of a single scan connect.
    int hostLimit{1024};              ///< Maximum hosts enumerated per subnet.
    int detectorTimeoutMs{2000};      ///< Timeout of a single detector check.
    int detectorParallelism{16};      ///< Concurrent detector checks.
    bool wsDiscoveryEnabled{true};
    bool ssdpEnabled{true};
    bool mdnsEnabled{true};
    bool portScanEnabled{true};
    bool fullScanEnabled{true};
    std::vector<uint16_t> extraPorts; ///< Appended to the full port catalog.
};

/**
 * @brief Application configuration settings.
 */
struct AppConfig {
    // General
    std::string logLevel{"info"};      ///< Console log level.
    bool logToFile{true};              ///< Write the rotating debug log.
    std::string preferredInterface;    ///< Interface to scan (empty for automatic).

    DiscoveryConfig discovery;

    // Cache
    int cacheTtlHours{24};       ///< Lifetime of discovery cache entries.
    bool persistCache{true};     ///< Keep the cache in the database between runs.

    // Protocol
    core::ProtocolConstants protocol;                  ///< Vendor protocol constants.
    std::vector<uint16_t> proprietaryPorts{34567};     ///< Ports tried with a login frame.

    // Connection
    int connectionPathTimeoutMs{3000};                 ///< Per-path timeout during connect.
    std::vector<uint16_t> fallbackPorts{core::CameraDescriptor::defaultFallbackPorts()};

    core::ReconnectionPolicy reconnection;

    std::vector<core::CameraDescriptor> cameras; ///< Known cameras.
};

/**
 * @brief Manages configuration persistence and stored credentials.
 *
 * Settings live in config.json. Credentials are sealed with SecureStorage
 * and kept in the "secure" section of the same file.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if missing).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     *
     * A missing file is created with defaults.
     *
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Stores a value in encrypted form.
     * @param key Key name for the value.
     * @param value Plaintext value.
     */
    void setSecureValue(const std::string& key, const std::string& value);

    /**
     * @brief Retrieves an encrypted value.
     * @param key Key name of the value.
     * @return Decrypted value if found, nullopt otherwise.
     */
    std::optional<std::string> getSecureValue(const std::string& key);

    /**
     * @brief Stores the credential of a camera.
     */
    void setCredential(const std::string& cameraId, const core::Credential& credential);

    /**
     * @brief Retrieves the stored credential of a camera.
     * @return Credential, or nullopt if none is stored or it cannot be opened.
     */
    std::optional<core::Credential> credential(const std::string& cameraId);

    /**
     * @brief Adds or replaces a known camera (matched by id).
     */
    void upsertCamera(const core::CameraDescriptor& descriptor);

    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the SQLite database.
     */
    std::filesystem::path databasePath() const;

    /**
     * @brief Returns the path to the rotating log file.
     */
    std::filesystem::path logPath() const;

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
    std::unique_ptr<SecureStorage> secureStorage_;
    nlohmann::json secureValues_ = nlohmann::json::object();
};

} // namespace camlink::infra
