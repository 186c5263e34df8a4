#include "infra/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace camlink::infra {

namespace {

const std::string CREDENTIAL_PREFIX = "credential.";

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
    secureStorage_ = std::make_unique<SecureStorage>(configDir_ / ".key");
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, writing defaults to {}", configPath_.string());
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {} ({} cameras)", configPath_.string(),
                     config_.cameras.size());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    j["general"]["log_level"] = config_.logLevel;
    j["general"]["log_to_file"] = config_.logToFile;
    j["general"]["preferred_interface"] = config_.preferredInterface;

    const auto& d = config_.discovery;
    j["discovery"]["multicast_timeout_ms"] = d.multicastTimeoutMs;
    j["discovery"]["priority_scan_budget_ms"] = d.priorityScanBudgetMs;
    j["discovery"]["full_scan_budget_ms"] = d.fullScanBudgetMs;
    j["discovery"]["scan_concurrency"] = d.scanConcurrency;
    j["discovery"]["connect_timeout_ms"] = d.connectTimeoutMs;
    j["discovery"]["host_limit"] = d.hostLimit;
    j["discovery"]["detector_timeout_ms"] = d.detectorTimeoutMs;
    j["discovery"]["detector_parallelism"] = d.detectorParallelism;
    j["discovery"]["ws_discovery_enabled"] = d.wsDiscoveryEnabled;
    j["discovery"]["ssdp_enabled"] = d.ssdpEnabled;
    j["discovery"]["mdns_enabled"] = d.mdnsEnabled;
    j["discovery"]["port_scan_enabled"] = d.portScanEnabled;
    j["discovery"]["full_scan_enabled"] = d.fullScanEnabled;
    j["discovery"]["extra_ports"] = d.extraPorts;

    j["cache"]["ttl_hours"] = config_.cacheTtlHours;
    j["cache"]["persist"] = config_.persistCache;

    j["protocol"]["magic"] = config_.protocol.magic;
    j["protocol"]["success_code"] = config_.protocol.successCode;
    j["protocol"]["login_type"] = config_.protocol.loginType;
    j["protocol"]["max_payload_size"] = config_.protocol.maxPayloadSize;
    j["protocol"]["ports"] = config_.proprietaryPorts;

    j["connection"]["path_timeout_ms"] = config_.connectionPathTimeoutMs;
    j["connection"]["fallback_ports"] = config_.fallbackPorts;

    const auto& r = config_.reconnection;
    j["reconnection"]["enabled"] = r.enabled;
    j["reconnection"]["base_delay_ms"] = r.baseDelay.count();
    j["reconnection"]["max_delay_ms"] = r.maxDelay.count();
    j["reconnection"]["max_attempts"] = r.maxAttempts;
    j["reconnection"]["multiplier"] = r.multiplier;
    j["reconnection"]["health_check_interval_ms"] = r.healthCheckInterval.count();

    j["cameras"] = nlohmann::json::array();
    for (const auto& camera : config_.cameras) {
        j["cameras"].push_back(camera.toJson());
    }

    if (!secureValues_.empty()) {
        j["secure"] = secureValues_;
    }

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    if (j.contains("general")) {
        const auto& g = j["general"];
        config_.logLevel = g.value("log_level", "info");
        config_.logToFile = g.value("log_to_file", true);
        config_.preferredInterface = g.value("preferred_interface", "");
    }

    if (j.contains("discovery")) {
        const auto& d = j["discovery"];
        auto& out = config_.discovery;
        out.multicastTimeoutMs = d.value("multicast_timeout_ms", 3000);
        out.priorityScanBudgetMs = d.value("priority_scan_budget_ms", 15000);
        out.fullScanBudgetMs = d.value("full_scan_budget_ms", 30000);
        out.scanConcurrency = d.value("scan_concurrency", 64);
        out.connectTimeoutMs = d.value("connect_timeout_ms", 500);
        out.hostLimit = d.value("host_limit", 1024);
        out.detectorTimeoutMs = d.value("detector_timeout_ms", 2000);
        out.detectorParallelism = d.value("detector_parallelism", 16);
        out.wsDiscoveryEnabled = d.value("ws_discovery_enabled", true);
        out.ssdpEnabled = d.value("ssdp_enabled", true);
        out.mdnsEnabled = d.value("mdns_enabled", true);
        out.portScanEnabled = d.value("port_scan_enabled", true);
        out.fullScanEnabled = d.value("full_scan_enabled", true);
        out.extraPorts = d.value("extra_ports", std::vector<uint16_t>{});
    }

    if (j.contains("cache")) {
        const auto& c = j["cache"];
        config_.cacheTtlHours = c.value("ttl_hours", 24);
        config_.persistCache = c.value("persist", true);
    }

    if (j.contains("protocol")) {
        const auto& p = j["protocol"];
        core::ProtocolConstants defaults;
        config_.protocol.magic = p.value("magic", defaults.magic);
        config_.protocol.successCode = p.value("success_code", defaults.successCode);
        config_.protocol.loginType = p.value("login_type", defaults.loginType);
        config_.protocol.maxPayloadSize = p.value("max_payload_size", defaults.maxPayloadSize);
        config_.proprietaryPorts = p.value("ports", std::vector<uint16_t>{34567});
    }

    if (j.contains("connection")) {
        const auto& c = j["connection"];
        config_.connectionPathTimeoutMs = c.value("path_timeout_ms", 3000);
        config_.fallbackPorts =
            c.value("fallback_ports", core::CameraDescriptor::defaultFallbackPorts());
    }

    if (j.contains("reconnection")) {
        const auto& r = j["reconnection"];
        core::ReconnectionPolicy defaults;
        auto& out = config_.reconnection;
        out.enabled = r.value("enabled", true);
        out.baseDelay = std::chrono::milliseconds(
            r.value("base_delay_ms", static_cast<int64_t>(defaults.baseDelay.count())));
        out.maxDelay = std::chrono::milliseconds(
            r.value("max_delay_ms", static_cast<int64_t>(defaults.maxDelay.count())));
        out.maxAttempts = r.value("max_attempts", defaults.maxAttempts);
        out.multiplier = r.value("multiplier", defaults.multiplier);
        out.healthCheckInterval = std::chrono::milliseconds(r.value(
            "health_check_interval_ms", static_cast<int64_t>(defaults.healthCheckInterval.count())));
    }

    if (j.contains("cameras") && j["cameras"].is_array()) {
        config_.cameras.clear();
        for (const auto& entry : j["cameras"]) {
            try {
                config_.cameras.push_back(core::CameraDescriptor::fromJson(entry));
            } catch (const nlohmann::json::exception& e) {
                spdlog::warn("Skipping malformed camera entry: {}", e.what());
            }
        }
    }

    if (j.contains("secure")) {
        secureValues_ = j["secure"];
    }
}

void ConfigManager::setSecureValue(const std::string& key, const std::string& value) {
    auto encrypted = secureStorage_->encrypt(value);
    if (!encrypted.empty()) {
        secureValues_[key] = encrypted;
        save();
    }
}

std::optional<std::string> ConfigManager::getSecureValue(const std::string& key) {
    if (!secureValues_.contains(key)) {
        return std::nullopt;
    }
    return secureStorage_->decrypt(secureValues_[key].get<std::string>());
}

void ConfigManager::setCredential(const std::string& cameraId,
                                  const core::Credential& credential) {
    auto sealed = secureStorage_->sealCredential(credential);
    if (sealed.empty()) {
        spdlog::error("Credential for {} could not be sealed and was not stored", cameraId);
        return;
    }
    secureValues_[CREDENTIAL_PREFIX + cameraId] = sealed;
    save();
}

std::optional<core::Credential> ConfigManager::credential(const std::string& cameraId) {
    auto key = CREDENTIAL_PREFIX + cameraId;
    if (!secureValues_.contains(key)) {
        return std::nullopt;
    }
    return secureStorage_->openCredential(secureValues_[key].get<std::string>());
}

void ConfigManager::upsertCamera(const core::CameraDescriptor& descriptor) {
    auto it = std::find_if(config_.cameras.begin(), config_.cameras.end(),
                           [&](const auto& camera) { return camera.id == descriptor.id; });
    if (it != config_.cameras.end()) {
        *it = descriptor;
    } else {
        config_.cameras.push_back(descriptor);
    }
}

std::filesystem::path ConfigManager::databasePath() const {
    return configDir_ / "camlink.db";
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "logs" / "camlink.log";
}

} // namespace camlink::infra
