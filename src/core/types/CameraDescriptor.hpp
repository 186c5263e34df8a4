/**
 * @file CameraDescriptor.hpp
 * @brief Camera descriptor, protocol type and credential definitions.
 *
 * A CameraDescriptor is the roster entry for one camera: where it lives,
 * which ports answer which protocol, and how the connection manager should
 * reach it.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace camlink::core {

/**
 * @brief Protocol family a camera has been resolved to.
 */
enum class ProtocolType : int {
    Undetermined = 0, ///< Not yet resolved, connection manager tries both paths
    Standards = 1,    ///< ONVIF-style device management plus RTSP media
    Proprietary = 2,  ///< Vendor binary command protocol
    Hybrid = 3        ///< Both paths confirmed and used together
};

std::string protocolTypeToString(ProtocolType type);
ProtocolType protocolTypeFromString(const std::string& str);

/**
 * @brief Username and secret used to authenticate against a camera.
 *
 * The secret stays plaintext in memory. It is hashed only when a protocol
 * message is built and persisted only through SecureStorage.
 */
struct Credential {
    std::string username;
    std::string secret;

    [[nodiscard]] bool isEmpty() const { return username.empty() && secret.empty(); }

    bool operator==(const Credential& other) const = default;
};

/**
 * @brief Roster entry describing one IP camera.
 *
 * Invariant: fallbackPorts always contains the built-in default set.
 */
struct CameraDescriptor {
    std::string id;                          ///< Stable identifier (defaults to host)
    std::string host;                        ///< IPv4 address or hostname
    std::string name;                        ///< Display name
    std::optional<uint16_t> httpPort;        ///< Web interface port
    std::optional<uint16_t> mediaPort;       ///< RTSP media port
    std::optional<uint16_t> controlPort;     ///< ONVIF device service port
    std::optional<uint16_t> eventPort;       ///< Event subscription port
    std::optional<uint16_t> proprietaryPort; ///< Vendor binary protocol port
    ProtocolType protocolType{ProtocolType::Undetermined}; ///< Resolved protocol family
    bool autoDetect{true};                   ///< Detect protocols when undetermined
    std::vector<uint16_t> fallbackPorts;     ///< Ports tried when nothing else works
    std::string manufacturer;                ///< Vendor name if known
    std::optional<std::chrono::system_clock::time_point> lastSeen; ///< Last discovery hit

    /**
     * @brief Built-in fallback port set every descriptor carries.
     * @return {80, 8080, 554, 8554, 8000, 8899, 34567}.
     */
    static const std::vector<uint16_t>& defaultFallbackPorts();

    /**
     * @brief Creates a descriptor for a host with the default fallback ports.
     * @param host IPv4 address or hostname.
     * @return Descriptor with id and name set to the host.
     */
    static CameraDescriptor forHost(const std::string& host);

    /**
     * @brief Restores any missing default fallback ports.
     *
     * Existing custom ports are kept in their original order, missing
     * defaults are appended.
     */
    void ensureFallbackPorts();

    /**
     * @brief Validates the descriptor.
     * @return True if id and host are non-empty and every port is non-zero.
     */
    [[nodiscard]] bool isValid() const;

    /**
     * @brief Collects every known port, most specific first, without duplicates.
     * @return Control, media, proprietary, http, event ports then fallbacks.
     */
    [[nodiscard]] std::vector<uint16_t> candidatePorts() const;

    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Parses a descriptor from JSON.
     * @param j JSON object as produced by toJson().
     * @return Descriptor with default fallback ports restored.
     * @throws nlohmann::json::exception if host is missing or mistyped.
     */
    static CameraDescriptor fromJson(const nlohmann::json& j);

    bool operator==(const CameraDescriptor& other) const = default;
};

} // namespace camlink::core
