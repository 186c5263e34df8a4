/**
 * @file CommandId.hpp
 * @brief Command catalog of the vendor binary protocol.
 */

#pragma once

#include <cstdint>
#include <string>

namespace camlink::core {

/**
 * @brief Known command identifiers.
 *
 * Identifiers at or above EXTENSION_COMMAND_BASE are device-specific
 * extensions and pass through the codec unchanged.
 */
enum class CommandId : uint32_t {
    Login = 1000,
    KeepAlive = 1006,
    SystemInfo = 1020,
    PtzControl = 1400,
    StartPlayback = 1420,
    ListRecordings = 1440
};

inline constexpr uint32_t EXTENSION_COMMAND_BASE = 2000;

/**
 * @brief Checks whether an identifier is a catalog command or an extension.
 */
bool isSupportedCommand(uint32_t commandId);

/**
 * @brief Returns a readable name for logging, e.g. "Login" or "Extension(2101)".
 */
std::string commandIdToString(uint32_t commandId);

} // namespace camlink::core
