/**
 * @file CameraPorts.hpp
 * @brief Port and stream path catalog used by discovery and the connection fallback.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace camlink::core {

/**
 * @brief Static tables of ports cameras are known to listen on.
 */
class CameraPorts {
public:
    /**
     * @brief Ports scanned in discovery phase 2.
     * @return {554, 8554, 80, 8080, 8000, 8899, 34567, 37777}.
     */
    static const std::vector<uint16_t>& priorityPorts();

    static const std::vector<uint16_t>& httpPorts();
    static const std::vector<uint16_t>& rtspPorts();
    static const std::vector<uint16_t>& onvifPorts();

    /**
     * @brief Per-vendor port lists keyed by lower-case vendor name.
     */
    static const std::map<std::string, std::vector<uint16_t>>& vendorPorts();

    /**
     * @brief Ports for a vendor, falling back to the "generic" list.
     * @param manufacturer Vendor name (case-insensitive).
     * @return Vendor port list.
     */
    static std::vector<uint16_t> portsForManufacturer(const std::string& manufacturer);

    /**
     * @brief Full catalog scanned in discovery phase 3.
     *
     * Union of every table plus the extra ports, sorted ascending with the
     * priority ports first.
     *
     * @param extraPorts Additional ports from configuration.
     * @return Deduplicated port list.
     */
    static std::vector<uint16_t> fullCatalog(const std::vector<uint16_t>& extraPorts = {});

    /**
     * @brief RTSP paths used by common camera firmwares, substreams first.
     *
     * Walked with DESCRIBE when the camera does not report its stream URI.
     */
    static const std::vector<std::string>& streamPaths();

    static bool isStreamingPort(uint16_t port);
    static bool isWebInterfacePort(uint16_t port);
};

} // namespace camlink::core
