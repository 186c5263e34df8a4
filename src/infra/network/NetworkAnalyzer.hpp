#pragma once

#include "core/types/NetworkInfo.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace camlink::infra {

/**
 * @brief Determines the local subnet a discovery session runs against.
 *
 * Reads OS state only: interfaces via getifaddrs() and the default gateway
 * from the kernel routing table.
 */
class NetworkAnalyzer {
public:
    /**
     * @brief Constructs a NetworkAnalyzer.
     * @param preferredInterface Interface to use when usable (empty for automatic choice).
     * @param routeTable Path of the kernel IPv4 routing table.
     */
    explicit NetworkAnalyzer(std::string preferredInterface = {},
                             std::filesystem::path routeTable = "/proc/net/route");

    /**
     * @brief Computes the NetworkInfo of the selected interface.
     * @return Immutable snapshot of the subnet.
     * @throws NoActiveInterfaceError if no interface is up, non-loopback and IPv4-addressed.
     */
    core::NetworkInfo analyze() const;

    /**
     * @brief Enumerates IPv4 interfaces of the system.
     * @return One entry per IPv4 address.
     */
    static std::vector<core::NetworkInterface> enumerateInterfaces();

    /**
     * @brief Picks the interface to scan.
     *
     * The preferred interface wins when usable. Otherwise private-range
     * addresses on physical-looking interfaces are preferred over virtual
     * bridges (docker, veth, virbr).
     *
     * @param interfaces Candidate interfaces.
     * @param preferred Preferred interface name (may be empty).
     * @return Selected interface, or nullopt if none is usable.
     */
    static std::optional<core::NetworkInterface>
    selectInterface(const std::vector<core::NetworkInterface>& interfaces,
                    const std::string& preferred = {});

    /**
     * @brief Extracts the default gateway from a /proc/net/route listing.
     * @param routes Stream positioned at the header line.
     * @param interfaceName Restrict to this interface (empty for any).
     * @return Dotted-quad gateway, or nullopt if no default route exists.
     */
    static std::optional<std::string> parseDefaultGateway(std::istream& routes,
                                                          const std::string& interfaceName);

    /**
     * @brief Assembles a NetworkInfo from an interface selection.
     */
    static core::NetworkInfo buildNetworkInfo(const core::NetworkInterface& selected,
                                              const std::vector<core::NetworkInterface>& all,
                                              std::optional<std::string> gateway);

private:
    std::string preferredInterface_;
    std::filesystem::path routeTable_;
};

} // namespace camlink::infra
