/**
 * @file NetworkInfo.hpp
 * @brief Local network topology types and IPv4 subnet arithmetic.
 *
 * This file defines the description of a local network interface and the
 * immutable NetworkInfo snapshot computed once per discovery session.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace camlink::core {

/**
 * @brief Represents an IPv4-addressed system network interface.
 */
struct NetworkInterface {
    std::string name;       ///< System name of the interface (e.g., "eth0", "wlan0")
    std::string ipAddress;  ///< IPv4 address assigned to the interface
    std::string netmask;    ///< Dotted-quad subnet mask
    bool isUp{false};       ///< Whether the interface is currently up
    bool isLoopback{false}; ///< Whether this is a loopback interface

    /**
     * @brief Checks whether the interface can be used for discovery.
     * @return True if up, not loopback and carrying an IPv4 address.
     */
    [[nodiscard]] bool isUsable() const;

    bool operator==(const NetworkInterface& other) const = default;
};

/**
 * @brief Snapshot of the local subnet a discovery session runs against.
 */
struct NetworkInfo {
    std::string interfaceName;          ///< Interface the subnet was taken from
    std::string localAddress;           ///< Our own IPv4 address
    std::string netmask;                ///< Dotted-quad subnet mask
    int prefixLength{24};               ///< CIDR prefix length
    std::string networkAddress;         ///< Network address (address & mask)
    std::optional<std::string> gateway; ///< Default gateway, if one is routed
    std::vector<NetworkInterface> activeInterfaces; ///< All usable interfaces

    /**
     * @brief Formats the subnet in CIDR notation.
     * @return E.g. "192.168.1.0/24".
     */
    [[nodiscard]] std::string cidr() const;

    /**
     * @brief Enumerates usable host addresses of the subnet.
     *
     * Network and broadcast addresses and our own address are excluded.
     *
     * @param limit Maximum number of addresses returned.
     * @return Host addresses in ascending order.
     */
    [[nodiscard]] std::vector<std::string> hostAddresses(size_t limit = 1024) const;

    /**
     * @brief Checks whether an address belongs to the subnet.
     * @param address Dotted-quad IPv4 address.
     * @return True if inside the subnet.
     */
    [[nodiscard]] bool contains(const std::string& address) const;

    /**
     * @brief Builds a NetworkInfo from an address and a mask.
     * @param address Local IPv4 address.
     * @param netmask Dotted-quad subnet mask.
     * @return Populated NetworkInfo (gateway and interfaces left empty).
     * @throws std::invalid_argument if either string is not an IPv4 address.
     */
    static NetworkInfo fromAddress(const std::string& address, const std::string& netmask);
};

/**
 * @brief IPv4 helpers operating on host-order 32-bit values.
 */
namespace ipv4 {

std::optional<uint32_t> parse(const std::string& address);
std::string format(uint32_t address);
int prefixLengthFromMask(uint32_t mask);
uint32_t maskFromPrefixLength(int prefixLength);

} // namespace ipv4

} // namespace camlink::core
