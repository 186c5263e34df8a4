/**
 * @file MulticastMessages.hpp
 * @brief Query builders and reply parsers for the multicast discovery protocols.
 *
 * Pure functions, no sockets: the adapters send what these build and feed
 * back what they receive.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace camlink::core::multicast {

inline constexpr const char* WS_DISCOVERY_ADDRESS = "239.255.255.250";
inline constexpr uint16_t WS_DISCOVERY_PORT = 3702;
inline constexpr const char* SSDP_ADDRESS = "239.255.255.250";
inline constexpr uint16_t SSDP_PORT = 1900;
inline constexpr const char* MDNS_ADDRESS = "224.0.0.251";
inline constexpr uint16_t MDNS_PORT = 5353;

/**
 * @brief Extracts the port of an http(s)/rtsp URL.
 * @param url URL such as "http://192.168.1.10:8080/onvif/device_service".
 * @param defaultPort Port returned when the URL names none or cannot be parsed.
 * @return Explicit port, the scheme's default, or defaultPort.
 */
uint16_t portFromUrl(const std::string& url, uint16_t defaultPort);

/**
 * @brief Builds a WS-Discovery search request for NetworkVideoTransmitter devices.
 * @param messageId UUID used as wsa:MessageID (without the "uuid:" prefix).
 */
std::string buildWsDiscoveryRequest(const std::string& messageId);

/**
 * @brief Parses a WS-Discovery match reply.
 * @param xml Reply datagram.
 * @return Port of the first XAddrs URL (80 if absent), nullopt if no device matched.
 */
std::optional<uint16_t> parseWsDiscoveryReply(const std::string& xml);

/**
 * @brief Builds an SSDP M-SEARCH for all devices.
 * @param mx Seconds devices may wait before answering.
 */
std::string buildSsdpSearch(int mx = 2);

/**
 * @brief Parses an SSDP search response or NOTIFY.
 * @param message Reply datagram.
 * @return Port of the LOCATION URL (80 if absent), nullopt if not SSDP.
 */
std::optional<uint16_t> parseSsdpReply(const std::string& message);

/**
 * @brief Service types queried over mDNS.
 * @return {"_rtsp._tcp.local", "_onvif._tcp.local", "_http._tcp.local"}.
 */
const std::vector<std::string>& mdnsServiceTypes();

/**
 * @brief Builds an mDNS query with one PTR question per service.
 * @param services Fully qualified service names.
 */
std::vector<uint8_t> buildMdnsQuery(const std::vector<std::string>& services);

/**
 * @brief Parses an mDNS response.
 *
 * The port comes from the first SRV record. Without SRV, a PTR for an RTSP
 * service yields 554 and any other known service yields 80.
 *
 * @param packet Reply datagram.
 * @return Service port, nullopt if the packet is not a relevant response.
 */
std::optional<uint16_t> parseMdnsReply(const std::vector<uint8_t>& packet);

} // namespace camlink::core::multicast
