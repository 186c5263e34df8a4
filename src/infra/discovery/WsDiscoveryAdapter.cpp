#include "infra/discovery/WsDiscoveryAdapter.hpp"

#include "core/discovery/MulticastMessages.hpp"
#include "infra/crypto/SecureStorage.hpp"

#include <spdlog/fmt/fmt.h>

namespace camlink::infra {

WsDiscoveryAdapter::WsDiscoveryAdapter()
    : MulticastAdapter(core::multicast::WS_DISCOVERY_ADDRESS,
                       core::multicast::WS_DISCOVERY_PORT) {}

std::string WsDiscoveryAdapter::makeMessageId() {
    auto b = SecureStorage::randomBytes(16);
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40); // version 4
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80); // RFC 4122 variant
    return fmt::format("uuid:{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-"
                       "{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
                       b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9], b[10], b[11],
                       b[12], b[13], b[14], b[15]);
}

std::vector<uint8_t> WsDiscoveryAdapter::buildQuery() {
    auto request = core::multicast::buildWsDiscoveryRequest(makeMessageId());
    return {request.begin(), request.end()};
}

std::optional<uint16_t> WsDiscoveryAdapter::parseReply(const std::vector<uint8_t>& datagram) {
    return core::multicast::parseWsDiscoveryReply(std::string(datagram.begin(), datagram.end()));
}

} // namespace camlink::infra
