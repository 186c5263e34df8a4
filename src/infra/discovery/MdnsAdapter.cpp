#include "infra/discovery/MdnsAdapter.hpp"

#include "core/discovery/MulticastMessages.hpp"

namespace camlink::infra {

MdnsAdapter::MdnsAdapter()
    : MulticastAdapter(core::multicast::MDNS_ADDRESS, core::multicast::MDNS_PORT) {}

std::vector<uint8_t> MdnsAdapter::buildQuery() {
    return core::multicast::buildMdnsQuery(core::multicast::mdnsServiceTypes());
}

std::optional<uint16_t> MdnsAdapter::parseReply(const std::vector<uint8_t>& datagram) {
    return core::multicast::parseMdnsReply(datagram);
}

} // namespace camlink::infra
