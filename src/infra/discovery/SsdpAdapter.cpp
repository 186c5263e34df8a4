#include "infra/discovery/SsdpAdapter.hpp"

#include "core/discovery/MulticastMessages.hpp"

namespace camlink::infra {

SsdpAdapter::SsdpAdapter(int maxWaitSeconds)
    : MulticastAdapter(core::multicast::SSDP_ADDRESS, core::multicast::SSDP_PORT),
      maxWaitSeconds_(maxWaitSeconds) {}

std::vector<uint8_t> SsdpAdapter::buildQuery() {
    auto search = core::multicast::buildSsdpSearch(maxWaitSeconds_);
    return {search.begin(), search.end()};
}

std::optional<uint16_t> SsdpAdapter::parseReply(const std::vector<uint8_t>& datagram) {
    return core::multicast::parseSsdpReply(std::string(datagram.begin(), datagram.end()));
}

} // namespace camlink::infra
