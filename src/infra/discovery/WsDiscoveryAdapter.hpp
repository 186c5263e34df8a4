#pragma once

#include "infra/discovery/MulticastAdapter.hpp"

namespace camlink::infra {

/**
 * @brief WS-Discovery search for network video transmitters (UDP 3702).
 */
class WsDiscoveryAdapter : public MulticastAdapter {
public:
    WsDiscoveryAdapter();

    core::DiscoveryMethod method() const override { return core::DiscoveryMethod::MulticastA; }
    std::string name() const override { return "WS-Discovery"; }

    /**
     * @brief Generates a random "uuid:" message identifier.
     */
    static std::string makeMessageId();

protected:
    std::vector<uint8_t> buildQuery() override;
    std::optional<uint16_t> parseReply(const std::vector<uint8_t>& datagram) override;
};

} // namespace camlink::infra
