#pragma once

#include "infra/discovery/MulticastAdapter.hpp"

namespace camlink::infra {

/**
 * @brief mDNS PTR query for RTSP, ONVIF and HTTP services (UDP 5353).
 *
 * The query is sent from an ephemeral port, so responders answer with
 * legacy unicast replies.
 */
class MdnsAdapter : public MulticastAdapter {
public:
    MdnsAdapter();

    core::DiscoveryMethod method() const override { return core::DiscoveryMethod::MulticastC; }
    std::string name() const override { return "mDNS"; }

protected:
    std::vector<uint8_t> buildQuery() override;
    std::optional<uint16_t> parseReply(const std::vector<uint8_t>& datagram) override;
};

} // namespace camlink::infra
