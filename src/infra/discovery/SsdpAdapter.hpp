#pragma once

#include "infra/discovery/MulticastAdapter.hpp"

namespace camlink::infra {

/**
 * @brief SSDP M-SEARCH for UPnP devices (UDP 1900).
 */
class SsdpAdapter : public MulticastAdapter {
public:
    /**
     * @param maxWaitSeconds MX value asking responders to spread their replies.
     */
    explicit SsdpAdapter(int maxWaitSeconds = 2);

    core::DiscoveryMethod method() const override { return core::DiscoveryMethod::MulticastB; }
    std::string name() const override { return "SSDP"; }

protected:
    std::vector<uint8_t> buildQuery() override;
    std::optional<uint16_t> parseReply(const std::vector<uint8_t>& datagram) override;

private:
    int maxWaitSeconds_;
};

} // namespace camlink::infra
