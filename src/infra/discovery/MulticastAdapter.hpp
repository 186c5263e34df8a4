#pragma once

#include "core/services/IDiscoveryAdapter.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace camlink::infra {

/**
 * @brief Common send-query, collect-replies loop of the multicast adapters.
 *
 * Opens a UDP socket on the analysed interface, sends one query to the
 * multicast group and collects unicast replies until the timeout elapses or
 * the session is cancelled. Each responding (host, port) is reported once.
 * Socket failures are logged and end the sweep with the results gathered so
 * far.
 */
class MulticastAdapter : public core::IDiscoveryAdapter {
public:
    std::vector<core::DiscoveryResult> sweep(const core::NetworkInfo& network,
                                             std::chrono::milliseconds timeout,
                                             const core::CancellationToken& cancel,
                                             ResultCallback onResult) override;

protected:
    MulticastAdapter(std::string groupAddress, uint16_t groupPort);

    /**
     * @brief Builds the query datagram.
     */
    virtual std::vector<uint8_t> buildQuery() = 0;

    /**
     * @brief Extracts the service port from a reply datagram.
     * @return Port, or nullopt if the datagram is not a relevant reply.
     */
    virtual std::optional<uint16_t> parseReply(const std::vector<uint8_t>& datagram) = 0;

private:
    std::string groupAddress_;
    uint16_t groupPort_;
    std::atomic<bool> consumed_{false};
};

} // namespace camlink::infra
