/**
 * @file IDiscoveryAdapter.hpp
 * @brief Interface for the discovery mechanisms (multicast searches and port scan).
 */

#pragma once

#include "core/types/DiscoveryTypes.hpp"
#include "core/types/NetworkInfo.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace camlink::core {

/**
 * @brief One-shot producer of discovery results for a subnet.
 *
 * Results are handed to the callback as they arrive and returned as a whole
 * once the sweep finishes. An instance sweeps once; a second sweep returns
 * nothing. Failures (socket, bind, multicast join) yield zero results and
 * never throw.
 */
class IDiscoveryAdapter {
public:
    /**
     * @brief Callback invoked for each result as soon as it is produced.
     */
    using ResultCallback = std::function<void(const DiscoveryResult&)>;

    virtual ~IDiscoveryAdapter() = default;

    /**
     * @brief Runs the sweep.
     * @param network Subnet to search.
     * @param timeout Overall time budget of the sweep.
     * @param cancel Cooperative cancellation flag.
     * @param onResult Incremental result callback (may be empty).
     * @return All results produced.
     */
    virtual std::vector<DiscoveryResult> sweep(const NetworkInfo& network,
                                               std::chrono::milliseconds timeout,
                                               const CancellationToken& cancel,
                                               ResultCallback onResult) = 0;

    virtual DiscoveryMethod method() const = 0;
    virtual std::string name() const = 0;
};

} // namespace camlink::core
