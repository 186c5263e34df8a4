/**
 * @file IProtocolDetector.hpp
 * @brief Interface for classifying the protocol spoken on a (host, port).
 */

#pragma once

#include "core/types/CameraDescriptor.hpp"
#include "core/types/DiscoveryTypes.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace camlink::core {

class IProtocolDetector {
public:
    virtual ~IProtocolDetector() = default;

    /**
     * @brief Classifies an endpoint.
     *
     * Never throws for network failures. An endpoint that is unreachable
     * or gives no structurally valid answer is Rejected with confidence 0
     * and conclusive false; only conclusive rejections are cached as misses.
     *
     * @param host IPv4 address.
     * @param port TCP port.
     * @param credential Optional credential for the vendor login.
     * @return Classification of the endpoint.
     */
    virtual Classification classify(const std::string& host, uint16_t port,
                                    const std::optional<Credential>& credential) = 0;
};

} // namespace camlink::core
