/**
 * @file ProtocolStrategy.hpp
 * @brief Connection strategy chosen once per camera descriptor.
 */

#pragma once

#include "core/types/CameraDescriptor.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace camlink::core {

/// Default ONVIF device service port when the descriptor names none.
inline constexpr uint16_t DEFAULT_CONTROL_PORT = 80;
/// Default RTSP port when the descriptor names none.
inline constexpr uint16_t DEFAULT_MEDIA_PORT = 554;
/// Default vendor binary protocol port when the descriptor names none.
inline constexpr uint16_t DEFAULT_PROPRIETARY_PORT = 34567;

struct StandardsStrategy {
    uint16_t controlPort{DEFAULT_CONTROL_PORT};
    uint16_t mediaPort{DEFAULT_MEDIA_PORT};
};

struct ProprietaryStrategy {
    uint16_t port{DEFAULT_PROPRIETARY_PORT};
};

/**
 * @brief Both paths must connect; both handles are kept.
 */
struct HybridStrategy {
    StandardsStrategy standards;
    ProprietaryStrategy proprietary;
};

/**
 * @brief Try both paths in parallel, then walk the fallback ports.
 */
struct AutoFallbackStrategy {
    StandardsStrategy standards;
    ProprietaryStrategy proprietary;
    std::vector<uint16_t> fallbackPorts;
};

/// Visitor helper combining several lambdas into one overload set.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

using ProtocolStrategy =
    std::variant<StandardsStrategy, ProprietaryStrategy, HybridStrategy, AutoFallbackStrategy>;

/**
 * @brief Chooses the connection strategy for a descriptor.
 *
 * Resolved protocol types map to their own strategy. Undetermined
 * descriptors use AutoFallback when autoDetect is set, Standards otherwise.
 *
 * @param descriptor Camera to connect to.
 * @return Strategy with concrete ports filled in.
 */
ProtocolStrategy selectStrategy(const CameraDescriptor& descriptor);

/**
 * @brief Returns the strategy name for logging.
 */
std::string strategyName(const ProtocolStrategy& strategy);

} // namespace camlink::core
