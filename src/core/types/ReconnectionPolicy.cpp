#include "core/types/ReconnectionPolicy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace camlink::core {

std::chrono::milliseconds ReconnectionPolicy::delayForAttempt(int attempt) const {
    int exponent = std::max(attempt, 1) - 1;
    double scaled = static_cast<double>(baseDelay.count()) * std::pow(multiplier, exponent);
    double capped = std::min(scaled, static_cast<double>(maxDelay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

bool ReconnectionPolicy::allowsAttempt(int attempt) const {
    return enabled && attempt >= 1 && attempt <= maxAttempts;
}

} // namespace camlink::core
