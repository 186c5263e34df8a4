/**
 * @file ReconnectionPolicy.hpp
 * @brief Exponential backoff policy and reconnection attempt records.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace camlink::core {

/**
 * @brief Backoff and health-check parameters of the reconnection layer.
 */
struct ReconnectionPolicy {
    std::chrono::milliseconds baseDelay{1000};          ///< Delay before the first attempt
    std::chrono::milliseconds maxDelay{5 * 60 * 1000};  ///< Upper bound for any delay
    int maxAttempts{10};                                ///< Attempts before giving up
    double multiplier{2.0};                             ///< Growth factor per attempt
    std::chrono::milliseconds healthCheckInterval{30000}; ///< Period of liveness checks
    bool enabled{true};                                 ///< Whether reconnection runs at all

    /**
     * @brief Computes the delay before an attempt.
     *
     * delay = min(baseDelay * multiplier^(attempt-1), maxDelay). Attempts
     * below 1 are treated as 1.
     *
     * @param attempt 1-based attempt number.
     * @return Delay to wait before issuing the attempt.
     */
    [[nodiscard]] std::chrono::milliseconds delayForAttempt(int attempt) const;

    /**
     * @brief Checks whether another attempt is permitted.
     * @param attempt 1-based attempt number about to be issued.
     * @return True if attempt <= maxAttempts and the policy is enabled.
     */
    [[nodiscard]] bool allowsAttempt(int attempt) const;
};

/**
 * @brief One reconnection attempt as recorded by the reconnection layer.
 */
struct ReconnectionAttempt {
    int attempt{0};                                  ///< 1-based attempt number
    std::chrono::milliseconds delay{0};              ///< Delay waited before the attempt
    std::chrono::system_clock::time_point timestamp; ///< When the attempt ran
    bool success{false};                             ///< Whether the connect succeeded
    std::optional<std::string> error;                ///< Failure reason
};

} // namespace camlink::core
