/**
 * @file ConnectionState.hpp
 * @brief Per-camera connection lifecycle states and their transition rules.
 */

#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace camlink::core {

/**
 * @brief Lifecycle state of a camera connection.
 */
enum class ConnectionState : int {
    Disconnected = 0,
    Connecting = 1,
    Authenticating = 2,
    Connected = 3,
    Streaming = 4,
    Reconnecting = 5,
    Error = 6
};

std::string connectionStateToString(ConnectionState state);

/**
 * @brief Checks whether a transition is part of the connection lifecycle.
 *
 * Any state may move to Disconnected (explicit disconnect). Error may move to
 * Reconnecting only when auto-reconnect is enabled.
 *
 * @param from Current state.
 * @param to Requested state.
 * @param autoReconnect Whether automatic reconnection is enabled.
 * @return True if the transition is allowed.
 */
bool isTransitionAllowed(ConnectionState from, ConnectionState to, bool autoReconnect = true);

/**
 * @brief A recorded state change.
 */
struct StateTransition {
    ConnectionState from{ConnectionState::Disconnected};
    ConnectionState to{ConnectionState::Disconnected};
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Thread-safe holder of one camera's connection state.
 *
 * Rejects transitions that are not part of the lifecycle and keeps the
 * sequence of accepted changes.
 */
class ConnectionStateMachine {
public:
    using Listener = std::function<void(ConnectionState from, ConnectionState to)>;

    explicit ConnectionStateMachine(bool autoReconnect = true);

    /**
     * @brief Moves to a new state.
     * @param to Requested state.
     * @return True if accepted, false if the transition is not allowed.
     */
    bool transitionTo(ConnectionState to);

    [[nodiscard]] ConnectionState state() const;
    [[nodiscard]] std::vector<StateTransition> history() const;

    void setListener(Listener listener);
    void setAutoReconnect(bool enabled);

private:
    mutable std::mutex mutex_;
    ConnectionState state_{ConnectionState::Disconnected};
    std::vector<StateTransition> history_;
    Listener listener_;
    bool autoReconnect_;
};

} // namespace camlink::core
