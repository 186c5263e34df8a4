#include "core/types/ConnectionState.hpp"

namespace camlink::core {

std::string connectionStateToString(ConnectionState state) {
    switch (state) {
    case ConnectionState::Disconnected:
        return "Disconnected";
    case ConnectionState::Connecting:
        return "Connecting";
    case ConnectionState::Authenticating:
        return "Authenticating";
    case ConnectionState::Connected:
        return "Connected";
    case ConnectionState::Streaming:
        return "Streaming";
    case ConnectionState::Reconnecting:
        return "Reconnecting";
    case ConnectionState::Error:
        return "Error";
    }
    return "Unknown";
}

bool isTransitionAllowed(ConnectionState from, ConnectionState to, bool autoReconnect) {
    using S = ConnectionState;

    if (to == S::Disconnected) {
        return true;
    }

    switch (from) {
    case S::Disconnected:
        return to == S::Connecting;
    case S::Connecting:
        return to == S::Authenticating || to == S::Connected || to == S::Error ||
               to == S::Reconnecting;
    case S::Authenticating:
        return to == S::Connected || to == S::Error || to == S::Reconnecting;
    case S::Connected:
        return to == S::Streaming || to == S::Reconnecting || to == S::Error;
    case S::Streaming:
        return to == S::Connected || to == S::Reconnecting || to == S::Error;
    case S::Reconnecting:
        return to == S::Connecting || to == S::Error;
    case S::Error:
        return to == S::Reconnecting && autoReconnect;
    }
    return false;
}

ConnectionStateMachine::ConnectionStateMachine(bool autoReconnect)
    : autoReconnect_(autoReconnect) {}

bool ConnectionStateMachine::transitionTo(ConnectionState to) {
    Listener listener;
    ConnectionState from;
    {
        std::lock_guard lock(mutex_);
        from = state_;
        if (from == to || !isTransitionAllowed(from, to, autoReconnect_)) {
            return false;
        }
        state_ = to;
        history_.push_back({from, to, std::chrono::system_clock::now()});
        listener = listener_;
    }

    if (listener) {
        listener(from, to);
    }
    return true;
}

ConnectionState ConnectionStateMachine::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::vector<StateTransition> ConnectionStateMachine::history() const {
    std::lock_guard lock(mutex_);
    return history_;
}

void ConnectionStateMachine::setListener(Listener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

void ConnectionStateMachine::setAutoReconnect(bool enabled) {
    std::lock_guard lock(mutex_);
    autoReconnect_ = enabled;
}

} // namespace camlink::core
