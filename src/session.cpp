#include "session.hpp"

namespace agentlink {

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Idle:            return "idle";
        case SessionStatus::Connecting:      return "connecting";
        case SessionStatus::ActiveStreaming: return "active-streaming";
        case SessionStatus::Suspended:       return "suspended";
        case SessionStatus::Background:      return "background";
        case SessionStatus::Terminated:      return "terminated";
        case SessionStatus::Error:           return "error";
    }
    return "unknown";
}

SessionStatus Session::foreground_status() const {
    if (coordinator.state() == SuspendState::Terminated) return SessionStatus::Terminated;
    if (connection_lost || exchange_failed) return SessionStatus::Error;
    if (coordinator.suspended()) return SessionStatus::Suspended;
    if (accumulator.active() || exchange_open) return SessionStatus::ActiveStreaming;
    if (connection && connection->state() == ConnectionState::Connecting)
        return SessionStatus::Connecting;
    return SessionStatus::Idle;
}

} // namespace agentlink
