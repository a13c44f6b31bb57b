#pragma once
#include "accumulator.hpp"
#include "connection.hpp"
#include "protocol.hpp"
#include "restrictions.hpp"
#include "suspend.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>

namespace agentlink {

enum class SessionStatus {
    Idle,
    Connecting,
    ActiveStreaming,
    Suspended,
    Background,
    Terminated,
    Error,
};

const char* session_status_name(SessionStatus status);

struct BufferedEvent {
    ProtocolEvent event;
    int64_t received_at_ms = 0; // monotonic
};

struct SessionOptions {
    SessionKind kind = SessionKind::Reactive;
    std::string definition_id;
    std::string conversation_id;
    std::string server_session_id;       // set when the server created it
    nlohmann::json server_config;        // agent/template configuration
    std::optional<TransportKind> transport; // defaults to the configured kind
};

// One agent conversation. Owned and mutated only by the SessionMultiplexer.
struct Session {
    std::string id;
    SessionKind kind = SessionKind::Reactive;
    SessionStatus status = SessionStatus::Idle;
    RestrictionSet restrictions;
    TransportKind transport = TransportKind::RequestStream;

    std::string definition_id;
    std::string conversation_id;
    std::string server_session_id;
    std::string request_id;

    MessageAccumulator accumulator;  // owns the active message
    SuspendCoordinator coordinator;  // owns the pending action
    std::deque<BufferedEvent> event_buffer;
    std::unique_ptr<ConnectionManager> connection;

    nlohmann::json template_config;
    nlohmann::json template_progress;

    bool exchange_open = false;      // between start_exchange and stream end
    bool exchange_failed = false;    // last exchange ended with an error event
    bool connection_lost = false;    // reconnection gave up

    // Status implied by the session's own state when it is in the foreground.
    SessionStatus foreground_status() const;
};

} // namespace agentlink
