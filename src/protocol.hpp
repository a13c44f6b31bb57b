#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agentlink {

enum class TransportKind { RequestStream, DuplexSocket };

// Every event the client understands. Consumers switch exhaustively, so a
// new entry here must be handled everywhere before the build succeeds.
enum class EventType {
    StreamStarted,
    AssistantThinking,
    ContentChunk,
    ToolCallsDetected,
    ToolExecuting,
    ToolResult,
    MessageComplete,
    MessageAdded,
    StreamComplete,
    SessionCompleted,
    Cancelled,
    Error,
    ClientAction,
    RunSuspended,
    RunResumed,
    State,
    Connected,
    TemplateConfig,
    TemplateProgress,
    TemplateComplete,
    Heartbeat,
    Pong,
};

// One decoded frame, before any interpretation.
struct Frame {
    std::string event_type;
    nlohmann::json payload;
};

struct ProtocolEvent {
    EventType type;
    nlohmann::json payload;
};

const char* event_type_name(EventType type);

// Maps a decoded frame onto the closed event set. Names differ between the
// two transports; unknown names yield nullopt.
std::optional<ProtocolEvent> to_protocol_event(TransportKind kind, const Frame& frame);

// Events after which a close is expected and must not be retried.
bool is_terminal(EventType type);

// Auth failure codes carried in-band by `error` events.
bool is_auth_error_code(const std::string& code);

// `error_code` (or `code`) of an in-band error payload, empty when absent.
std::string error_code_of(const nlohmann::json& payload);

// True when `event` ends the stream it arrived on, so a following close is
// not retried. Every request-stream error ends its stream; a socket stays
// usable after an error unless it is an auth or rate-limit failure.
bool ends_stream(TransportKind kind, const ProtocolEvent& event);

// ── Outbound messages ───────────────────────────────────────────

namespace outbound {

// Duplex socket
std::string socket_start();
std::string socket_message(const std::string& content);
std::string socket_widget_response(const std::string& action_id,
                                   const std::string& widget_type,
                                   const nlohmann::json& value);
std::string socket_cancel();
std::string socket_ping();

// Request stream (HTTP bodies)
nlohmann::json chat_send_body(const std::string& message,
                              const std::string& conversation_id,
                              const std::string& model_id,
                              const std::string& definition_id);
nlohmann::json respond_body(const std::string& action_id, const nlohmann::json& value);

} // namespace outbound

// Text shown for a widget answer: selections, text, code, then raw value.
std::string response_text(const nlohmann::json& value);

} // namespace agentlink
