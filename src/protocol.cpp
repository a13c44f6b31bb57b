#include "protocol.hpp"
#include "util.hpp"

#include <unordered_map>

namespace agentlink {

const char* event_type_name(EventType type) {
    switch (type) {
        case EventType::StreamStarted:     return "stream_started";
        case EventType::AssistantThinking: return "assistant_thinking";
        case EventType::ContentChunk:      return "content_chunk";
        case EventType::ToolCallsDetected: return "tool_calls_detected";
        case EventType::ToolExecuting:     return "tool_executing";
        case EventType::ToolResult:        return "tool_result";
        case EventType::MessageComplete:   return "message_complete";
        case EventType::MessageAdded:      return "message_added";
        case EventType::StreamComplete:    return "stream_complete";
        case EventType::SessionCompleted:  return "session_completed";
        case EventType::Cancelled:         return "cancelled";
        case EventType::Error:             return "error";
        case EventType::ClientAction:      return "client_action";
        case EventType::RunSuspended:      return "run_suspended";
        case EventType::RunResumed:        return "run_resumed";
        case EventType::State:             return "state";
        case EventType::Connected:         return "connected";
        case EventType::TemplateConfig:    return "template_config";
        case EventType::TemplateProgress:  return "template_progress";
        case EventType::TemplateComplete:  return "template_complete";
        case EventType::Heartbeat:         return "heartbeat";
        case EventType::Pong:              return "pong";
    }
    return "unknown";
}

static const std::unordered_map<std::string, EventType>& stream_names() {
    static const std::unordered_map<std::string, EventType> names = {
        {"stream_started",      EventType::StreamStarted},
        {"assistant_thinking",  EventType::AssistantThinking},
        {"content_chunk",       EventType::ContentChunk},
        {"tool_calls_detected", EventType::ToolCallsDetected},
        {"tool_executing",      EventType::ToolExecuting},
        {"tool_result",         EventType::ToolResult},
        {"message_complete",    EventType::MessageComplete},
        {"message_added",       EventType::MessageAdded},
        {"stream_complete",     EventType::StreamComplete},
        {"session_completed",   EventType::SessionCompleted},
        {"cancelled",           EventType::Cancelled},
        {"error",               EventType::Error},
        {"client_action",       EventType::ClientAction},
        {"run_suspended",       EventType::RunSuspended},
        {"run_resumed",         EventType::RunResumed},
        {"state",               EventType::State},
        {"connected",           EventType::Connected},
        {"template_config",     EventType::TemplateConfig},
        {"template_progress",   EventType::TemplateProgress},
        {"template_complete",   EventType::TemplateComplete},
        {"heartbeat",           EventType::Heartbeat},
    };
    return names;
}

// The socket protocol is a reduced, renamed variant of the stream protocol.
static const std::unordered_map<std::string, EventType>& socket_names() {
    static const std::unordered_map<std::string, EventType> names = {
        {"connected",        EventType::Connected},
        {"content",          EventType::ContentChunk},
        {"widget",           EventType::ClientAction},
        {"progress",         EventType::TemplateProgress},
        {"message_complete", EventType::MessageComplete},
        {"complete",         EventType::TemplateComplete},
        {"message_added",    EventType::MessageAdded},
        {"template_config",  EventType::TemplateConfig},
        {"tool_call",        EventType::ToolExecuting},
        {"tool_result",      EventType::ToolResult},
        {"error",            EventType::Error},
        {"pong",             EventType::Pong},
        {"ping",             EventType::Heartbeat},
        {"heartbeat",        EventType::Heartbeat},
    };
    return names;
}

static nlohmann::json normalize_socket_payload(EventType type, nlohmann::json payload) {
    if (!payload.is_object()) return payload;
    switch (type) {
        case EventType::ClientAction:
            if (!payload.contains("action_type")) payload["action_type"] = "widget";
            break;
        case EventType::ToolExecuting:
        case EventType::ToolResult:
            if (!payload.contains("tool_name") && payload.contains("name"))
                payload["tool_name"] = payload["name"];
            break;
        case EventType::Error:
            if (!payload.contains("error") && payload.contains("message"))
                payload["error"] = payload["message"];
            break;
        default:
            break;
    }
    return payload;
}

std::optional<ProtocolEvent> to_protocol_event(TransportKind kind, const Frame& frame) {
    if (kind == TransportKind::DuplexSocket) {
        auto it = socket_names().find(frame.event_type);
        if (it == socket_names().end()) return std::nullopt;
        return ProtocolEvent{it->second, normalize_socket_payload(it->second, frame.payload)};
    }

    // Unnamed stream frames may carry their type inside the payload.
    std::string name = frame.event_type;
    nlohmann::json payload = frame.payload;
    if (name == "message" && payload.is_object() &&
        payload.contains("type") && payload["type"].is_string()) {
        name = payload["type"].get<std::string>();
        if (payload.contains("data")) {
            payload = payload["data"];
        } else {
            payload.erase("type");
        }
    }
    auto it = stream_names().find(name);
    if (it == stream_names().end()) return std::nullopt;
    return ProtocolEvent{it->second, std::move(payload)};
}

bool is_terminal(EventType type) {
    return type == EventType::StreamComplete ||
           type == EventType::SessionCompleted ||
           type == EventType::Cancelled;
}

bool is_auth_error_code(const std::string& code) {
    return code == "unauthorized" || code == "session_expired";
}

std::string error_code_of(const nlohmann::json& payload) {
    if (!payload.is_object()) return {};
    for (const char* key : {"error_code", "code"}) {
        if (payload.contains(key) && payload[key].is_string())
            return payload[key].get<std::string>();
    }
    return {};
}

bool ends_stream(TransportKind kind, const ProtocolEvent& event) {
    if (is_terminal(event.type)) return true;
    if (event.type != EventType::Error) return false;
    if (kind == TransportKind::RequestStream) return true;
    std::string code = error_code_of(event.payload);
    return is_auth_error_code(code) || code == "rate_limited";
}

namespace outbound {

std::string socket_start() {
    return nlohmann::json{{"type", "start"}}.dump();
}

std::string socket_message(const std::string& content) {
    return nlohmann::json{{"type", "message"}, {"content", content}}.dump();
}

std::string socket_widget_response(const std::string& action_id,
                                   const std::string& widget_type,
                                   const nlohmann::json& value) {
    nlohmann::json msg = {
        {"type", "widget_response"},
        {"data", {
            {"action_id", action_id},
            {"widget_type", widget_type},
            {"value", value},
            {"content", response_text(value)}
        }}
    };
    return msg.dump();
}

std::string socket_cancel() {
    return nlohmann::json{{"type", "cancel"}}.dump();
}

std::string socket_ping() {
    return nlohmann::json{{"type", "ping"}}.dump();
}

nlohmann::json chat_send_body(const std::string& message,
                              const std::string& conversation_id,
                              const std::string& model_id,
                              const std::string& definition_id) {
    nlohmann::json body = {{"message", message}};
    body["conversation_id"] = conversation_id.empty() ? nlohmann::json() : nlohmann::json(conversation_id);
    body["model_id"] = model_id.empty() ? nlohmann::json() : nlohmann::json(model_id);
    body["definition_id"] = definition_id.empty() ? nlohmann::json() : nlohmann::json(definition_id);
    return body;
}

nlohmann::json respond_body(const std::string& action_id, const nlohmann::json& value) {
    return {
        {"tool_call_id", action_id},
        {"response", value},
        {"timestamp", timestamp_now()}
    };
}

} // namespace outbound

std::string response_text(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (!value.is_object()) return value.dump();

    if (value.contains("selected")) {
        const auto& sel = value["selected"];
        if (sel.is_array()) {
            std::string out;
            for (const auto& item : sel) {
                if (!out.empty()) out += ", ";
                out += item.is_string() ? item.get<std::string>() : item.dump();
            }
            return out;
        }
        if (sel.is_string()) return sel.get<std::string>();
    }
    for (const char* key : {"text", "code"}) {
        if (value.contains(key) && value[key].is_string())
            return value[key].get<std::string>();
    }
    if (value.contains("value")) {
        const auto& v = value["value"];
        return v.is_string() ? v.get<std::string>() : v.dump();
    }
    return value.dump();
}

} // namespace agentlink
