#include <catch2/catch.hpp>
#include "protocol.hpp"

using namespace agentlink;

static std::optional<ProtocolEvent> stream_event(const std::string& name, nlohmann::json payload) {
    return to_protocol_event(TransportKind::RequestStream, Frame{name, std::move(payload)});
}

static std::optional<ProtocolEvent> socket_event(const std::string& name, nlohmann::json payload) {
    return to_protocol_event(TransportKind::DuplexSocket, Frame{name, std::move(payload)});
}

// ── Event names ─────────────────────────────────────────────────

TEST_CASE("to_protocol_event: stream names map one to one", "[protocol]") {
    for (EventType type : {EventType::StreamStarted, EventType::ContentChunk,
                           EventType::ToolCallsDetected, EventType::MessageComplete,
                           EventType::StreamComplete, EventType::ClientAction,
                           EventType::RunSuspended, EventType::TemplateComplete}) {
        auto ev = stream_event(event_type_name(type), nlohmann::json::object());
        REQUIRE(ev.has_value());
        REQUIRE(ev->type == type);
    }
}

TEST_CASE("to_protocol_event: unknown names are skipped", "[protocol]") {
    REQUIRE_FALSE(stream_event("brand_new_event", {}).has_value());
    REQUIRE_FALSE(socket_event("stream_started", {}).has_value());
}

TEST_CASE("to_protocol_event: typed message frames are unwrapped", "[protocol]") {
    auto ev = stream_event("message", {{"type", "content_chunk"}, {"data", {{"content", "Hi"}}}});
    REQUIRE(ev.has_value());
    REQUIRE(ev->type == EventType::ContentChunk);
    REQUIRE(ev->payload["content"] == "Hi");

    auto inline_ev = stream_event("message", {{"type", "error"}, {"error", "bad"}});
    REQUIRE(inline_ev->type == EventType::Error);
    REQUIRE(inline_ev->payload["error"] == "bad");
    REQUIRE_FALSE(inline_ev->payload.contains("type"));
}

TEST_CASE("to_protocol_event: socket names are renamed", "[protocol]") {
    REQUIRE(socket_event("content", {{"content", "x"}})->type == EventType::ContentChunk);
    REQUIRE(socket_event("progress", {})->type == EventType::TemplateProgress);
    REQUIRE(socket_event("complete", {})->type == EventType::TemplateComplete);
    REQUIRE(socket_event("tool_call", {})->type == EventType::ToolExecuting);
    REQUIRE(socket_event("pong", {})->type == EventType::Pong);
}

TEST_CASE("to_protocol_event: socket payloads are normalized", "[protocol]") {
    auto widget = socket_event("widget", {{"widget_type", "slider"}, {"item_id", "i1"}});
    REQUIRE(widget->type == EventType::ClientAction);
    REQUIRE(widget->payload["action_type"] == "widget");

    auto tool = socket_event("tool_result", {{"name", "search"}, {"success", true}});
    REQUIRE(tool->payload["tool_name"] == "search");

    auto err = socket_event("error", {{"message", "boom"}});
    REQUIRE(err->payload["error"] == "boom");
}

TEST_CASE("is_terminal: only end-of-stream events", "[protocol]") {
    REQUIRE(is_terminal(EventType::StreamComplete));
    REQUIRE(is_terminal(EventType::SessionCompleted));
    REQUIRE(is_terminal(EventType::Cancelled));
    REQUIRE_FALSE(is_terminal(EventType::MessageComplete));
    REQUIRE_FALSE(is_terminal(EventType::Error));
}

TEST_CASE("ends_stream: errors end request streams", "[protocol]") {
    ProtocolEvent generic{EventType::Error, {{"error", "boom"}}};
    ProtocolEvent limited{EventType::Error, {{"error_code", "rate_limited"}}};
    ProtocolEvent expired{EventType::Error, {{"code", "session_expired"}}};

    REQUIRE(ends_stream(TransportKind::RequestStream, generic));
    REQUIRE(ends_stream(TransportKind::RequestStream, limited));
    REQUIRE_FALSE(ends_stream(TransportKind::DuplexSocket, generic));
    REQUIRE(ends_stream(TransportKind::DuplexSocket, limited));
    REQUIRE(ends_stream(TransportKind::DuplexSocket, expired));

    REQUIRE(ends_stream(TransportKind::DuplexSocket, {EventType::StreamComplete, nullptr}));
    REQUIRE_FALSE(ends_stream(TransportKind::RequestStream, {EventType::ContentChunk, nullptr}));
}

TEST_CASE("error_code_of: error_code then code", "[protocol]") {
    REQUIRE(error_code_of({{"error_code", "a"}, {"code", "b"}}) == "a");
    REQUIRE(error_code_of({{"code", "b"}}) == "b");
    REQUIRE(error_code_of({{"code", 7}}).empty());
    REQUIRE(error_code_of("unauthorized").empty());
}

TEST_CASE("is_auth_error_code: known codes", "[protocol]") {
    REQUIRE(is_auth_error_code("unauthorized"));
    REQUIRE(is_auth_error_code("session_expired"));
    REQUIRE_FALSE(is_auth_error_code("rate_limited"));
    REQUIRE_FALSE(is_auth_error_code(""));
}

// ── Outbound ────────────────────────────────────────────────────

TEST_CASE("outbound: socket messages", "[protocol]") {
    REQUIRE(nlohmann::json::parse(outbound::socket_start())["type"] == "start");
    REQUIRE(nlohmann::json::parse(outbound::socket_cancel())["type"] == "cancel");
    REQUIRE(nlohmann::json::parse(outbound::socket_ping())["type"] == "ping");

    auto msg = nlohmann::json::parse(outbound::socket_message("hello"));
    REQUIRE(msg["type"] == "message");
    REQUIRE(msg["content"] == "hello");
}

TEST_CASE("outbound: socket widget response", "[protocol]") {
    auto msg = nlohmann::json::parse(
        outbound::socket_widget_response("a1", "multiple_choice", {{"selected", {"x", "y"}}}));
    REQUIRE(msg["type"] == "widget_response");
    REQUIRE(msg["data"]["action_id"] == "a1");
    REQUIRE(msg["data"]["widget_type"] == "multiple_choice");
    REQUIRE(msg["data"]["content"] == "x, y");
}

TEST_CASE("outbound: chat_send_body nulls empty ids", "[protocol]") {
    auto body = outbound::chat_send_body("hi", "", "m1", "");
    REQUIRE(body["message"] == "hi");
    REQUIRE(body["conversation_id"].is_null());
    REQUIRE(body["model_id"] == "m1");
    REQUIRE(body["definition_id"].is_null());
}

TEST_CASE("outbound: respond_body", "[protocol]") {
    auto body = outbound::respond_body("call-1", {{"text", "ok"}});
    REQUIRE(body["tool_call_id"] == "call-1");
    REQUIRE(body["response"]["text"] == "ok");
    REQUIRE(body["timestamp"].is_string());
}

// ── response_text ───────────────────────────────────────────────

TEST_CASE("response_text: picks the readable part", "[protocol]") {
    REQUIRE(response_text("plain") == "plain");
    REQUIRE(response_text({{"selected", {"a", "b"}}}) == "a, b");
    REQUIRE(response_text({{"selected", "only"}}) == "only");
    REQUIRE(response_text({{"text", "typed"}}) == "typed");
    REQUIRE(response_text({{"code", "x = 1"}}) == "x = 1");
    REQUIRE(response_text({{"value", 7}}) == "7");
    REQUIRE(response_text(42) == "42");
}
