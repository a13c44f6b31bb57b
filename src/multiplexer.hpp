#pragma once
#include "agent_api.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "session.hpp"
#include "transport.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace agentlink {

// ── Event queue ─────────────────────────────────────────────────

struct QueueItem {
    enum class Kind { Event, Notice, WidgetResponse };
    Kind kind = Kind::Event;
    std::string session_id;
    ProtocolEvent event{EventType::Heartbeat, nullptr};
    int64_t received_at_ms = 0;
    ConnectionNotice notice;
    std::string action_id;
    nlohmann::json value;
};

// Many producers (reader threads, widget responders), one consumer.
class EventQueue {
public:
    void push(QueueItem item);
    std::optional<QueueItem> pop();
    std::vector<QueueItem> pop_all();

    // Blocks until an item is available or the timeout expires.
    bool wait_for(std::chrono::milliseconds timeout);

    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<QueueItem> queue_;
};

// ── Session multiplexer ─────────────────────────────────────────

struct SessionInfo {
    std::string id;
    SessionKind kind = SessionKind::Reactive;
    SessionStatus status = SessionStatus::Idle;
    RestrictionSet restrictions;
    TransportKind transport = TransportKind::RequestStream;
    std::string conversation_id;
    std::string server_session_id;
    std::optional<StreamingMessage> active_message;
    std::optional<PendingAction> pending_action;
    size_t buffered_events = 0;
    bool active = false;
};

// Owns every session and the single active one. Connection threads only
// enqueue; all session state is mutated by the thread that calls
// process_pending(), under one mutex shared with the public operations.
// Bus notifications are published after that mutex is released.
class SessionMultiplexer {
public:
    SessionMultiplexer(const Config& config,
                       EventBus& bus,
                       TransportFactory factory,
                       AgentApi* api = nullptr);
    ~SessionMultiplexer();

    SessionMultiplexer(const SessionMultiplexer&) = delete;
    SessionMultiplexer& operator=(const SessionMultiplexer&) = delete;

    // Registers a session in the background. Returns its id.
    std::string create_session(SessionOptions options);

    // Opens the session's stream ahead of the first exchange (duplex
    // sockets and server-driven proactive sessions). Returns true if open.
    bool connect_session(const std::string& id);

    // Makes `id` the active session and replays its buffered events.
    // Throws SwitchDenied or SessionNotFound.
    void switch_to(const std::string& id);

    // Backgrounds the active session; nothing is active afterwards.
    void deactivate();

    // Sends user text on the active session. Throws FreeTextDenied,
    // SessionNotFound (no active session) or TransportError.
    void start_exchange(const std::string& text);

    // Answers the pending widget of the active session.
    void submit_widget_response(const std::string& action_id, const nlohmann::json& value);

    // Stops the active session's exchange. Returns false if nothing to cancel.
    bool cancel_current();

    // Throws TerminateDenied or SessionNotFound.
    void terminate_session(const std::string& id);

    // Logout: drops every session regardless of restrictions.
    void close_all();

    bool can_submit_text() const;

    std::string active_session_id() const;
    std::vector<std::string> session_ids() const;
    std::optional<SessionInfo> session_info(const std::string& id) const;

    // Drains the event queue. Returns the number of items handled.
    size_t process_pending();

    // Waits up to `timeout` for work, then drains.
    size_t wait_and_process(std::chrono::milliseconds timeout);

    // Injects an event as if a connection of `session_id` had received it.
    void post_event(const std::string& session_id, ProtocolEvent event);
    void post_notice(const std::string& session_id, const ConnectionNotice& notice);

private:
    using Outbox = std::vector<std::function<void()>>;

    template<typename E>
    void emit(Outbox& out, E event) {
        out.push_back([this, ev = std::move(event)]() { bus_.publish(ev); });
    }
    void flush(Outbox& out);

    Session* find(const std::string& id) const;
    Session& require(const std::string& id) const;
    Session& require_active() const;

    void route(QueueItem& item, Outbox& out);
    void handle_live(Session& s, const ProtocolEvent& event, Outbox& out);
    void handle_error(Session& s, const nlohmann::json& payload, Outbox& out);
    void handle_action(Session& s, const nlohmann::json& payload, bool run_suspended, Outbox& out);
    void handle_notice(Session& s, const ConnectionNotice& notice, Outbox& out);
    void update_restrictions(Session& s, const nlohmann::json& update, Outbox& out);

    void publish_update(Session& s, const AccumulatorUpdate& update, Outbox& out);
    void set_status(Session& s, SessionStatus status, Outbox& out);
    void refresh_status(Session& s, Outbox& out);
    void background(Session& s, Outbox& out);

    bool text_allowed(const Session& s) const;
    void send_chat(Session& s, const std::string& text, Outbox& out);
    void deliver_response(Session& s, const PendingAction& action,
                          const nlohmann::json& value, Outbox& out);
    void respond(Session& s, const std::string& action_id, const nlohmann::json& value, Outbox& out);
    std::unique_ptr<Session> detach(const std::string& id);
    void end_session(std::unique_ptr<Session> session, const std::string& reason, Outbox& out);

    Endpoint stream_endpoint(const Session& s) const;

    const Config& config_;
    EventBus& bus_;
    TransportFactory factory_;
    AgentApi* api_;

    EventQueue queue_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Session>> sessions_;
    std::string active_id_;
};

} // namespace agentlink
