#include "multiplexer.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <initializer_list>
#include <iostream>

namespace agentlink {

// ── EventQueue ──────────────────────────────────────────────────

void EventQueue::push(QueueItem item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(item));
    }
    cv_.notify_one();
}

std::optional<QueueItem> EventQueue::pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    QueueItem item = std::move(queue_.front());
    queue_.pop();
    return item;
}

std::vector<QueueItem> EventQueue::pop_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<QueueItem> items;
    items.reserve(queue_.size());
    while (!queue_.empty()) {
        items.push_back(std::move(queue_.front()));
        queue_.pop();
    }
    return items;
}

bool EventQueue::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
}

bool EventQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

// ── Helpers ─────────────────────────────────────────────────────

static std::string string_field(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    if (!j.is_object()) return {};
    for (const char* key : keys) {
        if (j.contains(key) && j[key].is_string())
            return j[key].get<std::string>();
    }
    return {};
}

static bool bool_field(const nlohmann::json& j, const char* key, bool fallback) {
    if (j.is_object() && j.contains(key) && j[key].is_boolean())
        return j[key].get<bool>();
    return fallback;
}

// ── SessionMultiplexer ──────────────────────────────────────────

SessionMultiplexer::SessionMultiplexer(const Config& config,
                                       EventBus& bus,
                                       TransportFactory factory,
                                       AgentApi* api)
    : config_(config), bus_(bus), factory_(std::move(factory)), api_(api) {}

SessionMultiplexer::~SessionMultiplexer() {
    std::map<std::string, std::unique_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
        active_id_.clear();
    }
    // Connection destructors join their reader threads here, while queue_ is alive
    sessions.clear();
}

void SessionMultiplexer::flush(Outbox& out) {
    for (auto& publish : out) publish();
    out.clear();
}

Session* SessionMultiplexer::find(const std::string& id) const {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.get();
}

Session& SessionMultiplexer::require(const std::string& id) const {
    Session* s = find(id);
    if (!s) throw SessionNotFound(id);
    return *s;
}

Session& SessionMultiplexer::require_active() const {
    if (active_id_.empty()) throw SessionNotFound("(none active)");
    return require(active_id_);
}

std::string SessionMultiplexer::create_session(SessionOptions options) {
    auto session = std::make_unique<Session>();
    session->id = generate_id();
    session->kind = options.kind;
    session->transport = options.transport.value_or(config_.transport_kind());
    session->definition_id = std::move(options.definition_id);
    session->conversation_id = std::move(options.conversation_id);
    session->server_session_id = std::move(options.server_session_id);
    session->restrictions = derive_restrictions(options.kind, options.server_config,
                                                config_.restriction_overrides(options.kind));
    if (!options.server_config.is_null()) session->template_config = options.server_config;

    std::string id = session->id;
    session->connection = std::make_unique<ConnectionManager>(
        factory_, config_.connection,
        [this, id](ProtocolEvent event) {
            QueueItem item;
            item.kind = QueueItem::Kind::Event;
            item.session_id = id;
            item.event = std::move(event);
            item.received_at_ms = monotonic_ms();
            queue_.push(std::move(item));
        },
        [this, id](const ConnectionNotice& notice) {
            QueueItem item;
            item.kind = QueueItem::Kind::Notice;
            item.session_id = id;
            item.notice = notice;
            item.received_at_ms = monotonic_ms();
            queue_.push(std::move(item));
        });

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[id] = std::move(session);
    return id;
}

Endpoint SessionMultiplexer::stream_endpoint(const Session& s) const {
    Endpoint endpoint;
    endpoint.kind = s.transport;
    endpoint.headers = config_.auth_headers();

    if (s.transport == TransportKind::DuplexSocket) {
        std::string query;
        if (!s.definition_id.empty())
            query += "definition_id=" + url_encode(s.definition_id);
        if (!s.conversation_id.empty()) {
            if (!query.empty()) query += "&";
            query += "conversation_id=" + url_encode(s.conversation_id);
        }
        endpoint.url = config_.socket_url("/chat/ws") + (query.empty() ? "" : "?" + query);
        return endpoint;
    }

    endpoint.method = "GET";
    endpoint.url = config_.api_url("/session/" + url_encode(s.server_session_id) + "/stream");
    return endpoint;
}

bool SessionMultiplexer::connect_session(const std::string& id) {
    Outbox out;
    bool opened = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Session& s = require(id);
        if (s.transport == TransportKind::RequestStream && s.server_session_id.empty()) {
            std::cerr << "[mux] Session " << id << " opens its stream with the first message\n";
            return false;
        }
        opened = s.connection->connect(stream_endpoint(s));
        if (opened) s.connection_lost = false;
        refresh_status(s, out);
    }
    flush(out);
    return opened;
}

void SessionMultiplexer::switch_to(const std::string& id) {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (id == active_id_) return;

        Session* current = find(active_id_);
        if (current && !current->restrictions.can_switch_sessions)
            throw SwitchDenied(current->id);
        Session& target = require(id);

        std::string previous = active_id_;
        if (current) background(*current, out);
        active_id_ = id;

        ActiveSessionChangedEvent changed;
        changed.session_id = id;
        changed.previous_id = previous;
        emit(out, std::move(changed));

        size_t replayed = target.event_buffer.size();
        while (!target.event_buffer.empty()) {
            BufferedEvent buffered = std::move(target.event_buffer.front());
            target.event_buffer.pop_front();
            handle_live(target, buffered.event, out);
        }
        if (replayed > 0)
            std::cerr << "[mux] Replayed " << replayed << " buffered events for " << id << "\n";
        refresh_status(target, out);
    }
    flush(out);
}

void SessionMultiplexer::deactivate() {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Session* current = find(active_id_);
        if (!current) return;
        if (!current->restrictions.can_switch_sessions)
            throw SwitchDenied(current->id);
        background(*current, out);

        ActiveSessionChangedEvent changed;
        changed.previous_id = active_id_;
        active_id_.clear();
        emit(out, std::move(changed));
    }
    flush(out);
}

void SessionMultiplexer::background(Session& s, Outbox& out) {
    set_status(s, SessionStatus::Background, out);
}

bool SessionMultiplexer::text_allowed(const Session& s) const {
    if (s.coordinator.state() == SuspendState::Terminated) return false;
    if (!s.restrictions.can_free_type_text) return false;
    // Reactive sessions take no free text while a widget is waiting
    if (s.kind == SessionKind::Reactive && s.coordinator.suspended()) return false;
    return true;
}

bool SessionMultiplexer::can_submit_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Session* s = find(active_id_);
    return s && text_allowed(*s);
}

void SessionMultiplexer::send_chat(Session& s, const std::string& text, Outbox& out) {
    if (s.transport == TransportKind::DuplexSocket) {
        if (s.connection->state() != ConnectionState::Open &&
            !s.connection->connect(stream_endpoint(s))) {
            throw TransportError("session " + s.id + " is not connected");
        }
        std::string message = text.empty() ? outbound::socket_start() : outbound::socket_message(text);
        if (!s.connection->send(message))
            throw TransportError("failed to send on session " + s.id);
    } else {
        Endpoint endpoint;
        endpoint.kind = TransportKind::RequestStream;
        endpoint.url = config_.api_url("/chat/send");
        endpoint.method = "POST";
        endpoint.body = outbound::chat_send_body(text, s.conversation_id, config_.model_id,
                                                 s.definition_id).dump();
        endpoint.headers = config_.auth_headers();

        // The previous exchange (or an idle session stream) gives way to this one
        if (!s.exchange_open && s.connection->state() != ConnectionState::Disconnected)
            s.connection->close();
        if (!s.connection->connect(endpoint))
            std::cerr << "[mux] Chat request for " << s.id << " not open yet, retrying\n";
    }

    s.exchange_open = true;
    s.exchange_failed = false;
    s.connection_lost = false;
    publish_update(s, s.accumulator.begin(), out);
}

void SessionMultiplexer::start_exchange(const std::string& text) {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Session& s = require_active();
        if (!text_allowed(s)) throw FreeTextDenied(s.id);

        send_chat(s, text, out);
        if (!text.empty()) {
            UserBubbleEvent bubble;
            bubble.session_id = s.id;
            bubble.content = text;
            out.insert(out.begin(), [this, bubble]() { bus_.publish(bubble); });
        }
        refresh_status(s, out);
    }
    flush(out);
}

void SessionMultiplexer::deliver_response(Session& s, const PendingAction& action,
                                          const nlohmann::json& value, Outbox& out) {
    if (s.transport == TransportKind::DuplexSocket) {
        if (!s.connection->send(outbound::socket_widget_response(action.action_id,
                                                                 action.widget_type, value)))
            throw TransportError("failed to send widget response on session " + s.id);
        return;
    }
    if (action.template_action) {
        send_chat(s, response_text(value), out);
        return;
    }
    if (!api_) throw TransportError("no API client for tool responses");
    const std::string& server_id = s.server_session_id.empty() ? s.conversation_id
                                                                : s.server_session_id;
    api_->submit_response(server_id, action.action_id, value);
}

void SessionMultiplexer::respond(Session& s, const std::string& action_id,
                                 const nlohmann::json& value, Outbox& out) {
    PendingAction action = s.coordinator.resolve(action_id);
    Outbox delivered;
    try {
        deliver_response(s, action, value, delivered);
    } catch (const std::exception&) {
        s.coordinator.restore(std::move(action));
        throw;
    }

    if (action.show_user_response_as_bubble) {
        UserBubbleEvent bubble;
        bubble.session_id = s.id;
        bubble.content = response_text(value);
        emit(out, std::move(bubble));
    }
    WidgetDismissedEvent dismissed;
    dismissed.session_id = s.id;
    dismissed.action_id = action.action_id;
    emit(out, std::move(dismissed));
    for (auto& publish : delivered) out.push_back(std::move(publish));
    refresh_status(s, out);
}

void SessionMultiplexer::submit_widget_response(const std::string& action_id,
                                                const nlohmann::json& value) {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        respond(require_active(), action_id, value, out);
    }
    flush(out);
}

bool SessionMultiplexer::cancel_current() {
    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Session* s = find(active_id_);
        if (!s || (!s->exchange_open && !s->accumulator.active())) return false;

        if (s->transport == TransportKind::DuplexSocket) {
            if (!s->connection->send(outbound::socket_cancel()))
                std::cerr << "[mux] Could not send cancel on " << s->id << "\n";
        } else if (api_ && !s->request_id.empty()) {
            try {
                api_->cancel_request(s->request_id);
            } catch (const std::exception& e) {
                std::cerr << "[mux] Cancel request failed: " << e.what() << "\n";
            }
        }

        publish_update(*s, s->accumulator.cancel(), out);
        s->exchange_open = false;
        if (s->transport == TransportKind::RequestStream) s->connection->close();
        refresh_status(*s, out);
    }
    flush(out);
    return true;
}

std::unique_ptr<Session> SessionMultiplexer::detach(const std::string& id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;
    std::unique_ptr<Session> session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

void SessionMultiplexer::end_session(std::unique_ptr<Session> session,
                                     const std::string& reason, Outbox& out) {
    session->connection->close();
    session->event_buffer.clear();

    SessionEndedEvent ended;
    ended.session_id = session->id;
    ended.reason = reason;
    emit(out, std::move(ended));
}

void SessionMultiplexer::terminate_session(const std::string& id) {
    Outbox out;
    std::unique_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Session& s = require(id);
        bool finished = s.coordinator.state() == SuspendState::Terminated;
        if (!s.restrictions.can_end_early && !finished) throw TerminateDenied(id);

        if (auto abandoned = s.coordinator.abandon()) {
            std::cerr << "[mux] Abandoned pending action " << abandoned->action_id << "\n";
            WidgetDismissedEvent dismissed;
            dismissed.session_id = id;
            dismissed.action_id = abandoned->action_id;
            emit(out, std::move(dismissed));
        }
        session = detach(id);
        if (active_id_ == id) {
            active_id_.clear();
            ActiveSessionChangedEvent changed;
            changed.previous_id = id;
            emit(out, std::move(changed));
        }
    }

    std::string server_id = session->server_session_id;
    end_session(std::move(session), "terminated", out);
    if (api_ && !server_id.empty()) {
        try {
            api_->terminate_session(server_id);
        } catch (const std::exception& e) {
            std::cerr << "[mux] Server terminate for " << server_id << " failed: " << e.what() << "\n";
        }
    }
    flush(out);
}

void SessionMultiplexer::close_all() {
    Outbox out;
    std::map<std::string, std::unique_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
        if (!active_id_.empty()) {
            ActiveSessionChangedEvent changed;
            changed.previous_id = active_id_;
            emit(out, std::move(changed));
            active_id_.clear();
        }
    }
    for (auto& entry : sessions) {
        entry.second->coordinator.abandon();
        end_session(std::move(entry.second), "logout", out);
    }
    flush(out);
}

std::string SessionMultiplexer::active_session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_id_;
}

std::vector<std::string> SessionMultiplexer::session_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) ids.push_back(entry.first);
    return ids;
}

std::optional<SessionInfo> SessionMultiplexer::session_info(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Session* s = find(id);
    if (!s) return std::nullopt;

    SessionInfo info;
    info.id = s->id;
    info.kind = s->kind;
    info.status = s->status;
    info.restrictions = s->restrictions;
    info.transport = s->transport;
    info.conversation_id = s->conversation_id;
    info.server_session_id = s->server_session_id;
    info.active_message = s->accumulator.active();
    info.pending_action = s->coordinator.pending();
    info.buffered_events = s->event_buffer.size();
    info.active = s->id == active_id_;
    return info;
}

// ── Queue consumer ──────────────────────────────────────────────

void SessionMultiplexer::post_event(const std::string& session_id, ProtocolEvent event) {
    QueueItem item;
    item.kind = QueueItem::Kind::Event;
    item.session_id = session_id;
    item.event = std::move(event);
    item.received_at_ms = monotonic_ms();
    queue_.push(std::move(item));
}

void SessionMultiplexer::post_notice(const std::string& session_id, const ConnectionNotice& notice) {
    QueueItem item;
    item.kind = QueueItem::Kind::Notice;
    item.session_id = session_id;
    item.notice = notice;
    item.received_at_ms = monotonic_ms();
    queue_.push(std::move(item));
}

size_t SessionMultiplexer::process_pending() {
    std::vector<QueueItem> items = queue_.pop_all();
    if (items.empty()) return 0;

    Outbox out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& item : items) {
            try {
                route(item, out);
            } catch (const std::exception& e) {
                std::cerr << "[mux] Failed to handle item for " << item.session_id
                          << ": " << e.what() << "\n";
            }
        }
    }
    flush(out);
    return items.size();
}

size_t SessionMultiplexer::wait_and_process(std::chrono::milliseconds timeout) {
    queue_.wait_for(timeout);
    return process_pending();
}

void SessionMultiplexer::route(QueueItem& item, Outbox& out) {
    Session* s = find(item.session_id);
    if (!s) {
        if (item.kind == QueueItem::Kind::Event)
            std::cerr << "[mux] Dropping " << event_type_name(item.event.type)
                      << " for closed session " << item.session_id << "\n";
        return;
    }

    switch (item.kind) {
        case QueueItem::Kind::WidgetResponse:
            respond(*s, item.action_id, item.value, out);
            return;
        case QueueItem::Kind::Notice:
            handle_notice(*s, item.notice, out);
            return;
        case QueueItem::Kind::Event:
            if (s->id == active_id_) {
                handle_live(*s, item.event, out);
                refresh_status(*s, out);
            } else {
                s->event_buffer.push_back({std::move(item.event), item.received_at_ms});
                set_status(*s, SessionStatus::Background, out);
            }
            return;
    }
}

void SessionMultiplexer::handle_notice(Session& s, const ConnectionNotice& notice, Outbox& out) {
    ConnectionStateChangedEvent changed;
    changed.session_id = s.id;
    changed.state = notice.state;
    changed.attempt = notice.attempt;
    changed.delay_ms = notice.delay_ms;

    switch (notice.kind) {
        case ConnectionNotice::Kind::StateChanged:
            if (notice.state == ConnectionState::Open) s.connection_lost = false;
            emit(out, std::move(changed));
            break;

        case ConnectionNotice::Kind::Reconnecting:
            emit(out, std::move(changed));
            break;

        case ConnectionNotice::Kind::GaveUp: {
            s.connection_lost = true;
            s.exchange_open = false;
            if (auto pending = s.coordinator.pending()) {
                WidgetDismissedEvent dismissed;
                dismissed.session_id = s.id;
                dismissed.action_id = pending->action_id;
                emit(out, std::move(dismissed));
            }
            s.coordinator.clear();
            changed.gave_up = true;
            emit(out, std::move(changed));
            break;
        }

        case ConnectionNotice::Kind::AuthFailed:
        case ConnectionNotice::Kind::RateLimited: {
            // Rejected opens take the same path as in-band errors, in order
            QueueItem item;
            item.kind = QueueItem::Kind::Event;
            item.session_id = s.id;
            item.received_at_ms = monotonic_ms();
            item.event.type = EventType::Error;
            item.event.payload = {
                {"error_code", notice.kind == ConnectionNotice::Kind::AuthFailed
                                   ? "unauthorized" : "rate_limited"},
                {"error", notice.detail},
            };
            route(item, out);
            return;
        }
    }
    refresh_status(s, out);
}

void SessionMultiplexer::handle_live(Session& s, const ProtocolEvent& event, Outbox& out) {
    const nlohmann::json& payload = event.payload;

    switch (event.type) {
        case EventType::StreamStarted: {
            std::string request_id = string_field(payload, {"request_id"});
            if (!request_id.empty()) s.request_id = request_id;
            std::string conversation_id = string_field(payload, {"conversation_id"});
            if (!conversation_id.empty()) s.conversation_id = conversation_id;
            s.exchange_open = true;
            s.exchange_failed = false;
            publish_update(s, s.accumulator.apply(event), out);
            return;
        }

        case EventType::AssistantThinking:
        case EventType::ContentChunk:
        case EventType::ToolCallsDetected:
        case EventType::ToolExecuting:
        case EventType::ToolResult:
            publish_update(s, s.accumulator.apply(event), out);
            return;

        case EventType::MessageComplete:
            publish_update(s, s.accumulator.apply(event), out);
            // Sockets have no stream end; the exchange ends with its last message
            if (s.transport == TransportKind::DuplexSocket && !s.accumulator.active())
                s.exchange_open = false;
            return;

        case EventType::MessageAdded: {
            const nlohmann::json& body = payload.is_object() && payload.contains("message")
                ? payload["message"] : payload;
            StreamingMessage message = message_from_json(body);
            if (message.role == "user") {
                UserBubbleEvent bubble;
                bubble.session_id = s.id;
                bubble.content = message.content;
                emit(out, std::move(bubble));
            } else if (!message.content.empty() || message.has_tool_data()) {
                MessageFinalizedEvent finalized;
                finalized.session_id = s.id;
                finalized.message = std::move(message);
                emit(out, std::move(finalized));
            }
            return;
        }

        case EventType::StreamComplete:
            if (!s.exchange_open && !s.accumulator.active() && !s.accumulator.has_pending_tool_data())
                return;
            publish_update(s, s.accumulator.end_stream(), out);
            s.exchange_open = false;
            return;

        case EventType::SessionCompleted: {
            if (s.coordinator.state() == SuspendState::Terminated) return;
            publish_update(s, s.accumulator.end_stream(), out);
            s.exchange_open = false;
            if (auto abandoned = s.coordinator.abandon()) {
                WidgetDismissedEvent dismissed;
                dismissed.session_id = s.id;
                dismissed.action_id = abandoned->action_id;
                emit(out, std::move(dismissed));
            }
            s.connection->close();

            SessionEndedEvent ended;
            ended.session_id = s.id;
            ended.reason = "completed";
            emit(out, std::move(ended));
            return;
        }

        case EventType::Cancelled:
            publish_update(s, s.accumulator.apply(event), out);
            s.exchange_open = false;
            return;

        case EventType::Error:
            handle_error(s, payload, out);
            return;

        case EventType::ClientAction:
            handle_action(s, payload, false, out);
            return;

        case EventType::RunSuspended:
            handle_action(s, payload, true, out);
            return;

        case EventType::RunResumed:
            if (auto cleared = s.coordinator.on_run_resumed()) {
                WidgetDismissedEvent dismissed;
                dismissed.session_id = s.id;
                dismissed.action_id = *cleared;
                emit(out, std::move(dismissed));
            }
            return;

        case EventType::State:
            if (payload.is_object() && payload.contains("restrictions"))
                update_restrictions(s, payload["restrictions"], out);
            if (payload.is_object() && payload.contains("pending_action") &&
                !payload["pending_action"].is_null())
                handle_action(s, payload["pending_action"], false, out);
            return;

        case EventType::Connected: {
            std::string session_id = string_field(payload, {"session_id"});
            if (!session_id.empty()) s.server_session_id = session_id;
            std::string conversation_id = string_field(payload, {"conversation_id"});
            if (!conversation_id.empty()) s.conversation_id = conversation_id;
            if (payload.is_object() && payload.contains("restrictions"))
                update_restrictions(s, payload["restrictions"], out);
            return;
        }

        case EventType::TemplateConfig: {
            s.template_config = payload;
            const nlohmann::json& config = payload.is_object() && payload.contains("config")
                ? payload["config"] : payload;
            nlohmann::json update = nlohmann::json::object();
            if (config.is_object() && config.contains("restrictions") && config["restrictions"].is_object())
                update = config["restrictions"];
            if (config.is_object() && config.contains("allow_navigation") &&
                config["allow_navigation"].is_boolean()) {
                bool allow = config["allow_navigation"].get<bool>();
                update["can_switch_sessions"] = allow;
                update["can_access_history"] = allow;
            }
            update_restrictions(s, update, out);
            return;
        }

        case EventType::TemplateProgress: {
            s.template_progress = payload;
            nlohmann::json update = nlohmann::json::object();
            if (payload.is_object() && payload.contains("restrictions") && payload["restrictions"].is_object())
                update = payload["restrictions"];
            if (payload.is_object() && payload.contains("enable_chat_input") &&
                payload["enable_chat_input"].is_boolean())
                update["can_free_type_text"] = payload["enable_chat_input"].get<bool>();
            update_restrictions(s, update, out);

            TemplateProgressEvent progress;
            progress.session_id = s.id;
            progress.progress = payload;
            emit(out, std::move(progress));
            return;
        }

        case EventType::TemplateComplete: {
            publish_update(s, s.accumulator.end_stream(), out);
            s.exchange_open = false;
            bool carry_on = bool_field(payload, "continue_after_completion", true);
            if (!carry_on) update_restrictions(s, {{"can_free_type_text", false}}, out);

            TemplateCompleteEvent complete;
            complete.session_id = s.id;
            complete.summary = payload;
            complete.continue_after_completion = carry_on;
            emit(out, std::move(complete));
            return;
        }

        case EventType::Heartbeat:
        case EventType::Pong:
            return;
    }
}

void SessionMultiplexer::handle_error(Session& s, const nlohmann::json& payload, Outbox& out) {
    std::string code = error_code_of(payload);
    std::string message = string_field(payload, {"error", "message", "detail"});
    if (payload.is_string()) message = payload.get<std::string>();

    if (auto pending = s.coordinator.pending()) {
        WidgetDismissedEvent dismissed;
        dismissed.session_id = s.id;
        dismissed.action_id = pending->action_id;
        emit(out, std::move(dismissed));
    }
    s.coordinator.clear();
    s.exchange_open = false;

    if (is_auth_error_code(code)) {
        std::cerr << "[mux] Session " << s.id << " lost authorization: " << message << "\n";
        const auto& active = s.accumulator.active();
        std::string placeholder = active && !trim(active->content).empty()
            ? active->content : kSessionExpiredPlaceholder;
        publish_update(s, s.accumulator.fail(placeholder), out);
        s.exchange_failed = true;
        s.connection->close();

        TokenExpiredEvent expired;
        expired.session_id = s.id;
        expired.detail = message;
        emit(out, std::move(expired));
        return;
    }

    if (code == "rate_limited") {
        std::cerr << "[mux] Session " << s.id << " rate limited: " << message << "\n";
        s.accumulator.discard();
        if (s.transport == TransportKind::RequestStream) s.connection->close();

        RateLimitedEvent limited;
        limited.session_id = s.id;
        limited.detail = message;
        emit(out, std::move(limited));
        return;
    }

    std::cerr << "[mux] Session " << s.id << " error: " << (message.empty() ? code : message) << "\n";
    publish_update(s, s.accumulator.fail("_Error: " + (message.empty() ? code : message) + "_"), out);
    s.exchange_failed = true;
    // The server ends a request stream after an error; do not re-issue it
    if (s.transport == TransportKind::RequestStream) s.connection->close();
}

void SessionMultiplexer::handle_action(Session& s, const nlohmann::json& payload,
                                       bool run_suspended, Outbox& out) {
    SuspendOutcome outcome = run_suspended ? s.coordinator.on_run_suspended(payload)
                                           : s.coordinator.on_client_action(payload);
    if (outcome != SuspendOutcome::Created) return;

    // Text streamed before the widget stays above it
    if (s.accumulator.active())
        publish_update(s, s.accumulator.apply({EventType::MessageComplete, nlohmann::json::object()}), out);

    const PendingAction& action = *s.coordinator.pending();
    std::string session_id = s.id;

    WidgetRequestedEvent requested;
    requested.session_id = session_id;
    requested.action = action;
    requested.responder = WidgetResponder(action.action_id,
        [this, session_id](const std::string& action_id, nlohmann::json value) {
            QueueItem item;
            item.kind = QueueItem::Kind::WidgetResponse;
            item.session_id = session_id;
            item.action_id = action_id;
            item.value = std::move(value);
            item.received_at_ms = monotonic_ms();
            queue_.push(std::move(item));
        });
    emit(out, std::move(requested));
}

void SessionMultiplexer::update_restrictions(Session& s, const nlohmann::json& update, Outbox& out) {
    if (!apply_restriction_update(s.restrictions, update)) return;

    RestrictionsChangedEvent changed;
    changed.session_id = s.id;
    changed.restrictions = s.restrictions;
    emit(out, std::move(changed));
}

void SessionMultiplexer::publish_update(Session& s, const AccumulatorUpdate& update, Outbox& out) {
    for (const auto& message : update.finished) {
        MessageFinalizedEvent finalized;
        finalized.session_id = s.id;
        finalized.message = message;
        emit(out, std::move(finalized));
    }
    if (update.changed && s.accumulator.active()) {
        MessageUpdatedEvent updated;
        updated.session_id = s.id;
        updated.message = *s.accumulator.active();
        emit(out, std::move(updated));
    }
}

void SessionMultiplexer::set_status(Session& s, SessionStatus status, Outbox& out) {
    if (s.status == status) return;
    s.status = status;

    SessionStatusChangedEvent changed;
    changed.session_id = s.id;
    changed.status = status;
    emit(out, std::move(changed));
}

void SessionMultiplexer::refresh_status(Session& s, Outbox& out) {
    if (s.id == active_id_)
        set_status(s, s.foreground_status(), out);
    else if (s.status != SessionStatus::Idle || !s.event_buffer.empty())
        set_status(s, SessionStatus::Background, out);
}

} // namespace agentlink
