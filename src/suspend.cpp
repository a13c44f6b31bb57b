#include "suspend.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <atomic>
#include <initializer_list>
#include <iostream>

namespace agentlink {

const char* suspend_state_name(SuspendState state) {
    switch (state) {
        case SuspendState::Running:    return "running";
        case SuspendState::Suspended:  return "suspended";
        case SuspendState::Terminated: return "terminated";
    }
    return "unknown";
}

static std::string first_string(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty())
            return j[key].get<std::string>();
    }
    return {};
}

std::optional<PendingAction> parse_pending_action(const nlohmann::json& payload) {
    if (!payload.is_object()) return std::nullopt;

    PendingAction action;
    if (payload.contains("action") && payload["action"].is_object()) {
        // Tool-call form: the agent is blocked on a client tool
        const auto& a = payload["action"];
        action.action_id = first_string(a, {"tool_call_id", "action_id", "actionId", "id"});
        if (action.action_id.empty())
            action.action_id = first_string(payload, {"tool_call_id", "action_id", "actionId"});
        action.widget_type = first_string(a, {"widget_type", "widgetType", "type", "name"});
        action.props = a.contains("props") ? a["props"] : a;
        if (a.contains("show_user_response") && a["show_user_response"].is_boolean())
            action.show_user_response_as_bubble = a["show_user_response"].get<bool>();
    } else if (payload.contains("widget_type") || payload.contains("widgetType") ||
               first_string(payload, {"action_type"}) == "widget") {
        // Flat form; template widgets carry action_type or a content item id
        action.template_action = first_string(payload, {"action_type"}) == "widget" ||
                                 payload.contains("item_id") || payload.contains("content_id");
        action.action_id = first_string(payload, {"tool_call_id", "action_id", "actionId",
                                                  "item_id", "content_id"});
        action.widget_type = first_string(payload, {"widget_type", "widgetType"});
        action.props = payload;
        if (payload.contains("show_user_response") && payload["show_user_response"].is_boolean())
            action.show_user_response_as_bubble = payload["show_user_response"].get<bool>();
    } else {
        return std::nullopt;
    }

    if (action.widget_type.empty()) action.widget_type = "message";
    if (action.action_id.empty()) action.action_id = generate_id();
    return action;
}

// ── WidgetResponder ─────────────────────────────────────────────

struct WidgetResponder::Slot {
    std::atomic<bool> used{false};
    Deliver deliver;
};

WidgetResponder::WidgetResponder(std::string action_id, Deliver deliver)
    : action_id_(std::move(action_id)), slot_(std::make_shared<Slot>()) {
    slot_->deliver = std::move(deliver);
}

void WidgetResponder::respond(nlohmann::json value) const {
    if (!slot_ || slot_->used.exchange(true))
        throw AlreadyResolved(action_id_);
    if (slot_->deliver) slot_->deliver(action_id_, std::move(value));
}

bool WidgetResponder::used() const {
    return !slot_ || slot_->used.load();
}

// ── SuspendCoordinator ──────────────────────────────────────────

SuspendOutcome SuspendCoordinator::on_client_action(const nlohmann::json& payload) {
    if (state_ == SuspendState::Terminated) {
        std::cerr << "[suspend] Ignoring action for a terminated session\n";
        return SuspendOutcome::Rejected;
    }
    auto action = parse_pending_action(payload);
    if (!action) return SuspendOutcome::NoAction;

    if (pending_) {
        std::cerr << "[suspend] Action " << action->action_id << " ignored: "
                  << pending_->action_id << " is still pending\n";
        return SuspendOutcome::Duplicate;
    }
    if (resolved_.count(action->action_id)) {
        std::cerr << "[suspend] Action " << action->action_id << " was already resolved\n";
        return SuspendOutcome::Duplicate;
    }
    pending_ = std::move(*action);
    state_ = SuspendState::Suspended;
    return SuspendOutcome::Created;
}

SuspendOutcome SuspendCoordinator::on_run_suspended(const nlohmann::json& payload) {
    if (state_ == SuspendState::Terminated) return SuspendOutcome::Rejected;
    if (payload.is_object() && payload.contains("pending_action"))
        return on_client_action(payload["pending_action"]);
    SuspendOutcome outcome = on_client_action(payload);
    if (outcome == SuspendOutcome::NoAction) state_ = SuspendState::Suspended;
    return outcome;
}

std::optional<std::string> SuspendCoordinator::on_run_resumed() {
    std::optional<std::string> cleared;
    if (pending_) {
        cleared = pending_->action_id;
        resolved_.insert(pending_->action_id);
        pending_.reset();
    }
    if (state_ != SuspendState::Terminated) state_ = SuspendState::Running;
    return cleared;
}

void SuspendCoordinator::suspend(PendingAction action) {
    if (pending_) throw DuplicateSuspension(pending_->action_id);
    if (state_ == SuspendState::Terminated)
        throw ProtocolViolation("cannot suspend a terminated session");
    pending_ = std::move(action);
    state_ = SuspendState::Suspended;
}

PendingAction SuspendCoordinator::resolve(const std::string& action_id) {
    if (resolved_.count(action_id)) throw AlreadyResolved(action_id);
    if (!pending_ || pending_->action_id != action_id) throw UnknownAction(action_id);

    PendingAction action = std::move(*pending_);
    pending_.reset();
    resolved_.insert(action_id);
    state_ = SuspendState::Running;
    return action;
}

void SuspendCoordinator::restore(PendingAction action) {
    resolved_.erase(action.action_id);
    pending_ = std::move(action);
    state_ = SuspendState::Suspended;
}

std::optional<PendingAction> SuspendCoordinator::abandon() {
    std::optional<PendingAction> abandoned = std::move(pending_);
    pending_.reset();
    if (abandoned) resolved_.insert(abandoned->action_id);
    state_ = SuspendState::Terminated;
    return abandoned;
}

void SuspendCoordinator::clear() {
    if (pending_) {
        resolved_.insert(pending_->action_id);
        pending_.reset();
    }
    if (state_ != SuspendState::Terminated) state_ = SuspendState::Running;
}

} // namespace agentlink
