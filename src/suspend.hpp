#pragma once
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

namespace agentlink {

struct PendingAction {
    std::string action_id;
    std::string widget_type;
    nlohmann::json props;                     // passed through to the renderer
    bool show_user_response_as_bubble = true;
    bool template_action = false;             // answered as a chat message
};

// Reads a pending action from a client_action / widget / state payload.
// Returns nullopt if the payload does not describe one.
std::optional<PendingAction> parse_pending_action(const nlohmann::json& payload);

// One-shot channel back from the renderer. Copies share the same slot, so
// only the first respond() across all copies is delivered.
class WidgetResponder {
public:
    using Deliver = std::function<void(const std::string& action_id, nlohmann::json value)>;

    WidgetResponder() = default;
    WidgetResponder(std::string action_id, Deliver deliver);

    // Throws AlreadyResolved on every call after the first.
    void respond(nlohmann::json value) const;

    bool used() const;
    const std::string& action_id() const { return action_id_; }

private:
    struct Slot;
    std::string action_id_;
    std::shared_ptr<Slot> slot_;
};

enum class SuspendState { Running, Suspended, Terminated };

const char* suspend_state_name(SuspendState state);

enum class SuspendOutcome {
    Created,   // new pending action
    Duplicate, // one already pending, or this id was already resolved
    NoAction,  // payload carried no action
    Rejected,  // session terminated
};

// Per-session suspend/resume state. Holds at most one pending action and
// remembers which actions have been resolved.
class SuspendCoordinator {
public:
    // A server request for structured input. Duplicates are logged and ignored.
    SuspendOutcome on_client_action(const nlohmann::json& payload);

    // Server marked the run paused; creates an action if the payload has one.
    SuspendOutcome on_run_suspended(const nlohmann::json& payload);

    // Server confirmed the run continues. Clears any pending action.
    // Returns the cleared action id, if there was one.
    std::optional<std::string> on_run_resumed();

    // Programmatic suspension. Throws DuplicateSuspension if one is pending.
    void suspend(PendingAction action);

    // Accept the single response for `action_id` and return the action it
    // resolves. Throws AlreadyResolved or UnknownAction.
    PendingAction resolve(const std::string& action_id);

    // Undo a resolve() whose response could not be delivered.
    void restore(PendingAction action);

    // Session ended: pending action abandoned, no further suspension.
    std::optional<PendingAction> abandon();

    // After an error: back to running with nothing pending.
    void clear();

    SuspendState state() const { return state_; }
    bool suspended() const { return state_ == SuspendState::Suspended; }
    const std::optional<PendingAction>& pending() const { return pending_; }
    bool was_resolved(const std::string& action_id) const { return resolved_.count(action_id) > 0; }

private:
    std::optional<PendingAction> pending_;
    std::unordered_set<std::string> resolved_;
    SuspendState state_ = SuspendState::Running;
};

} // namespace agentlink
