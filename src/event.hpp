#pragma once
#include "accumulator.hpp"
#include "connection.hpp"
#include "restrictions.hpp"
#include "session.hpp"
#include "suspend.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace agentlink {

// Tag-based event dispatch, no RTTI.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* MessageUpdated         = "MessageUpdated";
    constexpr const char* MessageFinalized       = "MessageFinalized";
    constexpr const char* UserBubble             = "UserBubble";
    constexpr const char* WidgetRequested        = "WidgetRequested";
    constexpr const char* WidgetDismissed        = "WidgetDismissed";
    constexpr const char* SessionStatusChanged   = "SessionStatusChanged";
    constexpr const char* ActiveSessionChanged   = "ActiveSessionChanged";
    constexpr const char* RestrictionsChanged    = "RestrictionsChanged";
    constexpr const char* ConnectionStateChanged = "ConnectionStateChanged";
    constexpr const char* TokenExpired           = "TokenExpired";
    constexpr const char* RateLimited            = "RateLimited";
    constexpr const char* TemplateProgress       = "TemplateProgress";
    constexpr const char* TemplateComplete       = "TemplateComplete";
    constexpr const char* SessionEnded           = "SessionEnded";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// The in-progress message changed (chunk, tool call, tool result).
struct MessageUpdatedEvent : Event {
    static constexpr const char* TAG = event_tags::MessageUpdated;
    std::string session_id;
    StreamingMessage message;

    MessageUpdatedEvent() { type_tag = TAG; }
};

// A message reached complete/error/cancelled and left the session.
struct MessageFinalizedEvent : Event {
    static constexpr const char* TAG = event_tags::MessageFinalized;
    std::string session_id;
    StreamingMessage message;

    MessageFinalizedEvent() { type_tag = TAG; }
};

struct UserBubbleEvent : Event {
    static constexpr const char* TAG = event_tags::UserBubble;
    std::string session_id;
    std::string content;

    UserBubbleEvent() { type_tag = TAG; }
};

// Paint a widget; answer through `responder` exactly once.
struct WidgetRequestedEvent : Event {
    static constexpr const char* TAG = event_tags::WidgetRequested;
    std::string session_id;
    PendingAction action;
    WidgetResponder responder;

    WidgetRequestedEvent() { type_tag = TAG; }
};

struct WidgetDismissedEvent : Event {
    static constexpr const char* TAG = event_tags::WidgetDismissed;
    std::string session_id;
    std::string action_id;

    WidgetDismissedEvent() { type_tag = TAG; }
};

struct SessionStatusChangedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionStatusChanged;
    std::string session_id;
    SessionStatus status = SessionStatus::Idle;

    SessionStatusChangedEvent() { type_tag = TAG; }
};

struct ActiveSessionChangedEvent : Event {
    static constexpr const char* TAG = event_tags::ActiveSessionChanged;
    std::string session_id; // empty = no active session
    std::string previous_id;

    ActiveSessionChangedEvent() { type_tag = TAG; }
};

struct RestrictionsChangedEvent : Event {
    static constexpr const char* TAG = event_tags::RestrictionsChanged;
    std::string session_id;
    RestrictionSet restrictions;

    RestrictionsChangedEvent() { type_tag = TAG; }
};

struct ConnectionStateChangedEvent : Event {
    static constexpr const char* TAG = event_tags::ConnectionStateChanged;
    std::string session_id;
    ConnectionState state = ConnectionState::Disconnected;
    uint32_t attempt = 0;
    uint32_t delay_ms = 0;
    bool gave_up = false;

    ConnectionStateChangedEvent() { type_tag = TAG; }
};

// Auth collaborator: credentials are no longer accepted.
struct TokenExpiredEvent : Event {
    static constexpr const char* TAG = event_tags::TokenExpired;
    std::string session_id;
    std::string detail;

    TokenExpiredEvent() { type_tag = TAG; }
};

struct RateLimitedEvent : Event {
    static constexpr const char* TAG = event_tags::RateLimited;
    std::string session_id;
    std::string detail;

    RateLimitedEvent() { type_tag = TAG; }
};

struct TemplateProgressEvent : Event {
    static constexpr const char* TAG = event_tags::TemplateProgress;
    std::string session_id;
    nlohmann::json progress;

    TemplateProgressEvent() { type_tag = TAG; }
};

struct TemplateCompleteEvent : Event {
    static constexpr const char* TAG = event_tags::TemplateComplete;
    std::string session_id;
    nlohmann::json summary;
    bool continue_after_completion = false;

    TemplateCompleteEvent() { type_tag = TAG; }
};

struct SessionEndedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionEnded;
    std::string session_id;
    std::string reason;

    SessionEndedEvent() { type_tag = TAG; }
};

} // namespace agentlink
