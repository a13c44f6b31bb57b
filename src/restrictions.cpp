#include "restrictions.hpp"

namespace agentlink {

const char* session_kind_name(SessionKind kind) {
    switch (kind) {
        case SessionKind::Reactive:  return "reactive";
        case SessionKind::Proactive: return "proactive";
    }
    return "unknown";
}

RestrictionSet default_restrictions(SessionKind kind) {
    switch (kind) {
        case SessionKind::Reactive:
            return RestrictionSet{true, true, true, true};
        case SessionKind::Proactive:
            return RestrictionSet{false, false, false, false};
    }
    return RestrictionSet{};
}

// Server configs use either spelling.
static void read_flag(const nlohmann::json& j, const char* snake, const char* camel, bool& out) {
    for (const char* key : {snake, camel}) {
        if (j.contains(key) && j[key].is_boolean()) {
            out = j[key].get<bool>();
            return;
        }
    }
}

bool apply_restriction_update(RestrictionSet& set, const nlohmann::json& update) {
    if (!update.is_object()) return false;
    RestrictionSet before = set;
    read_flag(update, "can_switch_sessions", "canSwitchAgents", set.can_switch_sessions);
    read_flag(update, "can_access_history", "canAccessConversations", set.can_access_history);
    read_flag(update, "can_free_type_text", "canTypeFreeText", set.can_free_type_text);
    read_flag(update, "can_end_early", "canEndEarly", set.can_end_early);
    return set != before;
}

RestrictionSet derive_restrictions(SessionKind kind,
                                   const nlohmann::json& server_config,
                                   const nlohmann::json& local_overrides) {
    RestrictionSet set = default_restrictions(kind);
    apply_restriction_update(set, local_overrides);
    if (server_config.is_object() && server_config.contains("restrictions"))
        apply_restriction_update(set, server_config["restrictions"]);
    return set;
}

nlohmann::json to_json(const RestrictionSet& set) {
    return {
        {"can_switch_sessions", set.can_switch_sessions},
        {"can_access_history", set.can_access_history},
        {"can_free_type_text", set.can_free_type_text},
        {"can_end_early", set.can_end_early}
    };
}

} // namespace agentlink
