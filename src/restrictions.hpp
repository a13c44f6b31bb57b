#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace agentlink {

enum class SessionKind { Reactive, Proactive };

const char* session_kind_name(SessionKind kind);

struct RestrictionSet {
    bool can_switch_sessions = true;
    bool can_access_history = true;
    bool can_free_type_text = true;
    bool can_end_early = true;

    bool operator==(const RestrictionSet& o) const {
        return can_switch_sessions == o.can_switch_sessions &&
               can_access_history == o.can_access_history &&
               can_free_type_text == o.can_free_type_text &&
               can_end_early == o.can_end_early;
    }
    bool operator!=(const RestrictionSet& o) const { return !(*this == o); }
};

// Reactive sessions allow everything; proactive (templated) ones nothing.
RestrictionSet default_restrictions(SessionKind kind);

// Defaults for the kind, then each object's `restrictions` overrides in
// order. Either argument may be null.
RestrictionSet derive_restrictions(SessionKind kind,
                                   const nlohmann::json& server_config,
                                   const nlohmann::json& local_overrides = nullptr);

// Applies the flags present in `update`. Returns true if anything changed.
bool apply_restriction_update(RestrictionSet& set, const nlohmann::json& update);

nlohmann::json to_json(const RestrictionSet& set);

} // namespace agentlink
