#include <catch2/catch.hpp>
#include "suspend.hpp"
#include "errors.hpp"

using namespace agentlink;

static nlohmann::json widget_action(const std::string& id, const std::string& type = "multiple_choice") {
    return {{"actionId", id}, {"widgetType", type}};
}

// ── parse_pending_action ────────────────────────────────────────

TEST_CASE("parse_pending_action: flat form", "[suspend]") {
    auto a = parse_pending_action({{"actionId", "x1"}, {"widgetType", "multiple_choice"},
                                   {"options", {"a", "b"}}});
    REQUIRE(a.has_value());
    REQUIRE(a->action_id == "x1");
    REQUIRE(a->widget_type == "multiple_choice");
    REQUIRE(a->props["options"].size() == 2);
    REQUIRE(a->show_user_response_as_bubble);
    REQUIRE_FALSE(a->template_action);
}

TEST_CASE("parse_pending_action: tool-call form", "[suspend]") {
    auto a = parse_pending_action({
        {"action", {{"tool_call_id", "call-9"}, {"widget_type", "form"},
                    {"props", {{"fields", 3}}}, {"show_user_response", false}}}
    });
    REQUIRE(a.has_value());
    REQUIRE(a->action_id == "call-9");
    REQUIRE(a->widget_type == "form");
    REQUIRE(a->props["fields"] == 3);
    REQUIRE_FALSE(a->show_user_response_as_bubble);
}

TEST_CASE("parse_pending_action: template widget", "[suspend]") {
    auto a = parse_pending_action({{"action_type", "widget"}, {"item_id", "step-2"},
                                   {"widget_type", "slider"}});
    REQUIRE(a.has_value());
    REQUIRE(a->template_action);
    REQUIRE(a->action_id == "step-2");
}

TEST_CASE("parse_pending_action: missing id and type get defaults", "[suspend]") {
    auto a = parse_pending_action({{"action", {{"label", "ok"}}}});
    REQUIRE(a.has_value());
    REQUIRE_FALSE(a->action_id.empty());
    REQUIRE(a->widget_type == "message");
}

TEST_CASE("parse_pending_action: non-action payloads", "[suspend]") {
    REQUIRE_FALSE(parse_pending_action(nullptr).has_value());
    REQUIRE_FALSE(parse_pending_action({{"content", "hi"}}).has_value());
    REQUIRE_FALSE(parse_pending_action("text").has_value());
}

// ── Coordinator ─────────────────────────────────────────────────

TEST_CASE("SuspendCoordinator: client action suspends the run", "[suspend]") {
    SuspendCoordinator c;
    REQUIRE(c.on_client_action(widget_action("x1")) == SuspendOutcome::Created);
    REQUIRE(c.state() == SuspendState::Suspended);
    REQUIRE(c.pending()->action_id == "x1");
}

TEST_CASE("SuspendCoordinator: second action while pending is ignored", "[suspend]") {
    SuspendCoordinator c;
    c.on_client_action(widget_action("x1"));
    REQUIRE(c.on_client_action(widget_action("x2")) == SuspendOutcome::Duplicate);
    REQUIRE(c.pending()->action_id == "x1");
}

TEST_CASE("SuspendCoordinator: run_resumed clears without a response", "[suspend]") {
    SuspendCoordinator c;
    c.on_client_action(widget_action("x1"));

    auto cleared = c.on_run_resumed();
    REQUIRE(cleared == std::optional<std::string>("x1"));
    REQUIRE_FALSE(c.pending().has_value());
    REQUIRE(c.state() == SuspendState::Running);

    // A late response for the cleared action is rejected
    REQUIRE_THROWS_AS(c.resolve("x1"), AlreadyResolved);
    // So is a replay of the same action
    REQUIRE(c.on_client_action(widget_action("x1")) == SuspendOutcome::Duplicate);
}

TEST_CASE("SuspendCoordinator: resolve exactly once", "[suspend]") {
    SuspendCoordinator c;
    c.on_client_action(widget_action("x1", "text_input"));

    PendingAction a = c.resolve("x1");
    REQUIRE(a.widget_type == "text_input");
    REQUIRE(c.state() == SuspendState::Running);
    REQUIRE(c.was_resolved("x1"));
    REQUIRE_THROWS_AS(c.resolve("x1"), AlreadyResolved);
}

TEST_CASE("SuspendCoordinator: resolve of an unknown id", "[suspend]") {
    SuspendCoordinator c;
    REQUIRE_THROWS_AS(c.resolve("nope"), UnknownAction);
    c.on_client_action(widget_action("x1"));
    REQUIRE_THROWS_AS(c.resolve("x2"), UnknownAction);
    REQUIRE(c.pending()->action_id == "x1");
}

TEST_CASE("SuspendCoordinator: restore undoes a resolve", "[suspend]") {
    SuspendCoordinator c;
    c.on_client_action(widget_action("x1"));
    PendingAction a = c.resolve("x1");
    c.restore(a);
    REQUIRE(c.suspended());
    REQUIRE_FALSE(c.was_resolved("x1"));
    REQUIRE_NOTHROW(c.resolve("x1"));
}

TEST_CASE("SuspendCoordinator: programmatic suspend rejects a second", "[suspend]") {
    SuspendCoordinator c;
    PendingAction a;
    a.action_id = "p1";
    c.suspend(a);
    PendingAction b;
    b.action_id = "p2";
    REQUIRE_THROWS_AS(c.suspend(b), DuplicateSuspension);
    REQUIRE(c.pending()->action_id == "p1");
}

TEST_CASE("SuspendCoordinator: run_suspended with nested pending action", "[suspend]") {
    SuspendCoordinator c;
    auto outcome = c.on_run_suspended({{"pending_action", widget_action("x7")}});
    REQUIRE(outcome == SuspendOutcome::Created);
    REQUIRE(c.pending()->action_id == "x7");
}

TEST_CASE("SuspendCoordinator: bare run_suspended still suspends", "[suspend]") {
    SuspendCoordinator c;
    REQUIRE(c.on_run_suspended(nlohmann::json::object()) == SuspendOutcome::NoAction);
    REQUIRE(c.suspended());
    REQUIRE_FALSE(c.pending().has_value());
}

TEST_CASE("SuspendCoordinator: abandon terminates", "[suspend]") {
    SuspendCoordinator c;
    c.on_client_action(widget_action("x1"));
    auto abandoned = c.abandon();
    REQUIRE(abandoned.has_value());
    REQUIRE(abandoned->action_id == "x1");
    REQUIRE(c.state() == SuspendState::Terminated);

    REQUIRE(c.on_client_action(widget_action("x2")) == SuspendOutcome::Rejected);
    REQUIRE_THROWS_AS(c.resolve("x1"), AlreadyResolved);
    c.on_run_resumed();
    REQUIRE(c.state() == SuspendState::Terminated);
}

TEST_CASE("SuspendCoordinator: clear after an error", "[suspend]") {
    SuspendCoordinator c;
    c.on_client_action(widget_action("x1"));
    c.clear();
    REQUIRE(c.state() == SuspendState::Running);
    REQUIRE_FALSE(c.pending().has_value());
    REQUIRE(c.on_client_action(widget_action("x2")) == SuspendOutcome::Created);
}

// ── WidgetResponder ─────────────────────────────────────────────

TEST_CASE("WidgetResponder: delivers once across copies", "[suspend]") {
    int calls = 0;
    std::string seen_id;
    WidgetResponder r("x1", [&](const std::string& id, nlohmann::json) {
        calls++;
        seen_id = id;
    });
    WidgetResponder copy = r;

    REQUIRE_FALSE(r.used());
    r.respond({{"selectedOptions", {"a"}}});
    REQUIRE(calls == 1);
    REQUIRE(seen_id == "x1");
    REQUIRE(copy.used());
    REQUIRE_THROWS_AS(copy.respond(nullptr), AlreadyResolved);
    REQUIRE(calls == 1);
}

TEST_CASE("WidgetResponder: default responder is spent", "[suspend]") {
    WidgetResponder r;
    REQUIRE(r.used());
    REQUIRE_THROWS_AS(r.respond(nullptr), AlreadyResolved);
}

TEST_CASE("suspend_state_name: names", "[suspend]") {
    REQUIRE(std::string(suspend_state_name(SuspendState::Suspended)) == "suspended");
}
