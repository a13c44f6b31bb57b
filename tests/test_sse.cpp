#include <catch2/catch.hpp>
#include "transport/sse.hpp"
#include <vector>

using namespace agentlink;

static std::vector<SSEEvent> collect_events(SSEParser& parser, const std::string& chunk) {
    std::vector<SSEEvent> events;
    parser.feed(chunk, [&](const SSEEvent& ev) {
        events.push_back(ev);
        return true;
    });
    return events;
}

// ── Blocks ──────────────────────────────────────────────────────

TEST_CASE("SSEParser: data-only block has no event name", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: hello\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
    REQUIRE(events[0].event.empty());
}

TEST_CASE("SSEParser: named block with id", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "event: content_chunk\nid: 7\ndata: {\"content\":\"Hi\"}\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "content_chunk");
    REQUIRE(events[0].id == "7");
    REQUIRE(events[0].data == "{\"content\":\"Hi\"}");
}

TEST_CASE("SSEParser: several blocks in one read", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser,
        "event: stream_started\ndata: {}\n\nevent: stream_complete\ndata: {}\n\n");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].event == "stream_started");
    REQUIRE(events[1].event == "stream_complete");
}

TEST_CASE("SSEParser: data lines are joined with newlines", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: line1\ndata: line2\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "line1\nline2");
}

TEST_CASE("SSEParser: value without a space after the colon", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "event:error\ndata:{}\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "error");
    REQUIRE(events[0].data == "{}");
}

// ── Partial reads ───────────────────────────────────────────────

TEST_CASE("SSEParser: line split across reads", "[sse]") {
    SSEParser parser;
    REQUIRE(collect_events(parser, "data: hel").empty());
    auto events = collect_events(parser, "lo\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
}

TEST_CASE("SSEParser: event name survives a split before the data line", "[sse]") {
    SSEParser parser;
    REQUIRE(collect_events(parser, "event: tool_result\n").empty());
    REQUIRE(collect_events(parser, "data: {\"x\":1}\n").empty());
    auto events = collect_events(parser, "\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "tool_result");
    REQUIRE(events[0].data == "{\"x\":1}");
}

TEST_CASE("SSEParser: byte-at-a-time delivery", "[sse]") {
    SSEParser parser;
    std::string stream = "event: content_chunk\r\ndata: abc\r\n\r\n";
    std::vector<SSEEvent> events;
    for (char c : stream) {
        auto got = collect_events(parser, std::string(1, c));
        events.insert(events.end(), got.begin(), got.end());
    }
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].event == "content_chunk");
    REQUIRE(events[0].data == "abc");
}

TEST_CASE("SSEParser: blank lines without data emit nothing", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: a\n\n\n\nevent: orphan\n\ndata: b\n\n");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].data == "a");
    REQUIRE(events[1].data == "b");
    REQUIRE(events[1].event.empty());
}

TEST_CASE("SSEParser: handles \\r\\n line endings", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, "data: hello\r\n\r\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
}

TEST_CASE("SSEParser: comment lines are keepalives", "[sse]") {
    SSEParser parser;
    auto events = collect_events(parser, ": ping\n\n: ping\ndata: hello\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "hello");
}

// ── Control ─────────────────────────────────────────────────────

TEST_CASE("SSEParser: stopping keeps the rest for the next feed", "[sse]") {
    SSEParser parser;
    std::vector<SSEEvent> events;
    parser.feed("data: first\n\ndata: second\n\n", [&](const SSEEvent& ev) {
        events.push_back(ev);
        return false;
    });
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "first");

    auto rest = collect_events(parser, "");
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0].data == "second");
}

TEST_CASE("SSEParser: reset drops partial state", "[sse]") {
    SSEParser parser;
    collect_events(parser, "event: stale\ndata: partial");
    parser.reset();

    auto events = collect_events(parser, "data: fresh\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "fresh");
    REQUIRE(events[0].event.empty());
}

TEST_CASE("SSEParser: empty input produces no events", "[sse]") {
    SSEParser parser;
    REQUIRE(collect_events(parser, "").empty());
}
