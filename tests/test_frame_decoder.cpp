#include <catch2/catch.hpp>
#include "transport/frame_decoder.hpp"
#include "errors.hpp"

using namespace agentlink;

// ── SSE ─────────────────────────────────────────────────────────

TEST_CASE("SseFrameDecoder: named event with JSON data", "[frame_decoder]") {
    SseFrameDecoder dec;
    auto frames = dec.feed("event: content_chunk\ndata: {\"content\":\"Hi\"}\n\n");
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].event_type == "content_chunk");
    REQUIRE(frames[0].payload["content"] == "Hi");
}

TEST_CASE("SseFrameDecoder: unnamed blocks are 'message'", "[frame_decoder]") {
    SseFrameDecoder dec;
    auto frames = dec.feed("data: {\"type\":\"stream_complete\"}\n\n");
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].event_type == "message");
}

TEST_CASE("SseFrameDecoder: malformed data is skipped, stream continues", "[frame_decoder]") {
    SseFrameDecoder dec;
    auto frames = dec.feed("event: content_chunk\ndata: {oops\n\n"
                           "event: stream_complete\ndata: {}\n\n");
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].event_type == "stream_complete");
}

TEST_CASE("SseFrameDecoder: frames split across reads keep order", "[frame_decoder]") {
    SseFrameDecoder dec;
    REQUIRE(dec.feed("event: a\ndata: {\"n\":1}\n\nevent: b\nda").size() == 1);
    auto rest = dec.feed("ta: {\"n\":2}\n\n");
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0].event_type == "b");
    REQUIRE(rest[0].payload["n"] == 2);
}

TEST_CASE("SseFrameDecoder: reset drops partial input", "[frame_decoder]") {
    SseFrameDecoder dec;
    dec.feed("event: a\ndata: {\"n\":");
    dec.reset();
    auto frames = dec.feed("event: b\ndata: {}\n\n");
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].event_type == "b");
}

// ── Socket ──────────────────────────────────────────────────────

TEST_CASE("parse_socket_frame: data envelope", "[frame_decoder]") {
    Frame f = parse_socket_frame(R"({"type":"content","data":{"content":"x"}})");
    REQUIRE(f.event_type == "content");
    REQUIRE(f.payload["content"] == "x");
}

TEST_CASE("parse_socket_frame: inline fields", "[frame_decoder]") {
    Frame f = parse_socket_frame(R"({"type":"error","message":"bad"})");
    REQUIRE(f.event_type == "error");
    REQUIRE(f.payload["message"] == "bad");
    REQUIRE_FALSE(f.payload.contains("type"));
}

TEST_CASE("parse_socket_frame: rejects malformed input", "[frame_decoder]") {
    REQUIRE_THROWS_AS(parse_socket_frame("not json"), DecodeError);
    REQUIRE_THROWS_AS(parse_socket_frame("[1,2]"), DecodeError);
    REQUIRE_THROWS_AS(parse_socket_frame(R"({"data":{}})"), DecodeError);
    REQUIRE_THROWS_AS(parse_socket_frame(R"({"type":5})"), DecodeError);
}

TEST_CASE("SocketFrameDecoder: bad messages are dropped", "[frame_decoder]") {
    SocketFrameDecoder dec;
    REQUIRE(dec.feed("{garbage").empty());
    REQUIRE(dec.feed(R"({"type":"pong"})").size() == 1);
}

TEST_CASE("make_frame_decoder: one per transport", "[frame_decoder]") {
    auto sse = make_frame_decoder(TransportKind::RequestStream);
    auto ws = make_frame_decoder(TransportKind::DuplexSocket);
    REQUIRE(sse->feed("event: x\ndata: {}\n\n").size() == 1);
    REQUIRE(ws->feed(R"({"type":"x"})").size() == 1);
}
