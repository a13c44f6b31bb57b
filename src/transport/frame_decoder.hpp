#pragma once
#include "../protocol.hpp"
#include "sse.hpp"
#include <memory>
#include <string>
#include <vector>

namespace agentlink {

// Turns raw transport reads into frames, in arrival order. Malformed input
// is logged and skipped; decoding never fails the stream.
class FrameDecoder {
public:
    virtual ~FrameDecoder() = default;

    // Feed one read from the transport; returns the frames it completed.
    virtual std::vector<Frame> feed(const std::string& raw) = 0;

    // Forget partial input (new connection).
    virtual void reset() = 0;
};

// Request-stream: SSE blocks with an `event:` name and JSON `data:`.
class SseFrameDecoder : public FrameDecoder {
public:
    std::vector<Frame> feed(const std::string& raw) override;
    void reset() override;

private:
    SSEParser parser_;
};

// Duplex socket: one JSON object per text message, typed by its `type` field.
class SocketFrameDecoder : public FrameDecoder {
public:
    std::vector<Frame> feed(const std::string& raw) override;
    void reset() override {}
};

std::unique_ptr<FrameDecoder> make_frame_decoder(TransportKind kind);

// Parse one socket message into a frame. Throws DecodeError.
Frame parse_socket_frame(const std::string& text);

} // namespace agentlink
