#include "frame_decoder.hpp"
#include "../errors.hpp"

#include <iostream>

namespace agentlink {

std::vector<Frame> SseFrameDecoder::feed(const std::string& raw) {
    std::vector<Frame> frames;
    parser_.feed(raw, [&](const SSEEvent& ev) {
        Frame frame;
        frame.event_type = ev.event.empty() ? "message" : ev.event;
        try {
            frame.payload = nlohmann::json::parse(ev.data);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[sse] Dropping '" << frame.event_type
                      << "' frame with malformed data: " << e.what() << "\n";
            return true;
        }
        frames.push_back(std::move(frame));
        return true;
    });
    return frames;
}

void SseFrameDecoder::reset() {
    parser_.reset();
}

Frame parse_socket_frame(const std::string& text) {
    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(std::string("malformed JSON: ") + e.what());
    }
    if (!msg.is_object())
        throw DecodeError("message is not an object");
    if (!msg.contains("type") || !msg["type"].is_string())
        throw DecodeError("message has no type");

    Frame frame;
    frame.event_type = msg["type"].get<std::string>();
    if (msg.contains("data")) {
        frame.payload = msg["data"];
    } else {
        msg.erase("type");
        frame.payload = std::move(msg);
    }
    return frame;
}

std::vector<Frame> SocketFrameDecoder::feed(const std::string& raw) {
    std::vector<Frame> frames;
    try {
        frames.push_back(parse_socket_frame(raw));
    } catch (const DecodeError& e) {
        std::cerr << "[ws] Dropping frame: " << e.what() << "\n";
    }
    return frames;
}

std::unique_ptr<FrameDecoder> make_frame_decoder(TransportKind kind) {
    if (kind == TransportKind::DuplexSocket)
        return std::make_unique<SocketFrameDecoder>();
    return std::make_unique<SseFrameDecoder>();
}

} // namespace agentlink
