#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace agentlink {

enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text         = 0x1,
    Binary       = 0x2,
    Close        = 0x8,
    Ping         = 0x9,
    Pong         = 0xA,
};

constexpr uint16_t kWsNormalClosure = 1000;
constexpr size_t kWsMaxMessageBytes = 16 * 1024 * 1024;

using WsMask = std::array<uint8_t, 4>;

// Client-to-server frames are always masked.
std::string ws_encode_frame(WsOpcode opcode, const std::string& payload, const WsMask& mask);

// Encode with a fresh random mask.
std::string ws_encode_client_frame(WsOpcode opcode, const std::string& payload);

// Close frame body: 2-byte status code followed by an optional reason.
std::string ws_close_payload(uint16_t code, const std::string& reason = "");
uint16_t ws_close_code(const std::string& payload);

// Random base64 Sec-WebSocket-Key
std::string ws_make_client_key();

// Expected Sec-WebSocket-Accept for a given key
std::string ws_accept_key(const std::string& client_key);

struct WsMessage {
    WsOpcode opcode;
    std::string payload;
};

// Incremental frame reader. Reassembles fragmented data messages; control
// frames are returned as soon as they are complete.
class WsFrameReader {
public:
    void feed(const char* data, size_t len);

    // Next complete message, or nullopt if more input is needed.
    // Throws DecodeError on a protocol error (oversized or stray continuation).
    std::optional<WsMessage> next();

    void reset();

private:
    std::string buffer_;
    std::string fragments_;
    std::optional<WsOpcode> fragment_opcode_;
};

} // namespace agentlink
