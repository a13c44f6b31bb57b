#include "websocket_codec.hpp"
#include "../errors.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace agentlink {

static constexpr const char* kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

static std::string base64_encode(const unsigned char* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data, static_cast<int>(len));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::string ws_encode_frame(WsOpcode opcode, const std::string& payload, const WsMask& mask) {
    std::string frame;
    frame.reserve(payload.size() + 14);
    frame += static_cast<char>(0x80u | static_cast<uint8_t>(opcode));

    size_t size = payload.size();
    if (size <= 125) {
        frame += static_cast<char>(0x80u | size);
    } else if (size <= 0xFFFF) {
        frame += static_cast<char>(0x80u | 126u);
        frame += static_cast<char>((size >> 8) & 0xFF);
        frame += static_cast<char>(size & 0xFF);
    } else {
        frame += static_cast<char>(0x80u | 127u);
        for (int shift = 56; shift >= 0; shift -= 8)
            frame += static_cast<char>((static_cast<uint64_t>(size) >> shift) & 0xFF);
    }

    for (uint8_t b : mask) frame += static_cast<char>(b);
    for (size_t i = 0; i < size; ++i)
        frame += static_cast<char>(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]);
    return frame;
}

std::string ws_encode_client_frame(WsOpcode opcode, const std::string& payload) {
    WsMask mask{};
    if (RAND_bytes(mask.data(), static_cast<int>(mask.size())) != 1)
        throw TransportError("ws: RAND_bytes failed");
    return ws_encode_frame(opcode, payload, mask);
}

std::string ws_close_payload(uint16_t code, const std::string& reason) {
    std::string out;
    out += static_cast<char>((code >> 8) & 0xFF);
    out += static_cast<char>(code & 0xFF);
    out += reason;
    return out;
}

uint16_t ws_close_code(const std::string& payload) {
    if (payload.size() < 2) return 0;
    return static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) |
                                 static_cast<uint8_t>(payload[1]));
}

std::string ws_make_client_key() {
    unsigned char nonce[16];
    if (RAND_bytes(nonce, sizeof(nonce)) != 1)
        throw TransportError("ws: RAND_bytes failed");
    return base64_encode(nonce, sizeof(nonce));
}

std::string ws_accept_key(const std::string& client_key) {
    std::string source = client_key + kWebSocketGuid;
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(source.data()), source.size(), digest);
    return base64_encode(digest, sizeof(digest));
}

void WsFrameReader::feed(const char* data, size_t len) {
    buffer_.append(data, len);
}

std::optional<WsMessage> WsFrameReader::next() {
    while (true) {
        if (buffer_.size() < 2) return std::nullopt;

        auto byte = [this](size_t i) { return static_cast<uint8_t>(buffer_[i]); };
        bool fin = (byte(0) & 0x80u) != 0;
        auto opcode = static_cast<WsOpcode>(byte(0) & 0x0Fu);
        bool masked = (byte(1) & 0x80u) != 0;
        uint64_t len = byte(1) & 0x7Fu;

        size_t header = 2;
        if (len == 126) {
            if (buffer_.size() < 4) return std::nullopt;
            len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
            header = 4;
        } else if (len == 127) {
            if (buffer_.size() < 10) return std::nullopt;
            len = 0;
            for (size_t i = 2; i < 10; ++i) len = (len << 8) | byte(i);
            header = 10;
        }
        if (len > kWsMaxMessageBytes)
            throw DecodeError("ws: frame exceeds size limit");

        size_t mask_at = header;
        if (masked) header += 4;
        if (buffer_.size() < header + len) return std::nullopt;

        std::string payload = buffer_.substr(header, static_cast<size_t>(len));
        if (masked) {
            for (size_t i = 0; i < payload.size(); ++i)
                payload[i] = static_cast<char>(static_cast<uint8_t>(payload[i]) ^ byte(mask_at + i % 4));
        }
        buffer_.erase(0, header + static_cast<size_t>(len));

        switch (opcode) {
            case WsOpcode::Close:
            case WsOpcode::Ping:
            case WsOpcode::Pong:
                return WsMessage{opcode, std::move(payload)};
            case WsOpcode::Continuation:
                if (!fragment_opcode_)
                    throw DecodeError("ws: continuation without a started message");
                fragments_ += payload;
                if (fragments_.size() > kWsMaxMessageBytes)
                    throw DecodeError("ws: message exceeds size limit");
                if (fin) {
                    WsMessage msg{*fragment_opcode_, std::move(fragments_)};
                    fragments_.clear();
                    fragment_opcode_.reset();
                    return msg;
                }
                continue;
            case WsOpcode::Text:
            case WsOpcode::Binary:
                if (fin) return WsMessage{opcode, std::move(payload)};
                fragment_opcode_ = opcode;
                fragments_ = std::move(payload);
                continue;
        }
        throw DecodeError("ws: unknown opcode");
    }
}

void WsFrameReader::reset() {
    buffer_.clear();
    fragments_.clear();
    fragment_opcode_.reset();
}

} // namespace agentlink
