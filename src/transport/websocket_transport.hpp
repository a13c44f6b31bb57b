#pragma once
#include "../transport.hpp"
#include "../socket_connection.hpp"
#include "websocket_codec.hpp"
#include <atomic>
#include <mutex>

namespace agentlink {

// Duplex transport: RFC 6455 client over a plain or TLS socket.
class WebSocketTransport : public Transport {
public:
    OpenResult open(const Endpoint& endpoint, long timeout_seconds) override;
    ReadResult receive() override;
    bool send(const std::string& text) override;
    void close() override;

private:
    bool write_frame(WsOpcode opcode, const std::string& payload);

    SocketConnection conn_;
    WsFrameReader reader_;
    std::mutex write_mutex_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
};

} // namespace agentlink
