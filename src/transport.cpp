#include "transport.hpp"
#include "transport/http_stream_transport.hpp"
#include "transport/websocket_transport.hpp"

namespace agentlink {

std::unique_ptr<Transport> make_socket_transport(TransportKind kind) {
    switch (kind) {
        case TransportKind::DuplexSocket:
            return std::make_unique<WebSocketTransport>();
        case TransportKind::RequestStream:
            return std::make_unique<HttpStreamTransport>();
    }
    return nullptr;
}

} // namespace agentlink
