#pragma once
#include "http.hpp"
#include "protocol.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace agentlink {

// Where and how to open a connection. Two endpoints are the same target
// iff every field matches.
struct Endpoint {
    TransportKind kind = TransportKind::RequestStream;
    std::string url;
    std::string method = "GET";   // request-stream only
    std::string body;             // request-stream only
    std::vector<Header> headers;

    bool operator==(const Endpoint& other) const {
        return kind == other.kind && url == other.url && method == other.method &&
               body == other.body && headers == other.headers;
    }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }
};

struct OpenResult {
    bool ok = false;
    long http_status = 0; // 0 = unreachable
    std::string error;
};

enum class ReadStatus {
    Data,   // `data` holds the next raw read
    Closed, // orderly end of stream
    Failed, // read error or abort
};

struct ReadResult {
    ReadStatus status = ReadStatus::Failed;
    std::string data;
    uint16_t close_code = 0; // peer close code (duplex sockets)
};

// A physical connection. receive() is called from a single reader thread;
// send() and close() may be called from others.
class Transport {
public:
    virtual ~Transport() = default;

    virtual OpenResult open(const Endpoint& endpoint, long timeout_seconds) = 0;

    // Blocks until data arrives, the stream ends, or close() is called.
    virtual ReadResult receive() = 0;

    // Sends one text message. Request-stream transports cannot send.
    virtual bool send(const std::string& text) = 0;

    // Orderly shutdown; unblocks a pending receive().
    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>(TransportKind)>;

// Socket-backed transports for both kinds.
std::unique_ptr<Transport> make_socket_transport(TransportKind kind);

} // namespace agentlink
