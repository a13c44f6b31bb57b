#pragma once
#include "protocol.hpp"
#include "transport.hpp"
#include "transport/frame_decoder.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace agentlink {

enum class ConnectionState { Disconnected, Connecting, Open, Closing };

const char* connection_state_name(ConnectionState state);

struct ReconnectPolicy {
    uint32_t initial_delay_ms = 1000;
    uint32_t max_attempts = 5;

    // Delay before the given 1-based attempt: initial * 2^(attempt-1)
    uint32_t delay_for(uint32_t attempt) const;
};

struct ConnectionOptions {
    ReconnectPolicy reconnect;
    uint32_t keepalive_interval_ms = 30000; // duplex sockets only
    long connect_timeout_seconds = 30;
};

struct ConnectionNotice {
    enum class Kind {
        StateChanged,
        Reconnecting, // backoff scheduled: attempt + delay_ms
        GaveUp,       // attempts exhausted, no further retries
        AuthFailed,   // open rejected with 401/403
        RateLimited,  // open rejected with 429
    };
    Kind kind = Kind::StateChanged;
    ConnectionState state = ConnectionState::Disconnected;
    uint32_t attempt = 0;
    uint32_t delay_ms = 0;
    long http_status = 0;
    std::string detail;
};

using EventSink = std::function<void(ProtocolEvent)>;
using NoticeSink = std::function<void(const ConnectionNotice&)>;

// Waits out a backoff delay. Returns false if the wait was cut short by close().
using Sleeper = std::function<bool(std::chrono::milliseconds)>;

// Owns one physical connection: open, keepalive, close classification and
// reconnection with exponential backoff. Frames are decoded on a reader
// thread and handed to the event sink in arrival order.
class ConnectionManager {
public:
    ConnectionManager(TransportFactory factory,
                      ConnectionOptions options,
                      EventSink on_event,
                      NoticeSink on_notice);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Opens the endpoint. Returns true if the connection is open (or was
    // already open to the same endpoint). A failed first open falls into
    // the reconnection policy and returns false.
    // Throws ConnectionBusy if a connection to a different endpoint is live.
    bool connect(const Endpoint& endpoint);

    // Sends one text message over an open connection.
    bool send(const std::string& text);

    // Clean, caller-requested close. Never triggers reconnection.
    void close();

    // Blocks until the reader thread exits.
    void wait();

    // Replace the backoff wait (tests record delays instead of sleeping).
    void set_sleeper(Sleeper sleeper);

    ConnectionState state() const;
    uint32_t reconnect_attempt() const { return reconnect_attempt_.load(); }
    TransportKind kind() const { return endpoint_.kind; }

private:
    void reader_loop(bool opened);
    bool open_transport(OpenResult& result);
    bool pump();
    void keepalive_loop();
    bool backoff_wait(std::chrono::milliseconds delay);
    void set_state(ConnectionState state);
    void notify(ConnectionNotice notice);
    void join_threads();

    TransportFactory factory_;
    ConnectionOptions options_;
    EventSink on_event_;
    NoticeSink on_notice_;
    Sleeper sleeper_;

    Endpoint endpoint_;
    std::unique_ptr<FrameDecoder> decoder_;
    bool last_event_terminal_ = false;

    std::mutex lifecycle_mutex_; // serializes connect/close/wait
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unique_ptr<Transport> transport_;
    ConnectionState state_ = ConnectionState::Disconnected;
    bool close_requested_ = false;
    bool reader_done_ = true;
    std::atomic<uint32_t> reconnect_attempt_{0};

    std::thread reader_;
    std::thread keepalive_;
};

} // namespace agentlink
