#include "connection.hpp"
#include "errors.hpp"
#include "transport/websocket_codec.hpp"

#include <iostream>

namespace agentlink {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Open:         return "open";
        case ConnectionState::Closing:      return "closing";
    }
    return "unknown";
}

uint32_t ReconnectPolicy::delay_for(uint32_t attempt) const {
    if (attempt == 0) return 0;
    uint32_t shift = attempt - 1 < 16 ? attempt - 1 : 16;
    return initial_delay_ms << shift;
}

ConnectionManager::ConnectionManager(TransportFactory factory,
                                     ConnectionOptions options,
                                     EventSink on_event,
                                     NoticeSink on_notice)
    : factory_(std::move(factory)),
      options_(options),
      on_event_(std::move(on_event)),
      on_notice_(std::move(on_notice)) {
    sleeper_ = [this](std::chrono::milliseconds delay) { return backoff_wait(delay); };
}

ConnectionManager::~ConnectionManager() {
    close();
}

void ConnectionManager::set_sleeper(Sleeper sleeper) {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    sleeper_ = std::move(sleeper);
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionManager::connect(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!reader_done_) {
            if (endpoint == endpoint_ && state_ != ConnectionState::Closing)
                return state_ == ConnectionState::Open;
            throw ConnectionBusy("connection to " + endpoint_.url + " is still " +
                                 connection_state_name(state_));
        }
    }
    join_threads();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        endpoint_ = endpoint;
        close_requested_ = false;
        reader_done_ = false;
    }
    decoder_ = make_frame_decoder(endpoint.kind);
    reconnect_attempt_.store(0);

    OpenResult result;
    bool opened = open_transport(result);
    bool fatal = !opened && (result.http_status == 401 || result.http_status == 403 ||
                             result.http_status == 429);
    if (fatal) {
        std::lock_guard<std::mutex> lock(mutex_);
        reader_done_ = true;
        state_ = ConnectionState::Disconnected;
        return false;
    }

    reader_ = std::thread([this, opened]() { reader_loop(opened); });
    if (endpoint.kind == TransportKind::DuplexSocket && options_.keepalive_interval_ms > 0)
        keepalive_ = std::thread([this]() { keepalive_loop(); });
    return opened;
}

bool ConnectionManager::send(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Open || !transport_) return false;
    return transport_->send(text);
}

void ConnectionManager::close() {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    bool was_live = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        close_requested_ = true;
        if (state_ == ConnectionState::Open || state_ == ConnectionState::Connecting) {
            state_ = ConnectionState::Closing;
            was_live = true;
        }
        if (transport_) transport_->close();
    }
    cv_.notify_all();
    if (was_live)
        notify({ConnectionNotice::Kind::StateChanged, ConnectionState::Closing});
    join_threads();
}

void ConnectionManager::wait() {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    join_threads();
}

void ConnectionManager::join_threads() {
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id())
        reader_.join();
    cv_.notify_all();
    if (keepalive_.joinable() && keepalive_.get_id() != std::this_thread::get_id())
        keepalive_.join();
}

bool ConnectionManager::open_transport(OpenResult& result) {
    set_state(ConnectionState::Connecting);

    std::unique_ptr<Transport> transport = factory_(endpoint_.kind);
    if (!transport) {
        result.error = "no transport for endpoint";
        return false;
    }
    result = transport->open(endpoint_, options_.connect_timeout_seconds);

    if (!result.ok) {
        std::cerr << "[connection] Open failed for " << endpoint_.url << ": "
                  << result.error << "\n";
        if (result.http_status == 401 || result.http_status == 403) {
            set_state(ConnectionState::Disconnected);
            notify({ConnectionNotice::Kind::AuthFailed, ConnectionState::Disconnected,
                    0, 0, result.http_status, result.error});
        } else if (result.http_status == 429) {
            set_state(ConnectionState::Disconnected);
            notify({ConnectionNotice::Kind::RateLimited, ConnectionState::Disconnected,
                    0, 0, result.http_status, result.error});
        }
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (close_requested_) {
            transport->close();
            result.ok = false;
            result.error = "closed while connecting";
            return false;
        }
        transport_ = std::move(transport);
        state_ = ConnectionState::Open;
    }
    reconnect_attempt_.store(0);
    decoder_->reset();
    last_event_terminal_ = false;
    notify({ConnectionNotice::Kind::StateChanged, ConnectionState::Open});
    return true;
}

// Reads until the transport closes. Returns true for a clean close.
bool ConnectionManager::pump() {
    Transport* transport = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport = transport_.get();
    }

    while (true) {
        ReadResult read = transport->receive();
        if (read.status == ReadStatus::Data) {
            for (auto& frame : decoder_->feed(read.data)) {
                auto event = to_protocol_event(endpoint_.kind, frame);
                if (!event) {
                    std::cerr << "[connection] Ignoring unknown event '"
                              << frame.event_type << "'\n";
                    continue;
                }
                if (event->type != EventType::Heartbeat && event->type != EventType::Pong)
                    last_event_terminal_ = ends_stream(endpoint_.kind, *event);
                on_event_(std::move(*event));
            }
            continue;
        }

        bool requested;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested = close_requested_;
        }
        return requested || last_event_terminal_ || read.close_code == kWsNormalClosure;
    }
}

void ConnectionManager::reader_loop(bool opened) {
    bool have_transport = opened;
    while (true) {
        if (have_transport) {
            bool clean = pump();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                transport_.reset();
            }
            if (clean) break;
            std::cerr << "[connection] Connection to " << endpoint_.url << " dropped\n";
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (close_requested_) break;
        }

        uint32_t attempt = ++reconnect_attempt_;
        if (attempt > options_.reconnect.max_attempts) {
            std::cerr << "[connection] Giving up on " << endpoint_.url << " after "
                      << options_.reconnect.max_attempts << " attempts\n";
            {
                std::lock_guard<std::mutex> lock(mutex_);
                state_ = ConnectionState::Disconnected;
                reader_done_ = true;
            }
            cv_.notify_all();
            notify({ConnectionNotice::Kind::GaveUp, ConnectionState::Disconnected,
                    options_.reconnect.max_attempts});
            return;
        }

        uint32_t delay = options_.reconnect.delay_for(attempt);
        std::cerr << "[connection] Reconnecting in " << delay << "ms (attempt "
                  << attempt << "/" << options_.reconnect.max_attempts << ")\n";
        set_state(ConnectionState::Connecting);
        notify({ConnectionNotice::Kind::Reconnecting, ConnectionState::Connecting,
                attempt, delay});

        if (!sleeper_(std::chrono::milliseconds(delay))) break;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (close_requested_) break;
        }

        OpenResult result;
        have_transport = open_transport(result);
        if (!have_transport && (result.http_status == 401 || result.http_status == 403 ||
                                result.http_status == 429)) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectionState::Disconnected;
        reader_done_ = true;
    }
    cv_.notify_all();
    notify({ConnectionNotice::Kind::StateChanged, ConnectionState::Disconnected});
}

void ConnectionManager::keepalive_loop() {
    auto interval = std::chrono::milliseconds(options_.keepalive_interval_ms);
    std::unique_lock<std::mutex> lock(mutex_);
    while (!close_requested_ && !reader_done_) {
        if (cv_.wait_for(lock, interval, [this] { return close_requested_ || reader_done_; }))
            break;
        if (state_ != ConnectionState::Open || !transport_) continue;
        if (!transport_->send(outbound::socket_ping()))
            std::cerr << "[connection] Keepalive ping failed\n";
    }
}

bool ConnectionManager::backoff_wait(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, delay, [this] { return close_requested_; });
}

void ConnectionManager::set_state(ConnectionState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == state) return;
        state_ = state;
    }
    notify({ConnectionNotice::Kind::StateChanged, state});
}

void ConnectionManager::notify(ConnectionNotice notice) {
    if (on_notice_) on_notice_(notice);
}

} // namespace agentlink
