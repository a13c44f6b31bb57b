#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <sys/types.h>

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace agentlink {

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

// http(s):// and ws(s):// URLs. Throws std::invalid_argument on anything else.
ParsedUrl parse_url(const std::string& url);

// Process-wide abort flag checked by every socket read (~1s granularity).
void http_set_abort_flag(const std::atomic<bool>* flag);

// RAII TCP connection with optional TLS.
class SocketConnection {
public:
    SocketConnection() = default;
    ~SocketConnection();
    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs);

    // >0 on data, 0 on EOF, -1 on error or abort. One reader thread may run
    // alongside writers; TLS calls on the shared session are serialized.
    ssize_t read_some(char* buf, size_t len);

    bool write_all(const char* buf, size_t len);
    bool write_all(const std::string& data) { return write_all(data.data(), data.size()); }

    // Makes a blocked read_some() on another thread return promptly.
    void abort();
    bool aborted() const { return aborted_.load(); }

private:
    void set_socket_timeout(long secs);

    int fd_ = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
    std::mutex ssl_mutex_;
    std::atomic<int> writers_waiting_{0};
    std::atomic<bool> aborted_{false};
};

} // namespace agentlink
