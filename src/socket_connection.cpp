#include "socket_connection.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <thread>

namespace agentlink {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result;
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::invalid_argument("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme == "https" || scheme == "wss") {
        result.tls = true;
    } else if (scheme != "http" && scheme != "ws") {
        throw std::invalid_argument("unsupported URL scheme: " + scheme);
    }

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    if (path_start == std::string::npos) {
        result.path = "/";
    } else if (url[path_start] == '?') {
        result.path = "/" + url.substr(path_start);
    } else {
        result.path = url.substr(path_start);
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::invalid_argument("invalid URL: " + url);
    return result;
}

SocketConnection::~SocketConnection() {
    if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
    if (ctx_) SSL_CTX_free(ctx_);
    if (fd_ >= 0) ::close(fd_);
}

bool SocketConnection::connect(const ParsedUrl& url, long timeout_secs) {
    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
        return false;

    bool connected = false;
    for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
        fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd_ < 0) continue;

        // Non-blocking connect so the timeout is honoured
        int flags = fcntl(fd_, F_GETFL, 0);
        fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            fcntl(fd_, F_SETFL, flags);
            connected = true;
        } else if (errno == EINPROGRESS) {
            fd_set wset;
            FD_ZERO(&wset);
            FD_SET(fd_, &wset);
            struct timeval tv{timeout_secs, 0};
            rc = select(fd_ + 1, nullptr, &wset, nullptr, &tv);
            if (rc > 0) {
                int err = 0;
                socklen_t elen = sizeof(err);
                getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
                if (err == 0) {
                    fcntl(fd_, F_SETFL, flags);
                    connected = true;
                }
            }
        }
        if (!connected) { ::close(fd_); fd_ = -1; }
    }
    freeaddrinfo(res);
    if (!connected) return false;

    if (url.tls) {
        set_socket_timeout(timeout_secs);

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, url.host.c_str());

        if (SSL_connect(ssl_) != 1) return false;
    }

    // 1-second slices so abort checks run while a stream is idle
    set_socket_timeout(1);
    return true;
}

ssize_t SocketConnection::read_some(char* buf, size_t len) {
    while (true) {
        if (aborted_.load(std::memory_order_relaxed)) return -1;
        if (g_socket_abort_flag &&
            g_socket_abort_flag->load(std::memory_order_relaxed))
            return -1;

        ssize_t n;
        if (ssl_) {
            // Let a queued writer in between 1-second read slices
            while (writers_waiting_.load() > 0) std::this_thread::yield();

            int err;
            int saved_errno;
            {
                std::lock_guard<std::mutex> lock(ssl_mutex_);
                n = SSL_read(ssl_, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                err = SSL_get_error(ssl_, static_cast<int>(n));
                saved_errno = errno;
            }
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                continue;
            if (err == SSL_ERROR_SYSCALL &&
                (saved_errno == EAGAIN || saved_errno == EWOULDBLOCK))
                continue;
            return -1;
        } else {
            n = ::recv(fd_, buf, len, 0);
            if (n > 0) return n;
            if (n == 0) return 0;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return -1;
        }
    }
}

bool SocketConnection::write_all(const char* buf, size_t len) {
    while (len > 0) {
        if (aborted_.load(std::memory_order_relaxed)) return false;
        ssize_t n;
        if (ssl_) {
            int err = SSL_ERROR_NONE;
            writers_waiting_.fetch_add(1);
            {
                std::lock_guard<std::mutex> lock(ssl_mutex_);
                writers_waiting_.fetch_sub(1);
                n = SSL_write(ssl_, buf, static_cast<int>(len));
                if (n <= 0) err = SSL_get_error(ssl_, static_cast<int>(n));
            }
            if (n <= 0) {
                if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                    continue;
                return false;
            }
        } else {
            n = ::send(fd_, buf, len, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                return false;
            }
        }
        buf += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

void SocketConnection::abort() {
    aborted_.store(true);
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

void SocketConnection::set_socket_timeout(long secs) {
    struct timeval tv{secs, 0};
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

} // namespace agentlink
