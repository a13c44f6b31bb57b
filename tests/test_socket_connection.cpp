#include <catch2/catch.hpp>
#include "socket_connection.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace agentlink;

namespace {

// Loopback listener on an ephemeral port.
struct Listener {
    int fd = -1;
    int port = 0;

    Listener() {
        fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd, 1);
        socklen_t len = sizeof(addr);
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
        port = ntohs(addr.sin_port);
    }

    ~Listener() { if (fd >= 0) ::close(fd); }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port) + "/"; }
};

std::string read_exactly(int fd, size_t n) {
    std::string out;
    char buf[256];
    while (out.size() < n) {
        ssize_t got = ::recv(fd, buf, std::min(sizeof(buf), n - out.size()), 0);
        if (got <= 0) break;
        out.append(buf, static_cast<size_t>(got));
    }
    return out;
}

} // namespace

// ── parse_url ───────────────────────────────────────────────────

TEST_CASE("parse_url: scheme decides TLS and default port", "[socket]") {
    auto u = parse_url("wss://agents.example.com/api/chat/ws?definition_id=d1");
    REQUIRE(u.tls);
    REQUIRE(u.host == "agents.example.com");
    REQUIRE(u.port == "443");
    REQUIRE(u.path == "/api/chat/ws?definition_id=d1");

    auto plain = parse_url("http://localhost:8000");
    REQUIRE_FALSE(plain.tls);
    REQUIRE(plain.port == "8000");
    REQUIRE(plain.path == "/");

    REQUIRE(parse_url("ws://h?x=1").path == "/?x=1");
}

TEST_CASE("parse_url: rejects unknown schemes and empty hosts", "[socket]") {
    REQUIRE_THROWS_AS(parse_url("ftp://host/file"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_url("no-scheme"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_url("http:///path"), std::invalid_argument);
}

// ── Concurrent use ──────────────────────────────────────────────

TEST_CASE("SocketConnection: writers proceed while a reader is blocked", "[socket]") {
    Listener listener;
    SocketConnection conn;
    REQUIRE(conn.connect(parse_url(listener.url()), 5));
    int peer = ::accept(listener.fd, nullptr, nullptr);
    REQUIRE(peer >= 0);

    std::atomic<bool> reader_started{false};
    std::string received;
    std::thread reader([&] {
        reader_started.store(true);
        char buf[64];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n > 0) received.assign(buf, static_cast<size_t>(n));
    });
    while (!reader_started.load()) std::this_thread::yield();

    // Keepalive and user sends race each other while the read is pending
    bool ping_ok = false;
    std::thread ping([&] { ping_ok = conn.write_all(std::string("ping;")); });
    REQUIRE(conn.write_all(std::string("send;")));
    ping.join();
    REQUIRE(ping_ok);

    std::string got = read_exactly(peer, 10);
    REQUIRE(got.size() == 10);
    REQUIRE(got.find("ping;") != std::string::npos);
    REQUIRE(got.find("send;") != std::string::npos);

    REQUIRE(::send(peer, "pong", 4, 0) == 4);
    reader.join();
    REQUIRE(received == "pong");
    ::close(peer);
}

TEST_CASE("SocketConnection: abort releases a blocked reader", "[socket]") {
    Listener listener;
    SocketConnection conn;
    REQUIRE(conn.connect(parse_url(listener.url()), 5));
    int peer = ::accept(listener.fd, nullptr, nullptr);
    REQUIRE(peer >= 0);

    ssize_t result = 1;
    std::thread reader([&] {
        char buf[16];
        result = conn.read_some(buf, sizeof(buf));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    conn.abort();
    reader.join();

    REQUIRE(result <= 0);
    REQUIRE(conn.aborted());
    REQUIRE_FALSE(conn.write_all(std::string("late")));
    ::close(peer);
}
