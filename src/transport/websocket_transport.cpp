#include "websocket_transport.hpp"
#include "../errors.hpp"

#include <iostream>
#include <stdexcept>

namespace agentlink {

OpenResult WebSocketTransport::open(const Endpoint& endpoint, long timeout_seconds) {
    OpenResult result;
    ParsedUrl url;
    try {
        url = parse_url(endpoint.url);
    } catch (const std::invalid_argument& e) {
        result.error = e.what();
        return result;
    }

    if (!conn_.connect(url, timeout_seconds)) {
        result.error = "could not reach " + endpoint.url;
        return result;
    }

    std::string key = ws_make_client_key();
    std::vector<Header> headers = {
        {"Upgrade", "websocket"},
        {"Connection", "Upgrade"},
        {"Sec-WebSocket-Key", key},
        {"Sec-WebSocket-Version", "13"},
    };
    headers.insert(headers.end(), endpoint.headers.begin(), endpoint.headers.end());

    std::string request = build_request("GET", url.host + ":" + url.port, url.path, "", headers, true);
    if (!conn_.write_all(request)) {
        result.error = "handshake write failed";
        return result;
    }

    std::string leftover;
    ResponseHead head = read_response_head(conn_, leftover);
    result.http_status = head.status;
    if (head.status != 101) {
        result.error = head.status == 0 ? "no handshake response"
                                        : "upgrade rejected with HTTP " + std::to_string(head.status);
        return result;
    }
    auto accept = head.headers.find("sec-websocket-accept");
    if (accept == head.headers.end() || accept->second != ws_accept_key(key)) {
        result.error = "bad Sec-WebSocket-Accept";
        return result;
    }

    if (!leftover.empty()) reader_.feed(leftover.data(), leftover.size());
    open_.store(true);
    result.ok = true;
    return result;
}

ReadResult WebSocketTransport::receive() {
    ReadResult result;
    while (true) {
        std::optional<WsMessage> msg;
        try {
            msg = reader_.next();
        } catch (const DecodeError& e) {
            std::cerr << "[ws] " << e.what() << "\n";
            result.status = ReadStatus::Failed;
            return result;
        }

        if (msg) {
            switch (msg->opcode) {
                case WsOpcode::Text:
                    result.status = ReadStatus::Data;
                    result.data = std::move(msg->payload);
                    return result;
                case WsOpcode::Ping:
                    write_frame(WsOpcode::Pong, msg->payload);
                    continue;
                case WsOpcode::Close:
                    if (!closing_.exchange(true))
                        write_frame(WsOpcode::Close, msg->payload.substr(0, 2));
                    open_.store(false);
                    result.status = ReadStatus::Closed;
                    result.close_code = ws_close_code(msg->payload);
                    return result;
                case WsOpcode::Binary:
                    std::cerr << "[ws] Ignoring binary message\n";
                    continue;
                case WsOpcode::Pong:
                case WsOpcode::Continuation:
                    continue;
            }
        }

        char buf[4096];
        ssize_t n = conn_.read_some(buf, sizeof(buf));
        if (n > 0) {
            reader_.feed(buf, static_cast<size_t>(n));
            continue;
        }
        open_.store(false);
        if (closing_.load()) {
            result.status = ReadStatus::Closed;
            result.close_code = kWsNormalClosure;
        } else {
            // Dropped without a close frame
            result.status = n == 0 ? ReadStatus::Closed : ReadStatus::Failed;
        }
        return result;
    }
}

bool WebSocketTransport::send(const std::string& text) {
    if (!open_.load() || closing_.load()) return false;
    return write_frame(WsOpcode::Text, text);
}

void WebSocketTransport::close() {
    if (!closing_.exchange(true) && open_.load())
        write_frame(WsOpcode::Close, ws_close_payload(kWsNormalClosure));
    conn_.abort();
}

bool WebSocketTransport::write_frame(WsOpcode opcode, const std::string& payload) {
    std::string frame;
    try {
        frame = ws_encode_client_frame(opcode, payload);
    } catch (const TransportError& e) {
        std::cerr << "[ws] " << e.what() << "\n";
        return false;
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    return conn_.write_all(frame);
}

} // namespace agentlink
