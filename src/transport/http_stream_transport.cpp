#include "http_stream_transport.hpp"

#include <iostream>

namespace agentlink {

OpenResult HttpStreamTransport::open(const Endpoint& endpoint, long timeout_seconds) {
    std::vector<Header> headers = endpoint.headers;
    headers.emplace_back("Accept", "text/event-stream");
    headers.emplace_back("Cache-Control", "no-cache");
    if (!endpoint.body.empty())
        headers.emplace_back("Content-Type", "application/json");

    OpenResult result;
    result.http_status = stream_.open(endpoint.method, endpoint.url, endpoint.body,
                                      headers, timeout_seconds);
    if (result.http_status == 0) {
        result.error = "could not reach " + endpoint.url;
        return result;
    }
    if (result.http_status < 200 || result.http_status >= 300) {
        result.error = "HTTP " + std::to_string(result.http_status) + ": " + stream_.read_all();
        return result;
    }
    result.ok = true;
    return result;
}

ReadResult HttpStreamTransport::receive() {
    ReadResult result;
    ssize_t n = stream_.read(result.data);
    if (n > 0) {
        result.status = ReadStatus::Data;
    } else if (n == 0 || closing_.load()) {
        result.status = ReadStatus::Closed;
    } else {
        result.status = ReadStatus::Failed;
    }
    return result;
}

bool HttpStreamTransport::send(const std::string& /*text*/) {
    std::cerr << "[sse] send() is not supported on a request stream\n";
    return false;
}

void HttpStreamTransport::close() {
    closing_.store(true);
    stream_.abort();
}

} // namespace agentlink
