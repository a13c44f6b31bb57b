#include "http.hpp"
#include "socket_connection.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace agentlink {

// ── Request building ───────────────────────────────────────────

std::string build_request(const std::string& method,
                          const std::string& host,
                          const std::string& path,
                          const std::string& body,
                          const std::vector<Header>& headers,
                          bool keep_alive) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + path + " HTTP/1.1\r\n";
    req += "Host: " + host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (!body.empty() && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    if (!keep_alive)
        req += "Connection: close\r\n";
    req += "\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
static bool read_line(SocketConnection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

static std::string lowercase(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

ResponseHead read_response_head(SocketConnection& conn, std::string& leftover) {
    ResponseHead head;

    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return head;

    // "HTTP/1.1 200 OK"
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || status_line.size() < sp1 + 4) return head;
    std::string code = status_line.substr(sp1 + 1, 3);
    if (!std::all_of(code.begin(), code.end(),
                     [](unsigned char c) { return std::isdigit(c); }))
        return head;
    long status = std::strtol(code.c_str(), nullptr, 10);

    std::string line;
    while (read_line(conn, leftover, line)) {
        if (line.empty()) {
            head.status = status;
            break;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = lowercase(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        if (name == "transfer-encoding") {
            head.chunked = lowercase(value).find("chunked") != std::string::npos;
        } else if (name == "content-length") {
            head.content_length = std::strtoul(value.c_str(), nullptr, 10);
        }
        head.headers[name] = value;
    }
    return head;
}

// ── Buffered requests ──────────────────────────────────────────

static HttpResponse do_request(const std::string& method,
                               const std::string& url,
                               const std::string& body,
                               const std::vector<Header>& headers,
                               long timeout_secs) {
    HttpStream stream;
    HttpResponse resp;
    resp.status_code = stream.open(method, url, body, headers, timeout_secs);
    if (resp.status_code == 0) return resp;
    resp.body = stream.read_all();
    return resp;
}

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return do_request("POST", url, body, headers, timeout_seconds);
}

HttpResponse SocketHttpClient::get(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return do_request("GET", url, "", headers, timeout_seconds);
}

HttpResponse SocketHttpClient::del(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return do_request("DELETE", url, "", headers, timeout_seconds);
}

// ── Streamed requests ──────────────────────────────────────────

HttpStream::HttpStream() : conn_(std::make_unique<SocketConnection>()) {}

HttpStream::~HttpStream() = default;

long HttpStream::open(const std::string& method,
                      const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    ParsedUrl parsed;
    try {
        parsed = parse_url(url);
    } catch (const std::invalid_argument&) {
        return 0;
    }

    if (!conn_->connect(parsed, timeout_seconds)) return 0;

    std::string request = build_request(method, parsed.host, parsed.path, body, headers, false);
    if (!conn_->write_all(request)) return 0;

    ResponseHead head = read_response_head(*conn_, leftover_);
    chunked_ = head.chunked;
    content_length_ = head.content_length;
    remaining_ = content_length_;
    if (!chunked_ && head.headers.count("content-length") && content_length_ == 0)
        done_ = true;
    return head.status;
}

ssize_t HttpStream::read(std::string& out) {
    if (done_) return 0;

    if (chunked_) {
        if (remaining_ == 0) {
            std::string line;
            if (need_chunk_crlf_) {
                if (!read_line(*conn_, leftover_, line)) return conn_->aborted() ? -1 : 0;
                need_chunk_crlf_ = false;
            }
            if (!read_line(*conn_, leftover_, line)) return conn_->aborted() ? -1 : 0;
            // Chunk size is hex, may have extensions after ';'
            size_t size = std::strtoul(line.c_str(), nullptr, 16);
            if (size == 0) {
                done_ = true;
                return 0;
            }
            remaining_ = size;
        }
        if (!leftover_.empty()) {
            size_t take = std::min(remaining_, leftover_.size());
            out.append(leftover_, 0, take);
            leftover_.erase(0, take);
            remaining_ -= take;
            if (remaining_ == 0) need_chunk_crlf_ = true;
            return static_cast<ssize_t>(take);
        }
        char buf[4096];
        ssize_t n = conn_->read_some(buf, std::min(remaining_, sizeof(buf)));
        if (n <= 0) return n;
        out.append(buf, static_cast<size_t>(n));
        remaining_ -= static_cast<size_t>(n);
        if (remaining_ == 0) need_chunk_crlf_ = true;
        return n;
    }

    bool use_length = content_length_ > 0;
    if (!leftover_.empty()) {
        size_t take = use_length ? std::min(remaining_, leftover_.size()) : leftover_.size();
        out.append(leftover_, 0, take);
        leftover_.erase(0, take);
        if (use_length) {
            remaining_ -= take;
            if (remaining_ == 0) done_ = true;
        }
        return static_cast<ssize_t>(take);
    }
    size_t want = use_length ? std::min(remaining_, static_cast<size_t>(4096)) : 4096;
    char buf[4096];
    ssize_t n = conn_->read_some(buf, want);
    if (n <= 0) {
        done_ = (n == 0);
        return n;
    }
    out.append(buf, static_cast<size_t>(n));
    if (use_length) {
        remaining_ -= static_cast<size_t>(n);
        if (remaining_ == 0) done_ = true;
    }
    return n;
}

std::string HttpStream::read_all() {
    std::string body;
    while (read(body) > 0) {}
    return body;
}

void HttpStream::abort() {
    conn_->abort();
}

} // namespace agentlink
