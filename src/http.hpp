#pragma once
#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <unordered_map>
#include <sys/types.h>

namespace agentlink {

class SocketConnection;

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0 = no response (connect/write failure)
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30) = 0;
    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;
    virtual HttpResponse del(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;
};

// POSIX sockets + OpenSSL
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
    HttpResponse del(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;
};

// One streamed HTTP request whose body is pulled piece by piece.
class HttpStream {
public:
    HttpStream();
    ~HttpStream();
    HttpStream(const HttpStream&) = delete;
    HttpStream& operator=(const HttpStream&) = delete;

    // Sends the request and reads the response head. Returns the status
    // code, or 0 if the server could not be reached.
    long open(const std::string& method,
              const std::string& url,
              const std::string& body,
              const std::vector<Header>& headers,
              long timeout_seconds);

    // Appends the next piece of (de-chunked) body to `out`.
    // Returns bytes appended, 0 at end of body, -1 on error or abort.
    ssize_t read(std::string& out);

    // Drain the rest of the body (error responses).
    std::string read_all();

    // Unblocks a read() running on another thread.
    void abort();

private:
    std::unique_ptr<SocketConnection> conn_;
    std::string leftover_;
    bool chunked_ = false;
    size_t content_length_ = 0;
    size_t remaining_ = 0;
    bool need_chunk_crlf_ = false;
    bool done_ = false;
};

// Status line and headers of a response. Header names are lowercased.
struct ResponseHead {
    long status = 0;
    std::unordered_map<std::string, std::string> headers;
    bool chunked = false;
    size_t content_length = 0;
};

// Reads the response head; bytes read past it are left in `leftover`.
ResponseHead read_response_head(SocketConnection& conn, std::string& leftover);

// Build a raw HTTP/1.1 request (exposed for the WebSocket upgrade).
std::string build_request(const std::string& method,
                          const std::string& host,
                          const std::string& path,
                          const std::string& body,
                          const std::vector<Header>& headers,
                          bool keep_alive);

} // namespace agentlink
