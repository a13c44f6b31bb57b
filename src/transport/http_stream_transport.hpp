#pragma once
#include "../transport.hpp"
#include <atomic>

namespace agentlink {

// Request-stream transport: one HTTP request whose response body is an
// event stream. Closes when the server ends the body.
class HttpStreamTransport : public Transport {
public:
    OpenResult open(const Endpoint& endpoint, long timeout_seconds) override;
    ReadResult receive() override;
    bool send(const std::string& text) override;
    void close() override;

private:
    HttpStream stream_;
    std::atomic<bool> closing_{false};
};

} // namespace agentlink
