#pragma once
#include <string>
#include <functional>

namespace agentlink {

struct SSEEvent {
    std::string event; // value of the `event:` line, empty if absent
    std::string data;  // `data:` lines joined with '\n'
    std::string id;
};

// Callback receives each parsed SSE block. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental SSE block parser. Partial lines and partial blocks are kept
// across feed() calls, so a block may arrive in any number of pieces.
class SSEParser {
public:
    void feed(const std::string& chunk, const SSECallback& callback);

    void reset();

private:
    std::string buffer_;
    SSEEvent pending_;
    bool has_data_ = false;
};

} // namespace agentlink
