#include "sse.hpp"

namespace agentlink {

static std::string field_value(const std::string& line, size_t colon) {
    size_t start = colon + 1;
    if (start < line.size() && line[start] == ' ') ++start;
    return line.substr(start);
}

void SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break;

        std::string line = buffer_.substr(pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        if (line.empty()) {
            // Blank line terminates the block
            if (has_data_) {
                SSEEvent event = std::move(pending_);
                pending_ = SSEEvent{};
                has_data_ = false;
                if (!callback(event)) {
                    buffer_.erase(0, pos);
                    return;
                }
            } else {
                pending_ = SSEEvent{};
            }
            continue;
        }
        if (line[0] == ':') continue; // comment / keepalive

        size_t colon = line.find(':');
        std::string field = colon == std::string::npos ? line : line.substr(0, colon);
        std::string value = colon == std::string::npos ? std::string() : field_value(line, colon);

        if (field == "event") {
            pending_.event = value;
        } else if (field == "data") {
            if (has_data_) pending_.data += '\n';
            pending_.data += value;
            has_data_ = true;
        } else if (field == "id") {
            pending_.id = value;
        }
        // retry and unknown fields are ignored
    }

    buffer_.erase(0, pos);
}

void SSEParser::reset() {
    buffer_.clear();
    pending_ = SSEEvent{};
    has_data_ = false;
}

} // namespace agentlink
