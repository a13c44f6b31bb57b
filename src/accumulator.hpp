#pragma once
#include "protocol.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentlink {

enum class MessageStatus { Thinking, Streaming, ToolCalling, Complete, Error, Cancelled };

const char* message_status_name(MessageStatus status);

struct ToolCallInfo {
    std::string call_id;
    std::string name;
    std::string status = "calling"; // calling | completed | failed
};

struct ToolResultInfo {
    std::string call_id;
    std::string name;
    bool success = false;
    std::string result_summary;
    std::string error_detail;
    int64_t elapsed_ms = 0;
};

struct StreamingMessage {
    std::string role = "assistant";
    std::string content;
    std::vector<ToolCallInfo> tool_calls;
    std::vector<ToolResultInfo> tool_results;
    MessageStatus status = MessageStatus::Thinking;

    bool is_final() const {
        return status == MessageStatus::Complete || status == MessageStatus::Error ||
               status == MessageStatus::Cancelled;
    }
    bool has_tool_data() const { return !tool_calls.empty() || !tool_results.empty(); }
};

constexpr const char* kCancelledPlaceholder = "_Response cancelled_";
constexpr const char* kSessionExpiredPlaceholder = "_Session expired_";

// What one accumulator step produced for the rendering side.
struct AccumulatorUpdate {
    bool changed = false;                    // active message was modified
    std::vector<StreamingMessage> finished;  // messages that reached a final status
};

// Folds the content and tool events of one session into the message the
// agent is currently producing. Messages that complete with no text but
// with tool activity are carried into the next message instead of being
// finished on their own.
class MessageAccumulator {
public:
    // Content and tool events; other event types are ignored.
    AccumulatorUpdate apply(const ProtocolEvent& event);

    // Start a fresh message in `thinking` unless one is in progress.
    AccumulatorUpdate begin();

    // Freeze the active message with an error placeholder.
    AccumulatorUpdate fail(const std::string& placeholder);

    // Freeze with the text so far, or the placeholder when there is none.
    AccumulatorUpdate cancel(const std::string& placeholder = kCancelledPlaceholder);

    // Drop the active message without finishing it (rate limiting).
    void discard();

    // End of the exchange: completes the active message and flushes any
    // carried tool data as a trailing message.
    AccumulatorUpdate end_stream();

    const std::optional<StreamingMessage>& active() const { return active_; }
    bool has_pending_tool_data() const {
        return !pending_calls_.empty() || !pending_results_.empty();
    }

private:
    StreamingMessage& ensure_active();
    void add_tool_calls(const nlohmann::json& calls);
    void note_tool_executing(const nlohmann::json& payload);
    void add_tool_result(const nlohmann::json& payload);
    AccumulatorUpdate complete(const nlohmann::json& payload);
    void finish(MessageStatus status, AccumulatorUpdate& update);

    std::optional<StreamingMessage> active_;
    std::vector<ToolCallInfo> pending_calls_;
    std::vector<ToolResultInfo> pending_results_;
};

// Same carry-forward rule applied to stored conversation history: an
// assistant message with empty content contributes its tool data to the
// next assistant message that has content.
std::vector<StreamingMessage> merge_tool_only_messages(const std::vector<StreamingMessage>& history);

// History entry from the REST API ({role, content, tool_calls, tool_results}).
StreamingMessage message_from_json(const nlohmann::json& j);

} // namespace agentlink
