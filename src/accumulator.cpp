#include "accumulator.hpp"
#include "util.hpp"

#include <initializer_list>

namespace agentlink {

const char* message_status_name(MessageStatus status) {
    switch (status) {
        case MessageStatus::Thinking:    return "thinking";
        case MessageStatus::Streaming:   return "streaming";
        case MessageStatus::ToolCalling: return "tool-calling";
        case MessageStatus::Complete:    return "complete";
        case MessageStatus::Error:       return "error";
        case MessageStatus::Cancelled:   return "cancelled";
    }
    return "unknown";
}

static std::string string_field(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    if (!j.is_object()) return {};
    for (const char* key : keys) {
        if (j.contains(key) && j[key].is_string())
            return j[key].get<std::string>();
    }
    return {};
}

static ToolCallInfo tool_call_from_json(const nlohmann::json& j) {
    ToolCallInfo call;
    call.call_id = string_field(j, {"call_id", "id", "tool_call_id"});
    call.name = string_field(j, {"name", "tool_name"});
    if (call.name.empty() && j.is_object() && j.contains("function"))
        call.name = string_field(j["function"], {"name"});
    std::string status = string_field(j, {"status"});
    if (!status.empty()) call.status = status;
    return call;
}

static ToolResultInfo tool_result_from_json(const nlohmann::json& j) {
    ToolResultInfo result;
    result.call_id = string_field(j, {"call_id", "tool_call_id", "id"});
    result.name = string_field(j, {"tool_name", "name"});
    if (j.contains("success") && j["success"].is_boolean()) {
        result.success = j["success"].get<bool>();
    } else {
        result.success = string_field(j, {"status"}) != "failed";
    }
    if (j.contains("result") && !j["result"].is_null()) {
        const auto& r = j["result"];
        result.result_summary = r.is_string() ? r.get<std::string>() : r.dump();
    }
    result.error_detail = string_field(j, {"error"});
    if (j.contains("execution_time_ms") && j["execution_time_ms"].is_number())
        result.elapsed_ms = static_cast<int64_t>(j["execution_time_ms"].get<double>());
    return result;
}

StreamingMessage& MessageAccumulator::ensure_active() {
    if (!active_) {
        active_ = StreamingMessage{};
        active_->tool_calls = std::move(pending_calls_);
        active_->tool_results = std::move(pending_results_);
        pending_calls_.clear();
        pending_results_.clear();
    }
    return *active_;
}

AccumulatorUpdate MessageAccumulator::begin() {
    AccumulatorUpdate update;
    if (!active_) {
        ensure_active();
        update.changed = true;
    }
    return update;
}

AccumulatorUpdate MessageAccumulator::apply(const ProtocolEvent& event) {
    AccumulatorUpdate update;
    switch (event.type) {
        case EventType::StreamStarted:
        case EventType::AssistantThinking:
            return begin();

        case EventType::ContentChunk: {
            std::string text = event.payload.is_string()
                ? event.payload.get<std::string>()
                : string_field(event.payload, {"content", "delta"});
            if (text.empty()) return update;
            auto& msg = ensure_active();
            msg.content += text;
            msg.status = MessageStatus::Streaming;
            update.changed = true;
            return update;
        }

        case EventType::ToolCallsDetected:
            ensure_active();
            if (event.payload.is_object() && event.payload.contains("tool_calls"))
                add_tool_calls(event.payload["tool_calls"]);
            update.changed = true;
            return update;

        case EventType::ToolExecuting:
            note_tool_executing(event.payload);
            active_->status = MessageStatus::ToolCalling;
            update.changed = true;
            return update;

        case EventType::ToolResult:
            add_tool_result(event.payload);
            active_->status = MessageStatus::Streaming;
            update.changed = true;
            return update;

        case EventType::MessageComplete:
            return complete(event.payload);

        case EventType::Cancelled:
            return cancel();

        case EventType::MessageAdded:
        case EventType::StreamComplete:
        case EventType::SessionCompleted:
        case EventType::Error:
        case EventType::ClientAction:
        case EventType::RunSuspended:
        case EventType::RunResumed:
        case EventType::State:
        case EventType::Connected:
        case EventType::TemplateConfig:
        case EventType::TemplateProgress:
        case EventType::TemplateComplete:
        case EventType::Heartbeat:
        case EventType::Pong:
            return update;
    }
    return update;
}

void MessageAccumulator::add_tool_calls(const nlohmann::json& calls) {
    if (!calls.is_array()) return;
    for (const auto& c : calls) {
        ToolCallInfo call = tool_call_from_json(c);
        call.status = "calling";
        active_->tool_calls.push_back(std::move(call));
    }
}

void MessageAccumulator::note_tool_executing(const nlohmann::json& payload) {
    auto& msg = ensure_active();
    ToolCallInfo call = tool_call_from_json(payload);
    call.status = "calling";
    for (const auto& existing : msg.tool_calls) {
        bool same = !call.call_id.empty() ? existing.call_id == call.call_id
                                          : existing.name == call.name && existing.status == "calling";
        if (same) return;
    }
    msg.tool_calls.push_back(std::move(call));
}

void MessageAccumulator::add_tool_result(const nlohmann::json& payload) {
    auto& msg = ensure_active();
    ToolResultInfo result = tool_result_from_json(payload);

    for (auto& call : msg.tool_calls) {
        bool match = !result.call_id.empty() ? call.call_id == result.call_id
                                             : call.name == result.name && call.status == "calling";
        if (!match) continue;
        call.status = result.success ? "completed" : "failed";
        if (result.call_id.empty()) result.call_id = call.call_id;
        if (result.name.empty()) result.name = call.name;
        break;
    }
    msg.tool_results.push_back(std::move(result));
}

void MessageAccumulator::finish(MessageStatus status, AccumulatorUpdate& update) {
    active_->status = status;
    update.finished.push_back(std::move(*active_));
    active_.reset();
    update.changed = true;
}

AccumulatorUpdate MessageAccumulator::complete(const nlohmann::json& payload) {
    AccumulatorUpdate update;
    if (!active_) return update;

    std::string final_text = string_field(payload, {"content"});
    if (!final_text.empty()) active_->content = final_text;

    if (trim(active_->content).empty() && active_->has_tool_data()) {
        // Tool-only message: carried into the next one
        pending_calls_ = std::move(active_->tool_calls);
        pending_results_ = std::move(active_->tool_results);
        active_.reset();
        update.changed = true;
        return update;
    }
    finish(MessageStatus::Complete, update);
    return update;
}

AccumulatorUpdate MessageAccumulator::cancel(const std::string& placeholder) {
    AccumulatorUpdate update;
    if (!active_) return update;
    if (trim(active_->content).empty()) active_->content = placeholder;
    finish(MessageStatus::Cancelled, update);
    return update;
}

AccumulatorUpdate MessageAccumulator::fail(const std::string& placeholder) {
    AccumulatorUpdate update;
    auto& msg = ensure_active();
    msg.content = placeholder;
    finish(MessageStatus::Error, update);
    return update;
}

void MessageAccumulator::discard() {
    active_.reset();
}

AccumulatorUpdate MessageAccumulator::end_stream() {
    AccumulatorUpdate update;
    if (active_) {
        if (!trim(active_->content).empty()) {
            finish(MessageStatus::Complete, update);
        } else {
            pending_calls_.insert(pending_calls_.end(),
                                  active_->tool_calls.begin(), active_->tool_calls.end());
            pending_results_.insert(pending_results_.end(),
                                    active_->tool_results.begin(), active_->tool_results.end());
            active_.reset();
            update.changed = true;
        }
    }
    if (has_pending_tool_data()) {
        StreamingMessage trailing;
        trailing.tool_calls = std::move(pending_calls_);
        trailing.tool_results = std::move(pending_results_);
        trailing.status = MessageStatus::Complete;
        pending_calls_.clear();
        pending_results_.clear();
        update.finished.push_back(std::move(trailing));
    }
    return update;
}

std::vector<StreamingMessage> merge_tool_only_messages(const std::vector<StreamingMessage>& history) {
    std::vector<StreamingMessage> merged;
    std::vector<ToolCallInfo> calls;
    std::vector<ToolResultInfo> results;

    for (const auto& msg : history) {
        bool assistant = msg.role == "assistant";
        bool empty = trim(msg.content).empty();

        if (assistant && empty && msg.has_tool_data()) {
            calls.insert(calls.end(), msg.tool_calls.begin(), msg.tool_calls.end());
            results.insert(results.end(), msg.tool_results.begin(), msg.tool_results.end());
            continue;
        }
        if (assistant && !empty && (!calls.empty() || !results.empty())) {
            StreamingMessage combined = msg;
            combined.tool_calls.insert(combined.tool_calls.begin(), calls.begin(), calls.end());
            combined.tool_results.insert(combined.tool_results.begin(), results.begin(), results.end());
            calls.clear();
            results.clear();
            merged.push_back(std::move(combined));
            continue;
        }
        merged.push_back(msg);
    }

    if (!calls.empty() || !results.empty()) {
        StreamingMessage trailing;
        trailing.tool_calls = std::move(calls);
        trailing.tool_results = std::move(results);
        trailing.status = MessageStatus::Complete;
        merged.push_back(std::move(trailing));
    }
    return merged;
}

StreamingMessage message_from_json(const nlohmann::json& j) {
    StreamingMessage msg;
    msg.status = MessageStatus::Complete;
    msg.role = string_field(j, {"role"});
    if (msg.role.empty()) msg.role = "assistant";
    msg.content = string_field(j, {"content"});
    if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
        for (const auto& c : j["tool_calls"])
            msg.tool_calls.push_back(tool_call_from_json(c));
    }
    if (j.contains("tool_results") && j["tool_results"].is_array()) {
        for (const auto& r : j["tool_results"])
            msg.tool_results.push_back(tool_result_from_json(r));
    }
    return msg;
}

} // namespace agentlink
