#include "agent_api.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "util.hpp"

#include <iostream>

namespace agentlink {

AgentApi::AgentApi(HttpClient& http, const Config& config)
    : http_(http), config_(config) {}

std::vector<Header> AgentApi::headers() const {
    std::vector<Header> h = config_.auth_headers();
    h.emplace_back("Content-Type", "application/json");
    return h;
}

static std::string error_detail(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (j.is_object() && j.contains("detail")) {
            const auto& d = j["detail"];
            return d.is_string() ? d.get<std::string>() : d.dump();
        }
    } catch (const nlohmann::json::exception&) {
        // Not JSON; fall through to the raw body
    }
    return body;
}

nlohmann::json AgentApi::check(const HttpResponse& response, const std::string& what) const {
    long status = response.status_code;
    if (status == 0)
        throw TransportError(what + ": server unreachable");
    if (status == 401 || status == 403)
        throw AuthError(what + ": " + error_detail(response.body));
    if (status == 429)
        throw RateLimited(what + ": " + error_detail(response.body));
    if (status < 200 || status >= 300)
        throw std::runtime_error(what + " failed (HTTP " + std::to_string(status) + "): " +
                                 error_detail(response.body));

    if (trim(response.body).empty()) return nullptr;
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[api] " << what << " returned non-JSON body: " << e.what() << "\n";
        return nullptr;
    }
}

void AgentApi::cancel_request(const std::string& request_id) {
    auto resp = http_.post(config_.api_url("/chat/cancel/" + url_encode(request_id)),
                           "{}", headers());
    check(resp, "cancel");
}

void AgentApi::submit_response(const std::string& server_session_id,
                               const std::string& action_id,
                               const nlohmann::json& value) {
    auto body = outbound::respond_body(action_id, value);
    auto resp = http_.post(config_.api_url("/session/" + url_encode(server_session_id) + "/respond"),
                           body.dump(), headers());
    check(resp, "respond");
}

void AgentApi::terminate_session(const std::string& server_session_id) {
    auto resp = http_.del(config_.api_url("/session/" + url_encode(server_session_id)),
                          headers());
    check(resp, "terminate");
}

Conversation AgentApi::get_conversation(const std::string& conversation_id) {
    auto resp = http_.get(config_.api_url("/chat/conversations/" + url_encode(conversation_id)),
                          headers());
    auto j = check(resp, "conversation");

    Conversation conv;
    conv.id = conversation_id;
    if (!j.is_object()) return conv;
    if (j.contains("title") && j["title"].is_string())
        conv.title = j["title"].get<std::string>();

    std::vector<StreamingMessage> history;
    if (j.contains("messages") && j["messages"].is_array()) {
        for (const auto& m : j["messages"])
            history.push_back(message_from_json(m));
    }
    conv.messages = merge_tool_only_messages(history);
    return conv;
}

ServerSession AgentApi::create_session(SessionKind kind, const std::string& definition_id) {
    nlohmann::json body = {{"session_type", session_kind_name(kind)}};
    if (!definition_id.empty()) body["definition_id"] = definition_id;

    auto resp = http_.post(config_.api_url("/session/"), body.dump(), headers());
    auto j = check(resp, "create session");

    ServerSession session;
    if (!j.is_object()) throw std::runtime_error("create session: empty response");
    for (const char* key : {"session_id", "id"}) {
        if (j.contains(key) && j[key].is_string()) {
            session.id = j[key].get<std::string>();
            break;
        }
    }
    if (session.id.empty()) throw std::runtime_error("create session: no session id");
    if (j.contains("conversation_id") && j["conversation_id"].is_string())
        session.conversation_id = j["conversation_id"].get<std::string>();
    if (j.contains("config")) session.config = j["config"];
    return session;
}

} // namespace agentlink
