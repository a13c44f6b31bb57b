#pragma once
#include "accumulator.hpp"
#include "config.hpp"
#include "http.hpp"
#include "restrictions.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace agentlink {

struct Conversation {
    std::string id;
    std::string title;
    std::vector<StreamingMessage> messages; // tool-only messages already merged
};

struct ServerSession {
    std::string id;
    std::string conversation_id;
    nlohmann::json config;
};

// Request/response side channel next to the event streams.
// Non-2xx responses throw: AuthError (401/403), RateLimited (429),
// TransportError (unreachable) or std::runtime_error.
class AgentApi {
public:
    AgentApi(HttpClient& http, const Config& config);

    // Ask the server to stop an in-flight exchange.
    void cancel_request(const std::string& request_id);

    // Answer a client tool call in request-stream mode.
    void submit_response(const std::string& server_session_id,
                         const std::string& action_id,
                         const nlohmann::json& value);

    void terminate_session(const std::string& server_session_id);

    Conversation get_conversation(const std::string& conversation_id);

    ServerSession create_session(SessionKind kind, const std::string& definition_id);

private:
    nlohmann::json check(const HttpResponse& response, const std::string& what) const;
    std::vector<Header> headers() const;

    HttpClient& http_;
    const Config& config_;
};

} // namespace agentlink
