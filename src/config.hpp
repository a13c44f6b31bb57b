#pragma once
#include "connection.hpp"
#include "http.hpp"
#include "protocol.hpp"
#include "restrictions.hpp"
#include <string>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace agentlink {

struct Config {
    std::string base_url = "http://localhost:8000";
    std::string api_prefix = "/api";
    std::string transport = "sse";  // "sse" or "websocket"
    std::string access_token;
    std::string model_id;

    ConnectionOptions connection;

    // Per-kind restriction overrides ("reactive", "proactive")
    std::unordered_map<std::string, nlohmann::json> restrictions;

    // Load from ~/.agentlink/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build from an already-merged config object
    static Config from_json(const nlohmann::json& j);

    TransportKind transport_kind() const;

    // base_url + api_prefix + path
    std::string api_url(const std::string& path) const;

    // Same, with the scheme switched to ws:// or wss://
    std::string socket_url(const std::string& path) const;

    // Authorization and content headers for REST and stream requests
    std::vector<Header> auth_headers() const;

    // Restriction overrides for a kind (null if none configured)
    nlohmann::json restriction_overrides(SessionKind kind) const;
};

// Read-modify-write ~/.agentlink/config.json atomically.
// The callback receives a mutable reference to the parsed JSON.
bool modify_config_json(const std::function<void(nlohmann::json&)>& modifier);

} // namespace agentlink
