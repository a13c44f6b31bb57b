#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace agentlink {

static const char* kConfigPath = "~/.agentlink/config.json";

nlohmann::json Config::defaults_json() {
    return {
        {"base_url", "http://localhost:8000"},
        {"api_prefix", "/api"},
        {"transport", "sse"},
        {"access_token", ""},
        {"model_id", ""},
        {"connection", {
            {"reconnect_initial_delay_ms", 1000},
            {"max_reconnect_attempts", 5},
            {"keepalive_interval_ms", 30000},
            {"connect_timeout_seconds", 30}
        }},
        {"restrictions", {
            {"reactive", nlohmann::json::object()},
            {"proactive", nlohmann::json::object()}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (j.contains("base_url") && j["base_url"].is_string())
        cfg.base_url = j["base_url"].get<std::string>();
    if (j.contains("api_prefix") && j["api_prefix"].is_string())
        cfg.api_prefix = j["api_prefix"].get<std::string>();
    if (j.contains("transport") && j["transport"].is_string())
        cfg.transport = j["transport"].get<std::string>();
    if (j.contains("access_token") && j["access_token"].is_string())
        cfg.access_token = j["access_token"].get<std::string>();
    if (j.contains("model_id") && j["model_id"].is_string())
        cfg.model_id = j["model_id"].get<std::string>();

    if (j.contains("connection") && j["connection"].is_object()) {
        auto& c = j["connection"];
        if (c.contains("reconnect_initial_delay_ms") && c["reconnect_initial_delay_ms"].is_number_integer())
            cfg.connection.reconnect.initial_delay_ms = c["reconnect_initial_delay_ms"].get<uint32_t>();
        if (c.contains("max_reconnect_attempts") && c["max_reconnect_attempts"].is_number_integer())
            cfg.connection.reconnect.max_attempts = c["max_reconnect_attempts"].get<uint32_t>();
        if (c.contains("keepalive_interval_ms") && c["keepalive_interval_ms"].is_number_integer())
            cfg.connection.keepalive_interval_ms = c["keepalive_interval_ms"].get<uint32_t>();
        if (c.contains("connect_timeout_seconds") && c["connect_timeout_seconds"].is_number_integer())
            cfg.connection.connect_timeout_seconds = c["connect_timeout_seconds"].get<long>();
    }

    if (j.contains("restrictions") && j["restrictions"].is_object()) {
        for (auto& [kind, obj] : j["restrictions"].items()) {
            if (obj.is_object() && !obj.empty())
                cfg.restrictions[kind] = obj;
        }
    }
    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home(kConfigPath);
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path << ": "
                      << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("AGENTLINK_BASE_URL"))
        cfg.base_url = v;
    if (const char* v = std::getenv("AGENTLINK_TOKEN"))
        cfg.access_token = v;
    if (const char* v = std::getenv("AGENTLINK_TRANSPORT"))
        cfg.transport = v;
    if (const char* v = std::getenv("AGENTLINK_MODEL"))
        cfg.model_id = v;

    return cfg;
}

TransportKind Config::transport_kind() const {
    if (transport == "websocket" || transport == "ws")
        return TransportKind::DuplexSocket;
    return TransportKind::RequestStream;
}

std::string Config::api_url(const std::string& path) const {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + api_prefix + path;
}

std::string Config::socket_url(const std::string& path) const {
    std::string url = api_url(path);
    if (url.rfind("https://", 0) == 0) return "wss://" + url.substr(8);
    if (url.rfind("http://", 0) == 0) return "ws://" + url.substr(7);
    return url;
}

std::vector<Header> Config::auth_headers() const {
    std::vector<Header> headers;
    if (!access_token.empty())
        headers.emplace_back("Authorization", "Bearer " + access_token);
    return headers;
}

nlohmann::json Config::restriction_overrides(SessionKind kind) const {
    auto it = restrictions.find(session_kind_name(kind));
    if (it != restrictions.end()) return it->second;
    return nullptr;
}

bool modify_config_json(const std::function<void(nlohmann::json&)>& modifier) {
    std::string config_path = expand_home(kConfigPath);
    nlohmann::json j = Config::defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), Config::defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Rewriting malformed " << config_path << ": "
                      << e.what() << "\n";
        }
    }
    modifier(j);
    return atomic_write_file(config_path, j.dump(4) + "\n");
}

} // namespace agentlink
