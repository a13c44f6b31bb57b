#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace agentlink;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.base_url == "http://localhost:8000");
    REQUIRE(cfg.api_prefix == "/api");
    REQUIRE(cfg.transport == "sse");
    REQUIRE(cfg.access_token.empty());
    REQUIRE(cfg.connection.reconnect.initial_delay_ms == 1000);
    REQUIRE(cfg.connection.reconnect.max_attempts == 5);
    REQUIRE(cfg.connection.keepalive_interval_ms == 30000);
    REQUIRE(cfg.restrictions.empty());
}

TEST_CASE("Config: defaults_json matches struct defaults", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    Config plain;
    REQUIRE(cfg.base_url == plain.base_url);
    REQUIRE(cfg.transport == plain.transport);
    REQUIRE(cfg.connection.reconnect.max_attempts == plain.connection.reconnect.max_attempts);
    REQUIRE(cfg.connection.connect_timeout_seconds == plain.connection.connect_timeout_seconds);
    // Empty per-kind objects are not overrides
    REQUIRE(cfg.restrictions.empty());
}

// ── Derived values ──────────────────────────────────────────────

TEST_CASE("Config::transport_kind: maps names", "[config]") {
    Config cfg;
    REQUIRE(cfg.transport_kind() == TransportKind::RequestStream);
    cfg.transport = "websocket";
    REQUIRE(cfg.transport_kind() == TransportKind::DuplexSocket);
    cfg.transport = "ws";
    REQUIRE(cfg.transport_kind() == TransportKind::DuplexSocket);
    cfg.transport = "anything-else";
    REQUIRE(cfg.transport_kind() == TransportKind::RequestStream);
}

TEST_CASE("Config::api_url: joins base, prefix and path", "[config]") {
    Config cfg;
    cfg.base_url = "https://agents.example.com/";
    REQUIRE(cfg.api_url("/chat/send") == "https://agents.example.com/api/chat/send");

    cfg.api_prefix = "";
    REQUIRE(cfg.api_url("/x") == "https://agents.example.com/x");
}

TEST_CASE("Config::socket_url: switches the scheme", "[config]") {
    Config cfg;
    REQUIRE(cfg.socket_url("/chat/ws") == "ws://localhost:8000/api/chat/ws");
    cfg.base_url = "https://agents.example.com";
    REQUIRE(cfg.socket_url("/chat/ws") == "wss://agents.example.com/api/chat/ws");
}

TEST_CASE("Config::auth_headers: bearer token only when set", "[config]") {
    Config cfg;
    REQUIRE(cfg.auth_headers().empty());

    cfg.access_token = "tok-123";
    auto headers = cfg.auth_headers();
    REQUIRE(headers.size() == 1);
    REQUIRE(headers[0].first == "Authorization");
    REQUIRE(headers[0].second == "Bearer tok-123");
}

TEST_CASE("Config::restriction_overrides: per kind", "[config]") {
    Config cfg;
    REQUIRE(cfg.restriction_overrides(SessionKind::Reactive).is_null());

    cfg.restrictions["proactive"] = {{"canSwitchAgents", true}};
    auto o = cfg.restriction_overrides(SessionKind::Proactive);
    REQUIRE(o["canSwitchAgents"] == true);
    REQUIRE(cfg.restriction_overrides(SessionKind::Reactive).is_null());
}

// ── from_json ───────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads connection settings", "[config]") {
    nlohmann::json j = {
        {"transport", "websocket"},
        {"connection", {
            {"reconnect_initial_delay_ms", 250},
            {"max_reconnect_attempts", 2},
            {"keepalive_interval_ms", 5000},
            {"connect_timeout_seconds", 7}
        }}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.transport_kind() == TransportKind::DuplexSocket);
    REQUIRE(cfg.connection.reconnect.initial_delay_ms == 250);
    REQUIRE(cfg.connection.reconnect.max_attempts == 2);
    REQUIRE(cfg.connection.keepalive_interval_ms == 5000);
    REQUIRE(cfg.connection.connect_timeout_seconds == 7);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    nlohmann::json j = {
        {"base_url", 42},
        {"connection", {{"max_reconnect_attempts", "many"}}},
        {"restrictions", {{"reactive", "nope"}}}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.base_url == "http://localhost:8000");
    REQUIRE(cfg.connection.reconnect.max_attempts == 5);
    REQUIRE(cfg.restrictions.empty());
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "agentlink_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("AGENTLINK_BASE_URL");
        unsetenv("AGENTLINK_TOKEN");
        unsetenv("AGENTLINK_TRANSPORT");
        unsetenv("AGENTLINK_MODEL");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("AGENTLINK_BASE_URL");
        unsetenv("AGENTLINK_TOKEN");
        unsetenv("AGENTLINK_TRANSPORT");
        unsetenv("AGENTLINK_MODEL");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.agentlink/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.agentlink");
        std::ofstream f(config_path());
        f << content;
    }

    nlohmann::json read_config() const {
        std::ifstream f(config_path());
        return nlohmann::json::parse(f);
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "base_url": "https://agents.example.com",
        "transport": "websocket",
        "access_token": "tok-file",
        "model_id": "m-1",
        "connection": { "max_reconnect_attempts": 3 },
        "restrictions": { "proactive": { "canTypeFreeText": true } }
    })");

    Config cfg = Config::load();

    REQUIRE(cfg.base_url == "https://agents.example.com");
    REQUIRE(cfg.transport_kind() == TransportKind::DuplexSocket);
    REQUIRE(cfg.access_token == "tok-file");
    REQUIRE(cfg.model_id == "m-1");
    REQUIRE(cfg.connection.reconnect.max_attempts == 3);
    REQUIRE(cfg.connection.reconnect.initial_delay_ms == 1000);
    REQUIRE(cfg.restriction_overrides(SessionKind::Proactive)["canTypeFreeText"] == true);
}

TEST_CASE("Config::load: missing keys are migrated into the file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"base_url": "http://custom:9000"})");
    Config cfg = Config::load();
    REQUIRE(cfg.base_url == "http://custom:9000");

    auto j = g.read_config();
    REQUIRE(j["base_url"] == "http://custom:9000");
    REQUIRE(j.contains("connection"));
    REQUIRE(j["connection"]["keepalive_interval_ms"] == 30000);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"base_url": "http://from-file", "access_token": "from-file"})");
    setenv("AGENTLINK_BASE_URL", "http://from-env", 1);
    setenv("AGENTLINK_TOKEN", "tok-env", 1);
    setenv("AGENTLINK_TRANSPORT", "websocket", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.base_url == "http://from-env");
    REQUIRE(cfg.access_token == "tok-env");
    REQUIRE(cfg.transport_kind() == TransportKind::DuplexSocket);
}

TEST_CASE("Config::load: missing file creates defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.base_url == "http://localhost:8000");
    REQUIRE(std::filesystem::exists(g.config_path()));
    REQUIRE(g.read_config()["transport"] == "sse");
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("{ not json");
    Config cfg = Config::load();
    REQUIRE(cfg.base_url == "http://localhost:8000");
    REQUIRE(cfg.transport == "sse");
}

// ── modify_config_json ──────────────────────────────────────────

TEST_CASE("modify_config_json: updates and keeps other keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"base_url": "http://keep-me"})");
    REQUIRE(modify_config_json([](nlohmann::json& j) {
        j["access_token"] = "tok-new";
    }));

    auto j = g.read_config();
    REQUIRE(j["access_token"] == "tok-new");
    REQUIRE(j["base_url"] == "http://keep-me");

    Config cfg = Config::load();
    REQUIRE(cfg.access_token == "tok-new");
}

TEST_CASE("modify_config_json: creates the file when absent", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    REQUIRE(modify_config_json([](nlohmann::json& j) { j["model_id"] = "m-2"; }));
    auto j = g.read_config();
    REQUIRE(j["model_id"] == "m-2");
    REQUIRE(j["transport"] == "sse");
}
