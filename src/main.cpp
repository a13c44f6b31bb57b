#include "agent_api.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "multiplexer.hpp"
#include "socket_connection.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>
#include <mutex>
#include <unordered_map>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: agentlink [options]\n"
              << "\n"
              << "Options:\n"
              << "  --transport NAME     Stream transport (sse, websocket)\n"
              << "  --base-url URL       Agent server base URL\n"
              << "  --definition ID      Agent definition for the first session\n"
              << "  --proactive          Start a server-driven (templated) session\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /new [DEFINITION]    Start a new agent session and switch to it\n"
              << "  /sessions            List sessions\n"
              << "  /switch ID           Switch the active session\n"
              << "  /home                Leave the active session running in the background\n"
              << "  /end [ID]            End a session\n"
              << "  /cancel              Cancel the current response\n"
              << "  /respond VALUE       Answer the pending widget (JSON or text)\n"
              << "  /history             Show the active session's conversation\n"
              << "  /login TOKEN         Store a new access token (ends all sessions)\n"
              << "  /quit, /exit         Exit\n"
              << "\n"
              << "Environment variables:\n"
              << "  AGENTLINK_BASE_URL   Server base URL\n"
              << "  AGENTLINK_TOKEN      Bearer token\n"
              << "  AGENTLINK_TRANSPORT  sse or websocket\n"
              << "  AGENTLINK_MODEL      Model id sent with each message\n";
}

// Terminal rendering of bus events. Handlers run on the consumer thread.
struct Renderer {
    std::mutex mutex;
    std::unordered_map<std::string, size_t> printed; // session -> chars shown
    std::unordered_map<std::string, size_t> tools_shown;
    agentlink::WidgetResponder pending_widget;

    void attach(agentlink::EventBus& bus) {
        using namespace agentlink;

        subscribe<MessageUpdatedEvent>(bus, [this](const MessageUpdatedEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex);
            show(ev.session_id, ev.message);
        });

        subscribe<MessageFinalizedEvent>(bus, [this](const MessageFinalizedEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex);
            show(ev.session_id, ev.message);
            if (ev.message.status != MessageStatus::Complete)
                std::cout << " [" << message_status_name(ev.message.status) << "]";
            std::cout << "\n" << std::flush;
            printed.erase(ev.session_id);
            tools_shown.erase(ev.session_id);
        });

        subscribe<UserBubbleEvent>(bus, [](const UserBubbleEvent& ev) {
            std::cout << "you> " << ev.content << "\n" << std::flush;
        });

        subscribe<WidgetRequestedEvent>(bus, [this](const WidgetRequestedEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex);
            pending_widget = ev.responder;
            std::cout << "\n[widget:" << ev.action.widget_type << "] "
                      << ev.action.props.dump() << "\n"
                      << "Answer with /respond VALUE\n" << std::flush;
        });

        subscribe<WidgetDismissedEvent>(bus, [this](const WidgetDismissedEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex);
            if (pending_widget.action_id() == ev.action_id)
                pending_widget = WidgetResponder();
        });

        subscribe<SessionStatusChangedEvent>(bus, [](const SessionStatusChangedEvent& ev) {
            if (ev.status == SessionStatus::Error || ev.status == SessionStatus::Terminated)
                std::cout << "[" << ev.session_id << "] " << session_status_name(ev.status)
                          << "\n" << std::flush;
        });

        subscribe<ConnectionStateChangedEvent>(bus, [](const ConnectionStateChangedEvent& ev) {
            if (ev.gave_up) {
                std::cout << "[" << ev.session_id << "] Connection lost.\n" << std::flush;
            } else if (ev.delay_ms > 0) {
                std::cout << "[" << ev.session_id << "] Reconnecting in " << ev.delay_ms
                          << "ms (attempt " << ev.attempt << ")\n" << std::flush;
            }
        });

        subscribe<TokenExpiredEvent>(bus, [](const TokenExpiredEvent& ev) {
            std::cout << "Session expired (" << ev.detail << "). Use /login TOKEN.\n" << std::flush;
        });

        subscribe<RateLimitedEvent>(bus, [](const RateLimitedEvent& ev) {
            std::cout << "Rate limited: " << ev.detail << "\n" << std::flush;
        });

        subscribe<TemplateProgressEvent>(bus, [](const TemplateProgressEvent& ev) {
            std::cout << "[progress] " << ev.progress.dump() << "\n" << std::flush;
        });

        subscribe<TemplateCompleteEvent>(bus, [](const TemplateCompleteEvent& ev) {
            std::cout << "[complete] " << ev.summary.dump() << "\n" << std::flush;
        });

        subscribe<SessionEndedEvent>(bus, [](const SessionEndedEvent& ev) {
            std::cout << "[" << ev.session_id << "] ended (" << ev.reason << ")\n" << std::flush;
        });
    }

    void show(const std::string& session_id, const agentlink::StreamingMessage& msg) {
        size_t& tools = tools_shown[session_id];
        for (; tools < msg.tool_calls.size(); ++tools)
            std::cout << "\n[tool] " << msg.tool_calls[tools].name << "\n";

        size_t& shown = printed[session_id];
        if (msg.content.size() > shown) {
            std::cout << msg.content.substr(shown);
            shown = msg.content.size();
        }
        std::cout << std::flush;
    }
};

static nlohmann::json parse_answer(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception&) {
        return {{"text", text}};
    }
}

static std::string start_session(agentlink::SessionMultiplexer& mux,
                                 agentlink::AgentApi& api,
                                 const agentlink::Config& config,
                                 const std::string& definition_id,
                                 bool proactive) {
    agentlink::SessionOptions options;
    options.kind = proactive ? agentlink::SessionKind::Proactive : agentlink::SessionKind::Reactive;
    options.definition_id = definition_id;

    if (proactive) {
        auto created = api.create_session(options.kind, definition_id);
        options.server_session_id = created.id;
        options.conversation_id = created.conversation_id;
        options.server_config = created.config;
    }

    std::string id = mux.create_session(std::move(options));
    mux.switch_to(id);
    if (proactive || config.transport_kind() == agentlink::TransportKind::DuplexSocket)
        mux.connect_session(id);
    if (proactive) mux.start_exchange("");
    return id;
}

int main(int argc, char* argv[]) try {
    std::string transport;
    std::string base_url;
    std::string definition_id;
    bool proactive = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--transport") == 0 && i + 1 < argc) {
            transport = argv[++i];
        } else if (std::strcmp(argv[i], "--base-url") == 0 && i + 1 < argc) {
            base_url = argv[++i];
        } else if (std::strcmp(argv[i], "--definition") == 0 && i + 1 < argc) {
            definition_id = argv[++i];
        } else if (std::strcmp(argv[i], "--proactive") == 0) {
            proactive = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = agentlink::Config::load();
    if (!transport.empty()) config.transport = transport;
    if (!base_url.empty()) config.base_url = base_url;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    agentlink::http_set_abort_flag(&g_shutdown);

    agentlink::SocketHttpClient http_client;
    agentlink::AgentApi api(http_client, config);
    agentlink::EventBus bus;
    Renderer renderer;
    renderer.attach(bus);

    agentlink::SessionMultiplexer mux(config, bus, agentlink::make_socket_transport, &api);

    std::thread consumer([&mux]() {
        while (!g_shutdown.load())
            mux.wait_and_process(std::chrono::milliseconds(100));
    });

    std::cout << "agentlink\n"
              << "Server: " << config.base_url << " | Transport: " << config.transport << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    try {
        start_session(mux, api, config, definition_id, proactive);
    } catch (const std::exception& e) {
        std::cerr << "Could not start session: " << e.what() << "\n";
    }

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << "agentlink> " << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }
        line = agentlink::trim(line);
        if (line.empty()) continue;

        try {
            if (line[0] != '/') {
                mux.start_exchange(line);
                continue;
            }

            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/help") {
                print_usage();
            } else if (line == "/new" || line.rfind("/new ", 0) == 0) {
                std::string def = line.size() > 5 ? agentlink::trim(line.substr(5)) : definition_id;
                std::cout << "Session " << start_session(mux, api, config, def, false) << "\n";
            } else if (line == "/sessions") {
                for (const auto& id : mux.session_ids()) {
                    auto info = mux.session_info(id);
                    if (!info) continue;
                    std::cout << (info->active ? "* " : "  ") << id << "  "
                              << agentlink::session_kind_name(info->kind) << "  "
                              << agentlink::session_status_name(info->status);
                    if (info->buffered_events > 0)
                        std::cout << "  (" << info->buffered_events << " buffered)";
                    std::cout << "\n";
                }
            } else if (line.rfind("/switch ", 0) == 0) {
                mux.switch_to(agentlink::trim(line.substr(8)));
            } else if (line == "/home") {
                mux.deactivate();
            } else if (line == "/end" || line.rfind("/end ", 0) == 0) {
                std::string id = line.size() > 5 ? agentlink::trim(line.substr(5))
                                                 : mux.active_session_id();
                if (id.empty()) {
                    std::cout << "No active session.\n";
                } else {
                    mux.terminate_session(id);
                }
            } else if (line == "/cancel") {
                if (!mux.cancel_current()) std::cout << "Nothing to cancel.\n";
            } else if (line.rfind("/respond ", 0) == 0) {
                agentlink::WidgetResponder responder;
                {
                    std::lock_guard<std::mutex> lock(renderer.mutex);
                    responder = renderer.pending_widget;
                }
                if (responder.used()) {
                    std::cout << "No widget is waiting for an answer.\n";
                } else {
                    responder.respond(parse_answer(agentlink::trim(line.substr(9))));
                }
            } else if (line == "/history") {
                auto info = mux.session_info(mux.active_session_id());
                if (!info || info->conversation_id.empty()) {
                    std::cout << "No conversation yet.\n";
                } else if (!info->restrictions.can_access_history) {
                    std::cout << "History is not available in this session.\n";
                } else {
                    auto conv = api.get_conversation(info->conversation_id);
                    if (!conv.title.empty()) std::cout << "# " << conv.title << "\n";
                    for (const auto& msg : conv.messages) {
                        std::cout << msg.role << "> " << msg.content;
                        if (!msg.tool_calls.empty())
                            std::cout << " (" << msg.tool_calls.size() << " tool calls)";
                        std::cout << "\n";
                    }
                }
            } else if (line.rfind("/login ", 0) == 0) {
                std::string token = agentlink::trim(line.substr(7));
                mux.close_all();
                config.access_token = token;
                bool saved = agentlink::modify_config_json([&token](nlohmann::json& j) {
                    j["access_token"] = token;
                });
                std::cout << (saved ? "Token saved.\n" : "Token set for this run (config not written).\n");
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
        } catch (const agentlink::ProtocolViolation& e) {
            std::cout << "Not allowed: " << e.what() << "\n";
        } catch (const agentlink::AuthError& e) {
            std::cout << "Authorization failed: " << e.what() << ". Use /login TOKEN.\n";
        } catch (const std::exception& e) {
            std::cout << "Error: " << e.what() << "\n";
        }
    }

    g_shutdown.store(true);
    consumer.join();
    mux.close_all();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
