#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace agentlink {

using EventHandler = std::function<void(const Event&)>;

// Subscribing with this tag receives every published event.
constexpr const char* kAnyEvent = "*";

class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish synchronously: tag subscribers in registration order, then
    // kAnyEvent subscribers. Handlers run without the bus mutex held; an
    // exception from one handler is logged and does not stop the others.
    void publish(const Event& event);

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    std::unordered_map<uint64_t, std::string> tag_of_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace agentlink
