#include "event_bus.hpp"

#include <iostream>
#include <stdexcept>

namespace agentlink {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[tag].push_back(Subscription{id, std::move(handler)});
    tag_of_[id] = tag;
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tag_it = tag_of_.find(id);
    if (tag_it == tag_of_.end()) return false;

    auto& subs = handlers_[tag_it->second];
    for (auto it = subs.begin(); it != subs.end(); ++it) {
        if (it->id == id) {
            subs.erase(it);
            break;
        }
    }
    if (subs.empty()) handlers_.erase(tag_it->second);
    tag_of_.erase(tag_it);
    return true;
}

void EventBus::publish(const Event& event) {
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const char* tag : {event.type_tag, kAnyEvent}) {
            auto it = handlers_.find(tag);
            if (it == handlers_.end()) continue;
            for (const auto& sub : it->second)
                to_call.push_back(sub.handler);
        }
    }
    for (const auto& handler : to_call) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            std::cerr << "[event_bus] " << event.type_tag << " handler failed: "
                      << e.what() << "\n";
        }
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
    tag_of_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) return 0;
    return it->second.size();
}

} // namespace agentlink
