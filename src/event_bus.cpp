#include "event_bus.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace finly {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    subscriptions_.push_back(Subscription{id, tag, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::lower_bound(subscriptions_.begin(), subscriptions_.end(), id,
                               [](const Subscription& s, uint64_t v) { return s.id < v; });
    if (it == subscriptions_.end() || it->id != id) return false;
    subscriptions_.erase(it);
    return true;
}

void EventBus::publish(const Event& event) {
    std::vector<EventHandler> matched;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sub : subscriptions_) {
            if (sub.tag == event.type_tag) matched.push_back(sub.handler);
        }
    }
    for (const auto& handler : matched) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            std::cerr << "[events] " << event.type_tag << " handler threw: "
                      << e.what() << '\n';
        }
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(subscriptions_.begin(), subscriptions_.end(),
                                             [&](const Subscription& s) { return s.tag == tag; }));
}

} // namespace finly
