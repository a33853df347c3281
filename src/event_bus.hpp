#pragma once
#include "event.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace finly {

using EventHandler = std::function<void(const Event&)>;

// Observable channel for session and cache notifications. Publishers may
// run on background threads, so handlers must be thread-safe.
class EventBus {
public:
    // Returns an ID for unsubscribe(). Never 0.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    bool unsubscribe(uint64_t id);

    // Synchronous, in registration order, with the lock released while
    // handlers run (a handler may subscribe or unsubscribe). A throwing
    // handler is logged and skipped; publish itself never throws.
    void publish(const Event& event);

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        std::string tag;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;   // ascending id
    uint64_t next_id_ = 1;
};

// Unsubscribes when destroyed. The bus must outlive it.
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    ScopedSubscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~ScopedSubscription() { reset(); }

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : bus_(other.bus_), id_(other.id_) {
        other.bus_ = nullptr;
        other.id_ = 0;
    }
    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = other.bus_;
            id_ = other.id_;
            other.bus_ = nullptr;
            other.id_ = 0;
        }
        return *this;
    }
    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    void reset() {
        if (bus_ && id_ != 0) bus_->unsubscribe(id_);
        bus_ = nullptr;
        id_ = 0;
    }

    bool active() const { return bus_ != nullptr; }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

// Type-safe subscribe helper: casts Event& to the concrete type by tag.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

template<typename E>
ScopedSubscription subscribe_scoped(EventBus& bus, std::function<void(const E&)> handler) {
    return ScopedSubscription(bus, subscribe<E>(bus, std::move(handler)));
}

// Publish through an optional bus pointer.
inline void publish(EventBus* bus, const Event& event) {
    if (bus) bus->publish(event);
}

} // namespace finly
