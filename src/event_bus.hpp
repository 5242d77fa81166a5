#pragma once
#include "event.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolmux {

using EventHandler = std::function<void(const Event&)>;

class EventBus;

// Unsubscribes on destruction. Must not outlive the bus.
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBus* bus, uint64_t id) : bus_(bus), id_(id) {}
    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset();
    bool active() const { return bus_ != nullptr; }
    uint64_t id() const { return id_; }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish an event synchronously. Handlers called in registration order.
    // Mutex is released before calling handlers to avoid deadlocks.
    // Returns the number of handlers called.
    size_t publish(const Event& event);

    // Remove all subscriptions.
    void clear();

    // Number of subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Entry {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Entry>> handlers_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Same, scoped to the returned handle.
template<typename E>
Subscription subscribe_scoped(EventBus& bus, std::function<void(const E&)> handler) {
    return Subscription(&bus, subscribe<E>(bus, std::move(handler)));
}

} // namespace toolmux
