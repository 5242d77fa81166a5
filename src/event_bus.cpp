#include "event_bus.hpp"

namespace toolmux {

Subscription::Subscription(Subscription&& other) noexcept
    : bus_(other.bus_), id_(other.id_) {
    other.bus_ = nullptr;
    other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        bus_ = other.bus_;
        id_ = other.id_;
        other.bus_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

void Subscription::reset() {
    if (bus_) {
        bus_->unsubscribe(id_);
        bus_ = nullptr;
        id_ = 0;
    }
}

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[tag].push_back(Entry{id, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [tag, entries] : handlers_) {
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            if (it->id == id) {
                entries.erase(it);
                return true;
            }
        }
    }
    return false;
}

size_t EventBus::publish(const Event& event) {
    // Copy handlers out under lock, then call without lock held.
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it == handlers_.end()) return 0;
        to_call.reserve(it->second.size());
        for (const auto& entry : it->second) {
            to_call.push_back(entry.handler);
        }
    }
    for (const auto& handler : to_call) {
        handler(event);
    }
    return to_call.size();
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) return 0;
    return it->second.size();
}

} // namespace toolmux
