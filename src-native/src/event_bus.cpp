#include "event_bus.hpp"
#include <algorithm>

namespace netreach {

EventBus& EventBus::getInstance() {
    static EventBus instance;
    return instance;
}

uint64_t EventBus::add_handler(std::type_index type, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[type].emplace_back(id, std::move(handler));
    return id;
}

void EventBus::unsubscribe(const Subscription& subscription) {
    if (!subscription.valid()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(subscription.type);
    if (it == handlers_.end()) return;

    auto& list = it->second;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&](const std::pair<uint64_t, Handler>& entry) {
                                  return entry.first == subscription.id;
                              }),
               list.end());
    if (list.empty()) {
        handlers_.erase(it);
    }
}

void EventBus::dispatch(std::type_index type, const void* event) {
    std::vector<std::pair<uint64_t, Handler>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(type);
        if (it == handlers_.end()) return;
        snapshot = it->second;
    }
    for (const auto& entry : snapshot) {
        entry.second(event);
    }
}

size_t EventBus::count(std::type_index type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(type);
    return it == handlers_.end() ? 0 : it->second.size();
}

} // namespace netreach
