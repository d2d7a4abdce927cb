#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace netreach {

/**
 * Typed publish/subscribe bus
 *
 * Events are plain value types; the C++ type of the event is its channel.
 * A subscriber for T only ever receives T, and publishing a type nobody
 * listens to does nothing.
 *
 * Handlers run synchronously on the publishing thread, in subscription
 * order, outside the bus lock.
 */
class EventBus {
public:
    struct Subscription {
        std::type_index type = std::type_index(typeid(void));
        uint64_t id = 0;

        bool valid() const { return id != 0; }
    };

    // Process-wide bus
    static EventBus& getInstance();

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template <typename T>
    Subscription subscribe(std::function<void(const T&)> handler) {
        if (!handler) {
            return Subscription{};
        }
        std::type_index type(typeid(T));
        uint64_t id = add_handler(type, [handler = std::move(handler)](const void* event) {
            handler(*static_cast<const T*>(event));
        });
        return Subscription{type, id};
    }

    void unsubscribe(const Subscription& subscription);

    template <typename T>
    void publish(const T& event) {
        dispatch(std::type_index(typeid(T)), &event);
    }

    template <typename T>
    size_t subscriber_count() const {
        return count(std::type_index(typeid(T)));
    }

private:
    using Handler = std::function<void(const void*)>;

    uint64_t add_handler(std::type_index type, Handler handler);
    void dispatch(std::type_index type, const void* event);
    size_t count(std::type_index type) const;

    mutable std::mutex mutex_;
    std::map<std::type_index, std::vector<std::pair<uint64_t, Handler>>> handlers_;
    uint64_t next_id_ = 1;
};

} // namespace netreach
