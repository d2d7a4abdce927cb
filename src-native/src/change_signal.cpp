#include "change_signal.hpp"
#include <algorithm>

namespace netreach {

ChangeSignal::ConnectionId ChangeSignal::connect(Slot slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    ConnectionId id = next_id_++;
    slots_.emplace_back(id, std::move(slot));
    return id;
}

void ChangeSignal::disconnect(ConnectionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.erase(std::remove_if(slots_.begin(), slots_.end(),
                                [id](const std::pair<ConnectionId, Slot>& entry) {
                                    return entry.first == id;
                                }),
                 slots_.end());
}

void ChangeSignal::emit() {
    std::vector<std::pair<ConnectionId, Slot>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = slots_;
    }
    for (const auto& entry : snapshot) {
        if (entry.second) {
            entry.second();
        }
    }
}

size_t ChangeSignal::slot_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

ChangeSignal& system_reachability_signal() {
    static ChangeSignal signal;
    return signal;
}

} // namespace netreach
