#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace netreach {

/**
 * Payload-less change signal
 *
 * Any number of slots can be connected; emit() calls each of them in
 * connection order. Listeners are expected to re-query whatever state
 * they care about, the signal itself carries nothing.
 *
 * Thread-safe. Slots run outside the lock, so a slot may connect or
 * disconnect (itself included) while the signal is being emitted.
 */
class ChangeSignal {
public:
    using Slot = std::function<void()>;
    using ConnectionId = uint64_t;

    ChangeSignal() = default;

    ChangeSignal(const ChangeSignal&) = delete;
    ChangeSignal& operator=(const ChangeSignal&) = delete;

    // Returns an id usable with disconnect(); never 0
    ConnectionId connect(Slot slot);

    // Unknown or already disconnected ids are ignored
    void disconnect(ConnectionId id);

    void emit();

    size_t slot_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<ConnectionId, Slot>> slots_;
    ConnectionId next_id_ = 1;
};

/**
 * Process-wide low-level reachability channel.
 *
 * Raised by the netlink monitor whenever interfaces or addresses change,
 * independently of any reachability provider.
 */
ChangeSignal& system_reachability_signal();

} // namespace netreach
