// netlink_monitor.hpp - rtnetlink-based interface/address change watcher
// Raises a ChangeSignal whenever the kernel reports link or address changes

#pragma once

#include "change_signal.hpp"

#include <atomic>
#include <cstdint>
#include <thread>

namespace netreach {

/**
 * Netlink Monitor
 *
 * Listens on a NETLINK_ROUTE socket for:
 * - Links going up/down or appearing/disappearing
 * - IPv4/IPv6 addresses being added or removed
 *
 * Each batch of such messages emits the target signal once. This is a
 * low-level hint only; listeners must ask their reachability provider
 * for the actual state.
 */
class NetlinkMonitor {
public:
    explicit NetlinkMonitor(ChangeSignal& target = system_reachability_signal());
    ~NetlinkMonitor();

    NetlinkMonitor(const NetlinkMonitor&) = delete;
    NetlinkMonitor& operator=(const NetlinkMonitor&) = delete;

    // Returns false if the netlink socket cannot be set up
    bool start();
    void stop();

    bool is_running() const { return running_.load(); }

    // True for RTM_NEWLINK, RTM_DELLINK, RTM_NEWADDR and RTM_DELADDR
    static bool is_reachability_message(uint16_t nlmsg_type);

    // Scans a received datagram; true if it holds at least one
    // reachability message
    static bool batch_has_reachability_change(const void* buffer, size_t length);

private:
    void monitor_loop();
    void close_socket();

    ChangeSignal& target_;
    int socket_fd_;
    std::atomic<bool> running_;
    std::thread monitor_thread_;
};

} // namespace netreach
