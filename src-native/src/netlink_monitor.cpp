// netlink_monitor.cpp - rtnetlink-based interface/address change watcher

#include "netlink_monitor.hpp"
#include "logger.hpp"

#include <sys/socket.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

namespace netreach {

// Netlink datagrams are at most a page in practice; 8K leaves headroom
#define NETLINK_BUF_LEN 8192

// Groups we care about for reachability
#define NETLINK_GROUPS (RTMGRP_LINK | RTMGRP_IPV4_IFADDR | RTMGRP_IPV6_IFADDR)

NetlinkMonitor::NetlinkMonitor(ChangeSignal& target)
    : target_(target)
    , socket_fd_(-1)
    , running_(false) {
}

NetlinkMonitor::~NetlinkMonitor() {
    stop();
}

bool NetlinkMonitor::is_reachability_message(uint16_t nlmsg_type) {
    switch (nlmsg_type) {
        case RTM_NEWLINK:
        case RTM_DELLINK:
        case RTM_NEWADDR:
        case RTM_DELADDR:
            return true;
        default:
            return false;
    }
}

bool NetlinkMonitor::batch_has_reachability_change(const void* buffer, size_t length) {
    int remaining = static_cast<int>(length);
    for (const struct nlmsghdr* header = static_cast<const struct nlmsghdr*>(buffer);
         NLMSG_OK(header, remaining);
         header = NLMSG_NEXT(header, remaining)) {
        if (header->nlmsg_type == NLMSG_DONE || header->nlmsg_type == NLMSG_ERROR) {
            continue;
        }
        if (is_reachability_message(header->nlmsg_type)) {
            return true;
        }
    }
    return false;
}

bool NetlinkMonitor::start() {
    if (running_.load()) {
        return true;  // Already running
    }

    socket_fd_ = socket(AF_NETLINK, SOCK_RAW | SOCK_NONBLOCK | SOCK_CLOEXEC, NETLINK_ROUTE);
    if (socket_fd_ < 0) {
        Logger::error("[NetlinkMonitor] Failed to open netlink socket: " + std::string(strerror(errno)));
        return false;
    }

    struct sockaddr_nl addr;
    memset(&addr, 0, sizeof(addr));
    addr.nl_family = AF_NETLINK;
    addr.nl_groups = NETLINK_GROUPS;

    if (bind(socket_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        Logger::error("[NetlinkMonitor] Failed to bind netlink socket: " + std::string(strerror(errno)));
        close_socket();
        return false;
    }

    running_.store(true);

    try {
        monitor_thread_ = std::thread(&NetlinkMonitor::monitor_loop, this);
        Logger::info("[NetlinkMonitor] Started (netlink fd=" + std::to_string(socket_fd_) + ")");
        return true;
    } catch (const std::system_error& e) {
        Logger::error("[NetlinkMonitor] Failed to create monitor thread: " + std::string(e.what()));
        running_.store(false);
        close_socket();
        return false;
    }
}

void NetlinkMonitor::stop() {
    if (!running_.load()) {
        return;
    }

    running_.store(false);
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
    close_socket();

    Logger::info("[NetlinkMonitor] Stopped");
}

void NetlinkMonitor::close_socket() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
    }
}

void NetlinkMonitor::monitor_loop() {
    char buffer[NETLINK_BUF_LEN] __attribute__((aligned(NLMSG_ALIGNTO)));

    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;

    while (running_.load()) {
        // Short timeout so stop() is noticed quickly
        int ret = poll(&pfd, 1, 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            Logger::error("[NetlinkMonitor] poll failed: " + std::string(strerror(errno)));
            break;
        }
        if (ret == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        bool changed = false;
        for (;;) {
            ssize_t len = recv(socket_fd_, buffer, sizeof(buffer), 0);
            if (len < 0) {
                if (errno == EINTR) continue;
                if (errno == ENOBUFS) {
                    // Kernel dropped messages; assume something changed
                    Logger::warn("[NetlinkMonitor] Receive buffer overrun");
                    changed = true;
                    continue;
                }
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    Logger::error("[NetlinkMonitor] recv failed: " + std::string(strerror(errno)));
                }
                break;
            }
            if (len == 0) break;
            if (batch_has_reachability_change(buffer, static_cast<size_t>(len))) {
                changed = true;
            }
        }

        if (changed) {
            Logger::debug("[NetlinkMonitor] Link/address change");
            target_.emit();
        }
    }
}

} // namespace netreach
