#pragma once

#include "reachability_provider.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <gio/gio.h>

namespace netreach {

/**
 * GIO Reachability Provider
 *
 * Uses the default GNetworkMonitor (NetworkManager, netlink or portal
 * backend, whichever GLib picked) to decide whether the host is
 * reachable:
 * - unreachable                        -> NONE
 * - reachable over a metered network   -> CELLULAR
 * - reachable otherwise                -> WIFI
 *
 * Reachability is evaluated asynchronously with
 * g_network_monitor_can_reach_async() on the thread-default main context,
 * once when monitoring starts and again on every "network-changed" or
 * "notify::network-metered". Each finished evaluation updates the cached
 * state and emits on_change(). A GMainLoop must be running for any of this
 * to happen.
 */
class GioReachabilityProvider : public ReachabilityProvider {
public:
    // Accepts a bare hostname, "host:port" or a URI. Returns nullptr if
    // the hostname cannot be parsed.
    static std::unique_ptr<GioReachabilityProvider> create(const std::string& hostname);

    ~GioReachabilityProvider() override;

    GioReachabilityProvider(const GioReachabilityProvider&) = delete;
    GioReachabilityProvider& operator=(const GioReachabilityProvider&) = delete;

    ConnectionState connection_state() const override;
    void start_monitoring() override;
    void stop_monitoring() override;

    const std::string& hostname() const { return hostname_; }

private:
    GioReachabilityProvider(std::string hostname, GSocketConnectable* connectable);

    void evaluate();
    void apply_result(bool reachable);

    static void on_network_changed(GNetworkMonitor* monitor, gboolean available, gpointer user_data);
    static void on_metered_changed(GObject* object, GParamSpec* pspec, gpointer user_data);
    static void on_can_reach_finished(GObject* source, GAsyncResult* result, gpointer user_data);

    std::string hostname_;
    GSocketConnectable* connectable_ = nullptr;

    std::mutex mutex_;
    GNetworkMonitor* monitor_ = nullptr;   // owned by GIO
    GCancellable* cancellable_ = nullptr;
    gulong changed_handler_ = 0;
    gulong metered_handler_ = 0;

    std::atomic<ConnectionState> state_{ConnectionState::NONE};
};

} // namespace netreach
