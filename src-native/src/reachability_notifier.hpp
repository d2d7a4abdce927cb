#pragma once

#include "change_signal.hpp"
#include "event_bus.hpp"
#include "reachability_provider.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace netreach {

struct ReachabilityConfig {
    std::string hostname;

    // If false, the host only counts as reachable over WIFI
    bool allows_cellular_access = true;
};

/**
 * Published on the event bus for every reachability change after the
 * initial one
 */
struct ReachabilityEvent {
    static constexpr const char* NAME = "NetworkAvailabilityChangedNotification";

    bool is_connection_available = false;
    bool is_initial_connection = false;
};

class ReachabilityWatcher {
public:
    virtual ~ReachabilityWatcher() = default;
    virtual void on_network_reachability_changed(bool is_endpoint_reachable) = 0;
};

/**
 * Reachability Notifier
 *
 * Watches one host through a ReachabilityProvider and tells registered
 * watchers, plus the event bus, whenever its reachability may have changed.
 *
 * Two sources trigger a re-evaluation: the provider's own change signal and
 * the process-wide system_reachability_signal(). Either one may fire, both
 * lead to the same handler, which always re-reads the provider state.
 *
 * The very first signal after setup is swallowed: providers report the
 * current state as soon as monitoring starts and that is not a change.
 *
 * Usually used through the process-wide shared instance:
 *
 *   ReachabilityNotifier::setup_shared("api.example.com", false);
 *   ReachabilityNotifier::shared()->add(watcher);
 *   ...
 *   ReachabilityNotifier::clear_shared();
 */
class ReachabilityNotifier : public std::enable_shared_from_this<ReachabilityNotifier> {
public:
    // First call wins: while a shared instance exists, later calls are
    // ignored, including their parameters. A null factory selects the
    // GIO provider.
    static void setup_shared(const std::string& hostname,
                             bool allows_cellular_access,
                             ReachabilityProviderFactory provider_factory = nullptr);

    // Shuts the shared instance down and forgets it. No-op if none exists.
    static void clear_shared();

    // nullptr unless setup_shared() has run
    static std::shared_ptr<ReachabilityNotifier> shared();

    // A started notifier outside the shared slot
    static std::shared_ptr<ReachabilityNotifier> create(
        const ReachabilityConfig& config,
        ReachabilityProviderFactory provider_factory = nullptr,
        EventBus& bus = EventBus::getInstance(),
        ChangeSignal& system_signal = system_reachability_signal());

    ~ReachabilityNotifier();

    ReachabilityNotifier(const ReachabilityNotifier&) = delete;
    ReachabilityNotifier& operator=(const ReachabilityNotifier&) = delete;

    /**
     * Whether the host looks reachable right now.
     *
     * Advisory only: true does not mean the next request will succeed, and
     * the underlying state may be stale. Always false without a provider or
     * after shutdown().
     */
    bool is_network_reachable() const;

    // NONE without a provider
    ConnectionState connection_state() const;

    // Future changes only, nothing is replayed
    void add(std::shared_ptr<ReachabilityWatcher> watcher);

    const std::string& hostname() const { return config_.hostname; }
    bool allows_cellular_access() const { return config_.allows_cellular_access; }
    bool has_provider() const { return provider_ != nullptr; }
    bool is_initial_connection() const { return initial_connection_.load(); }
    size_t watcher_count() const;

    // Disconnects both signal sources, stops the provider and drops all
    // watchers. Idempotent.
    void shutdown();

private:
    ReachabilityNotifier(ReachabilityConfig config,
                         std::unique_ptr<ReachabilityProvider> provider,
                         EventBus& bus,
                         ChangeSignal& system_signal);

    static std::unique_ptr<ReachabilityProvider> build_provider(
        const std::string& hostname,
        const ReachabilityProviderFactory& provider_factory);

    void start();
    void on_raw_signal();
    bool is_reachable(ConnectionState state) const;
    void clear_watchers();

    const ReachabilityConfig config_;
    const std::unique_ptr<ReachabilityProvider> provider_;
    EventBus& bus_;
    ChangeSignal& system_signal_;

    std::mutex lifecycle_mutex_;
    bool started_ = false;
    ChangeSignal::ConnectionId provider_connection_ = 0;
    ChangeSignal::ConnectionId system_connection_ = 0;

    // Held for a whole fan-out; shutdown() takes it to wait one out
    std::recursive_mutex dispatch_mutex_;

    std::atomic<bool> initial_connection_{true};
    std::atomic<bool> shut_down_{false};

    mutable std::mutex watchers_mutex_;
    std::vector<std::shared_ptr<ReachabilityWatcher>> watchers_;

};

} // namespace netreach
