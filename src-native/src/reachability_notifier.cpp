#include "reachability_notifier.hpp"
#include "logger.hpp"

namespace netreach {

namespace {

struct SharedSlot {
    std::mutex mutex;
    std::shared_ptr<ReachabilityNotifier> notifier;
};

// The slot is constructed after the system signal and the event bus, so it
// is destroyed before them; a notifier still set up at exit can disconnect.
SharedSlot& shared_slot() {
    system_reachability_signal();
    EventBus::getInstance();
    static SharedSlot slot;
    return slot;
}

} // namespace

void ReachabilityNotifier::setup_shared(const std::string& hostname,
                                        bool allows_cellular_access,
                                        ReachabilityProviderFactory provider_factory) {
    SharedSlot& slot = shared_slot();
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.notifier) {
            Logger::debug("[ReachabilityNotifier] Already set up for " + slot.notifier->hostname() +
                          ", ignoring setup for " + hostname);
            return;
        }
    }

    ReachabilityConfig config;
    config.hostname = hostname;
    config.allows_cellular_access = allows_cellular_access;

    // The factory runs unlocked, it may call shared()
    std::unique_ptr<ReachabilityProvider> provider = build_provider(config.hostname, provider_factory);

    std::shared_ptr<ReachabilityNotifier> notifier;
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.notifier) {
            Logger::debug("[ReachabilityNotifier] Lost setup race for " + hostname +
                          " to " + slot.notifier->hostname());
            return;
        }
        notifier = std::shared_ptr<ReachabilityNotifier>(
            new ReachabilityNotifier(config, std::move(provider),
                                     EventBus::getInstance(), system_reachability_signal()));
        slot.notifier = notifier;
    }

    // Outside the lock: a provider may signal synchronously while starting
    notifier->start();
}

void ReachabilityNotifier::clear_shared() {
    SharedSlot& slot = shared_slot();
    std::shared_ptr<ReachabilityNotifier> notifier;
    {
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (!slot.notifier) return;
        notifier = std::move(slot.notifier);
        slot.notifier.reset();
    }

    notifier->shutdown();
    Logger::info("[ReachabilityNotifier] Cleared shared notifier for " + notifier->hostname());
}

std::shared_ptr<ReachabilityNotifier> ReachabilityNotifier::shared() {
    SharedSlot& slot = shared_slot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.notifier;
}

std::shared_ptr<ReachabilityNotifier> ReachabilityNotifier::create(const ReachabilityConfig& config,
                                                                   ReachabilityProviderFactory provider_factory,
                                                                   EventBus& bus,
                                                                   ChangeSignal& system_signal) {
    std::unique_ptr<ReachabilityProvider> provider = build_provider(config.hostname, provider_factory);
    auto notifier = std::shared_ptr<ReachabilityNotifier>(
        new ReachabilityNotifier(config, std::move(provider), bus, system_signal));
    notifier->start();
    return notifier;
}

std::unique_ptr<ReachabilityProvider> ReachabilityNotifier::build_provider(
    const std::string& hostname,
    const ReachabilityProviderFactory& provider_factory) {
    ReachabilityProviderFactory factory = provider_factory ? provider_factory : make_default_provider_factory();

    std::unique_ptr<ReachabilityProvider> provider = factory(hostname);
    if (!provider) {
        Logger::warn("[ReachabilityNotifier] No reachability provider for " + hostname +
                     ", host will be reported unreachable");
    }
    return provider;
}

ReachabilityNotifier::ReachabilityNotifier(ReachabilityConfig config,
                                           std::unique_ptr<ReachabilityProvider> provider,
                                           EventBus& bus,
                                           ChangeSignal& system_signal)
    : config_(std::move(config))
    , provider_(std::move(provider))
    , bus_(bus)
    , system_signal_(system_signal) {
}

ReachabilityNotifier::~ReachabilityNotifier() {
    shutdown();
}

void ReachabilityNotifier::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_ || shut_down_.load()) return;
    started_ = true;

    std::weak_ptr<ReachabilityNotifier> weak_self = shared_from_this();
    auto handler = [weak_self]() {
        if (auto self = weak_self.lock()) {
            self->on_raw_signal();
        }
    };

    if (provider_) {
        provider_connection_ = provider_->on_change().connect(handler);
        try {
            provider_->start_monitoring();
        } catch (const std::exception& e) {
            Logger::warn("[ReachabilityNotifier] Could not start monitoring " + config_.hostname +
                         ": " + e.what());
        }
    }

    system_connection_ = system_signal_.connect(handler);

    Logger::info(std::string("[ReachabilityNotifier] Watching ") + config_.hostname +
                 (config_.allows_cellular_access ? "" : " (wifi only)"));
}

void ReachabilityNotifier::shutdown() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (shut_down_.exchange(true)) return;

        if (system_connection_) {
            system_signal_.disconnect(system_connection_);
            system_connection_ = 0;
        }
        if (provider_) {
            if (provider_connection_) {
                provider_->on_change().disconnect(provider_connection_);
                provider_connection_ = 0;
            }
            provider_->stop_monitoring();
        }
    }

    // Waits for a fan-out running on another thread. Re-entrant, so a
    // watcher may shut the notifier down from inside its callback.
    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);
    clear_watchers();
}

bool ReachabilityNotifier::is_reachable(ConnectionState state) const {
    switch (state) {
        case ConnectionState::NONE:
            return false;
        case ConnectionState::WIFI:
            return true;
        case ConnectionState::CELLULAR:
            return config_.allows_cellular_access;
    }
    return false;
}

ConnectionState ReachabilityNotifier::connection_state() const {
    if (!provider_) return ConnectionState::NONE;
    return provider_->connection_state();
}

bool ReachabilityNotifier::is_network_reachable() const {
    if (!provider_ || shut_down_.load()) return false;
    return is_reachable(provider_->connection_state());
}

void ReachabilityNotifier::add(std::shared_ptr<ReachabilityWatcher> watcher) {
    if (!watcher) {
        Logger::warn("[ReachabilityNotifier] Ignoring null watcher");
        return;
    }
    std::lock_guard<std::mutex> lock(watchers_mutex_);
    watchers_.push_back(std::move(watcher));
}

size_t ReachabilityNotifier::watcher_count() const {
    std::lock_guard<std::mutex> lock(watchers_mutex_);
    return watchers_.size();
}

void ReachabilityNotifier::clear_watchers() {
    std::lock_guard<std::mutex> lock(watchers_mutex_);
    watchers_.clear();
}

void ReachabilityNotifier::on_raw_signal() {
    std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mutex_);
    if (shut_down_.load()) return;

    if (initial_connection_.exchange(false)) {
        Logger::debug("[ReachabilityNotifier] Initial reachability report for " + config_.hostname + " suppressed");
        return;
    }

    if (!provider_) return;

    ConnectionState state = provider_->connection_state();
    bool reachable = is_reachable(state);

    Logger::info(std::string("[ReachabilityNotifier] ") + config_.hostname + " is " +
                 (reachable ? "reachable" : "unreachable") + " (" + to_string(state) + ")");

    std::vector<std::shared_ptr<ReachabilityWatcher>> snapshot;
    {
        std::lock_guard<std::mutex> lock(watchers_mutex_);
        snapshot = watchers_;
    }

    for (const auto& watcher : snapshot) {
        // A watcher may have shut us down
        if (shut_down_.load()) return;
        try {
            watcher->on_network_reachability_changed(reachable);
        } catch (const std::exception& e) {
            Logger::error("[ReachabilityNotifier] Watcher failed: " + std::string(e.what()));
        }
    }

    if (shut_down_.load()) return;

    ReachabilityEvent event;
    event.is_connection_available = reachable;
    event.is_initial_connection = false;
    bus_.publish(event);
}

} // namespace netreach
