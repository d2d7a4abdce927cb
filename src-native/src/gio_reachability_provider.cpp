#include "gio_reachability_provider.hpp"
#include "logger.hpp"

namespace netreach {

namespace {

const guint16 DEFAULT_PORT = 443;

GSocketConnectable* parse_connectable(const std::string& hostname, GError** error) {
    if (hostname.find("://") != std::string::npos) {
        return g_network_address_parse_uri(hostname.c_str(), DEFAULT_PORT, error);
    }
    return g_network_address_parse(hostname.c_str(), DEFAULT_PORT, error);
}

} // namespace

std::unique_ptr<GioReachabilityProvider> GioReachabilityProvider::create(const std::string& hostname) {
    if (hostname.empty()) {
        Logger::warn("[GioReachability] Empty hostname");
        return nullptr;
    }

    GError* error = nullptr;
    GSocketConnectable* connectable = parse_connectable(hostname, &error);
    if (!connectable) {
        Logger::warn("[GioReachability] Cannot parse host '" + hostname + "': " +
                     (error ? error->message : "unknown error"));
        g_clear_error(&error);
        return nullptr;
    }

    return std::unique_ptr<GioReachabilityProvider>(
        new GioReachabilityProvider(hostname, connectable));
}

GioReachabilityProvider::GioReachabilityProvider(std::string hostname, GSocketConnectable* connectable)
    : hostname_(std::move(hostname))
    , connectable_(connectable) {
}

GioReachabilityProvider::~GioReachabilityProvider() {
    stop_monitoring();
    if (connectable_) {
        g_object_unref(connectable_);
    }
}

ConnectionState GioReachabilityProvider::connection_state() const {
    return state_.load();
}

void GioReachabilityProvider::start_monitoring() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (monitor_) {
            throw ReachabilityError("monitoring already started for " + hostname_);
        }

        GNetworkMonitor* monitor = g_network_monitor_get_default();
        if (!monitor) {
            throw ReachabilityError("no GNetworkMonitor available");
        }

        monitor_ = monitor;
        cancellable_ = g_cancellable_new();
        changed_handler_ = g_signal_connect(monitor_, "network-changed",
                                            G_CALLBACK(on_network_changed), this);
        metered_handler_ = g_signal_connect(monitor_, "notify::network-metered",
                                            G_CALLBACK(on_metered_changed), this);
    }

    Logger::info("[GioReachability] Monitoring " + hostname_);

    // The first evaluation reports the current state
    evaluate();
}

void GioReachabilityProvider::stop_monitoring() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!monitor_) return;

    if (changed_handler_) {
        g_signal_handler_disconnect(monitor_, changed_handler_);
        changed_handler_ = 0;
    }
    if (metered_handler_) {
        g_signal_handler_disconnect(monitor_, metered_handler_);
        metered_handler_ = 0;
    }
    if (cancellable_) {
        g_cancellable_cancel(cancellable_);
        g_object_unref(cancellable_);
        cancellable_ = nullptr;
    }
    monitor_ = nullptr;

    Logger::info("[GioReachability] Stopped monitoring " + hostname_);
}

void GioReachabilityProvider::evaluate() {
    GNetworkMonitor* monitor = nullptr;
    GCancellable* cancellable = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!monitor_) return;
        monitor = monitor_;
        cancellable = cancellable_;
    }

    g_network_monitor_can_reach_async(monitor, connectable_, cancellable,
                                      on_can_reach_finished, this);
}

void GioReachabilityProvider::apply_result(bool reachable) {
    ConnectionState state = ConnectionState::NONE;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!monitor_) return;
        if (reachable) {
            state = g_network_monitor_get_network_metered(monitor_)
                ? ConnectionState::CELLULAR
                : ConnectionState::WIFI;
        }
    }

    ConnectionState previous = state_.exchange(state);
    if (previous != state) {
        Logger::debug(std::string("[GioReachability] ") + hostname_ + ": " +
                      to_string(previous) + " -> " + to_string(state));
    }
    notify_changed();
}

void GioReachabilityProvider::on_network_changed(GNetworkMonitor* /*monitor*/, gboolean available,
                                                 gpointer user_data) {
    auto* self = static_cast<GioReachabilityProvider*>(user_data);
    Logger::debug(std::string("[GioReachability] network-changed (available=") +
                  (available ? "yes" : "no") + ")");
    self->evaluate();
}

void GioReachabilityProvider::on_metered_changed(GObject* /*object*/, GParamSpec* /*pspec*/,
                                                 gpointer user_data) {
    auto* self = static_cast<GioReachabilityProvider*>(user_data);
    self->evaluate();
}

void GioReachabilityProvider::on_can_reach_finished(GObject* source, GAsyncResult* result,
                                                    gpointer user_data) {
    GError* error = nullptr;
    gboolean reachable = g_network_monitor_can_reach_finish(G_NETWORK_MONITOR(source), result, &error);

    // Cancelled means stop_monitoring() ran; the provider may already be gone
    if (error && g_error_matches(error, G_IO_ERROR, G_IO_ERROR_CANCELLED)) {
        g_error_free(error);
        return;
    }

    auto* self = static_cast<GioReachabilityProvider*>(user_data);
    if (error) {
        Logger::debug("[GioReachability] " + self->hostname_ + " not reachable: " + error->message);
        g_error_free(error);
    }
    self->apply_result(reachable != FALSE);
}

ReachabilityProviderFactory make_default_provider_factory() {
    return [](const std::string& hostname) -> std::unique_ptr<ReachabilityProvider> {
        return GioReachabilityProvider::create(hostname);
    };
}

} // namespace netreach
