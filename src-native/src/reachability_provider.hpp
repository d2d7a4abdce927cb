#pragma once

#include "change_signal.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace netreach {

/**
 * How the watched host can currently be reached
 */
enum class ConnectionState {
    NONE,
    WIFI,
    CELLULAR
};

const char* to_string(ConnectionState state);

/**
 * Raised by a provider whose monitor cannot be started
 */
class ReachabilityError : public std::runtime_error {
public:
    explicit ReachabilityError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Reachability Provider
 *
 * Wraps an OS reachability facility for one host. The provider answers
 * "how is the host reachable right now" and, once monitoring is started,
 * emits on_change() whenever that answer may have changed. It never
 * blocks in connection_state(); the value can lag behind the real link.
 */
class ReachabilityProvider {
public:
    virtual ~ReachabilityProvider() = default;

    virtual ConnectionState connection_state() const = 0;

    // Throws ReachabilityError if monitoring cannot be started
    virtual void start_monitoring() = 0;

    // Safe to call repeatedly, and before start_monitoring()
    virtual void stop_monitoring() = 0;

    ChangeSignal& on_change() { return changed_; }

protected:
    void notify_changed() { changed_.emit(); }

private:
    ChangeSignal changed_;
};

// Returns nullptr when no provider can be built for the hostname
using ReachabilityProviderFactory =
    std::function<std::unique_ptr<ReachabilityProvider>(const std::string& hostname)>;

// GNetworkMonitor-backed provider
ReachabilityProviderFactory make_default_provider_factory();

} // namespace netreach
