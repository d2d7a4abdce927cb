/**
 * netreach-watch
 *
 * Watches the reachability of one host and logs every change:
 * - GNetworkMonitor decides whether the host can be reached
 * - rtnetlink link/address events trigger extra re-evaluations
 * - Metered links count as cellular and can be excluded (--wifi-only)
 */

#include "logger.hpp"
#include "settings.hpp"
#include "event_bus.hpp"
#include "netlink_monitor.hpp"
#include "reachability_notifier.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <filesystem>
#include <signal.h>
#include <glib.h>
#include <glib-unix.h>

namespace {

class LoggingWatcher : public netreach::ReachabilityWatcher {
public:
    void on_network_reachability_changed(bool is_endpoint_reachable) override {
        if (is_endpoint_reachable) {
            Logger::info("[Watch] Host reachable");
        } else {
            Logger::warn("[Watch] Host unreachable");
        }
    }
};

GMainLoop* main_loop = nullptr;

gboolean shutdown_handler_glib(gpointer /*user_data*/) {
    Logger::info("[Shutdown] Signal received, stopping...");
    if (main_loop) {
        g_main_loop_quit(main_loop);
    }
    return G_SOURCE_REMOVE;
}

void print_usage() {
    std::cout << "netreach-watch - host reachability watcher\n\n"
              << "Usage: netreach-watch [options]\n\n"
              << "Options:\n"
              << "  --host NAME      Host to watch (overrides the settings file)\n"
              << "  --wifi-only      Treat metered (cellular) links as unreachable\n"
              << "  --config PATH    Settings file (default ~/.config/netreach/settings.json)\n"
              << "  --debug          Enable debug logging\n"
              << "  --help           Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    bool debug_mode = false;
    bool wifi_only = false;
    std::string host_override;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        if (arg == "--debug") {
            debug_mode = true;
        } else if (arg == "--wifi-only") {
            wifi_only = true;
        } else if (arg == "--host" && i + 1 < argc) {
            host_override = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_usage();
            return 2;
        }
    }

    auto& settings = netreach::SettingsManager::getInstance();
    if (config_path.empty()) {
        settings.load();
    } else {
        settings.load_from(config_path);
    }

    LogLevel level = debug_mode ? LogLevel::DEBUG : Logger::parse_level(settings.get_log_level());
    std::string log_file = settings.get_log_file();
    if (!log_file.empty()) {
        std::error_code ec;
        std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();
        if (!log_dir.empty()) {
            std::filesystem::create_directories(log_dir, ec);
        }
        if (ec) {
            std::cerr << "Cannot create log directory " << log_dir << ": " << ec.message() << "\n";
            log_file.clear();
        }
    }
    Logger::init(level, log_file);

    std::string hostname = host_override.empty() ? settings.get_hostname() : host_override;
    bool allows_cellular = wifi_only ? false : settings.get_allows_cellular_access();

    Logger::info("[Init] netreach-watch starting for " + hostname);
    if (debug_mode) Logger::debug("Debug mode enabled");

    main_loop = g_main_loop_new(nullptr, FALSE);
    g_unix_signal_add(SIGTERM, shutdown_handler_glib, nullptr);
    g_unix_signal_add(SIGINT, shutdown_handler_glib, nullptr);

    auto& bus = netreach::EventBus::getInstance();
    auto subscription = bus.subscribe<netreach::ReachabilityEvent>(
        [](const netreach::ReachabilityEvent& event) {
            Logger::debug(std::string("[Watch] ") + netreach::ReachabilityEvent::NAME +
                          " available=" + (event.is_connection_available ? "true" : "false"));
        });

    netreach::NetlinkMonitor netlink;
    if (!netlink.start()) {
        Logger::warn("[Init] Netlink monitor unavailable, relying on GNetworkMonitor only");
    }

    netreach::ReachabilityNotifier::setup_shared(hostname, allows_cellular);
    auto notifier = netreach::ReachabilityNotifier::shared();
    if (notifier) {
        notifier->add(std::make_shared<LoggingWatcher>());
    }

    g_main_loop_run(main_loop);

    notifier.reset();
    netreach::ReachabilityNotifier::clear_shared();
    netlink.stop();
    bus.unsubscribe(subscription);

    g_main_loop_unref(main_loop);
    main_loop = nullptr;

    Logger::info("[Shutdown] Done");
    return 0;
}
