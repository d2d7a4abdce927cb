#pragma once

#include <string>
#include <map>
#include <mutex>
#include <functional>

namespace netreach {

/**
 * Reachability Settings Manager
 *
 * Holds the configuration of the reachability watcher:
 * - Which host to watch
 * - Whether metered (cellular-like) links count as reachable
 * - Log level and optional log file
 *
 * Settings are persisted to ~/.config/netreach/settings.json
 */
class SettingsManager {
public:
    static SettingsManager& getInstance();

    // Load/save settings
    bool load();
    bool save();

    // Load from an explicit file instead of the default location.
    // Subsequent save() calls write back to the same file.
    bool load_from(const std::string& path);

    // Reachability
    std::string get_hostname() const;
    void set_hostname(const std::string& hostname);

    bool get_allows_cellular_access() const;
    void set_allows_cellular_access(bool allowed);

    // Logging
    std::string get_log_level() const;
    void set_log_level(const std::string& level);

    std::string get_log_file() const;
    void set_log_file(const std::string& path);

    // Settings change callback
    using SettingsChangeCallback = std::function<void(const std::string& key)>;
    void set_change_callback(SettingsChangeCallback callback);

    // Generic getters/setters
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    void set_string(const std::string& key, const std::string& value);

    bool get_bool(const std::string& key, bool default_value = false) const;
    void set_bool(const std::string& key, bool value);

    std::string get_config_path() const;

    // Drop all values and reset to defaults (does not touch the file)
    void reset();

private:
    SettingsManager();
    ~SettingsManager() = default;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    bool load_locked();
    void parse(const std::string& content);
    void notify_change(const std::string& key);
    void ensure_defaults();

    mutable std::mutex mutex_;
    std::map<std::string, std::string> settings_;
    std::string config_path_;
    SettingsChangeCallback change_callback_;
    bool loaded_ = false;
};

} // namespace netreach
