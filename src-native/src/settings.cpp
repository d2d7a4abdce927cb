#include "settings.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace netreach {

namespace {

const char* const DEFAULT_HOSTNAME = "www.gnome.org";

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/netreach/settings.json";
    }
    return "";
}

} // namespace

SettingsManager::SettingsManager()
    : config_path_(default_config_path()) {
    ensure_defaults();
}

SettingsManager& SettingsManager::getInstance() {
    static SettingsManager instance;
    return instance;
}

std::string SettingsManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_path_;
}

void SettingsManager::ensure_defaults() {
    if (settings_.find("hostname") == settings_.end())
        settings_["hostname"] = DEFAULT_HOSTNAME;
    if (settings_.find("allows_cellular_access") == settings_.end())
        settings_["allows_cellular_access"] = "true";
    if (settings_.find("log_level") == settings_.end())
        settings_["log_level"] = "info";
    if (settings_.find("log_file") == settings_.end())
        settings_["log_file"] = "";
}

void SettingsManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.clear();
    ensure_defaults();
    loaded_ = false;
}

bool SettingsManager::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_locked();
}

bool SettingsManager::load_from(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_path_ = path;
    return load_locked();
}

bool SettingsManager::load_locked() {
    if (config_path_.empty()) {
        Logger::error("[Settings] No config path set");
        ensure_defaults();
        loaded_ = true;
        return false;
    }

    std::ifstream file(config_path_);
    if (!file.is_open()) {
        Logger::info("[Settings] No settings file at " + config_path_ + ", using defaults");
        ensure_defaults();
        loaded_ = true;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str());

    ensure_defaults();
    loaded_ = true;
    Logger::info("[Settings] Loaded " + std::to_string(settings_.size()) + " settings from " + config_path_);
    return true;
}

// Flat JSON object of string, number or boolean values: {"key": "value", ...}
void SettingsManager::parse(const std::string& content) {
    size_t pos = 0;
    while ((pos = content.find('"', pos)) != std::string::npos) {
        size_t key_start = pos + 1;
        size_t key_end = content.find('"', key_start);
        if (key_end == std::string::npos) break;

        std::string key = content.substr(key_start, key_end - key_start);

        size_t colon = content.find(':', key_end);
        if (colon == std::string::npos) break;

        size_t val_start = content.find_first_not_of(" \t\r\n", colon + 1);
        if (val_start == std::string::npos) break;

        std::string value;
        if (content[val_start] == '"') {
            val_start++;
            size_t val_end = content.find('"', val_start);
            if (val_end == std::string::npos) break;
            value = content.substr(val_start, val_end - val_start);
            pos = val_end + 1;
        } else {
            size_t val_end = content.find_first_of(",}", val_start);
            if (val_end == std::string::npos) val_end = content.length();
            value = content.substr(val_start, val_end - val_start);
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
                value.pop_back();
            }
            pos = val_end;
        }

        settings_[key] = value;
    }
}

bool SettingsManager::save() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_path_.empty()) {
        Logger::error("[Settings] No config path set");
        return false;
    }

    std::error_code ec;
    std::filesystem::path dir = std::filesystem::path(config_path_).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::error("[Settings] Failed to create " + dir.string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(config_path_);
    if (!file.is_open()) {
        Logger::error("[Settings] Failed to open settings file for writing");
        return false;
    }

    file << "{\n";
    bool first = true;
    for (const auto& [key, value] : settings_) {
        if (!first) file << ",\n";
        first = false;

        bool is_bool = (value == "true" || value == "false");
        if (is_bool) {
            file << "  \"" << key << "\": " << value;
        } else {
            file << "  \"" << key << "\": \"" << value << "\"";
        }
    }
    file << "\n}\n";

    Logger::info("[Settings] Saved " + std::to_string(settings_.size()) + " settings");
    return true;
}

void SettingsManager::set_change_callback(SettingsChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_callback_ = std::move(callback);
}

void SettingsManager::notify_change(const std::string& key) {
    SettingsChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = change_callback_;
    }
    if (callback) {
        callback(key);
    }
}

std::string SettingsManager::get_string(const std::string& key, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settings_.find(key);
    return it != settings_.end() ? it->second : default_value;
}

void SettingsManager::set_string(const std::string& key, const std::string& value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }
    notify_change(key);
}

bool SettingsManager::get_bool(const std::string& key, bool default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settings_.find(key);
    if (it == settings_.end()) return default_value;
    if (it->second == "true" || it->second == "1") return true;
    if (it->second == "false" || it->second == "0") return false;
    return default_value;
}

void SettingsManager::set_bool(const std::string& key, bool value) {
    set_string(key, value ? "true" : "false");
}

std::string SettingsManager::get_hostname() const {
    return get_string("hostname", DEFAULT_HOSTNAME);
}

void SettingsManager::set_hostname(const std::string& hostname) {
    set_string("hostname", hostname);
}

bool SettingsManager::get_allows_cellular_access() const {
    return get_bool("allows_cellular_access", true);
}

void SettingsManager::set_allows_cellular_access(bool allowed) {
    set_bool("allows_cellular_access", allowed);
}

std::string SettingsManager::get_log_level() const {
    return get_string("log_level", "info");
}

void SettingsManager::set_log_level(const std::string& level) {
    set_string("log_level", level);
}

std::string SettingsManager::get_log_file() const {
    return get_string("log_file");
}

void SettingsManager::set_log_file(const std::string& path) {
    set_string("log_file", path);
}

} // namespace netreach
