#pragma once
#include <string>
#include <fstream>
#include <functional>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger {
public:
    // Receives every message that passes the level filter (used by tests)
    using Sink = std::function<void(LogLevel level, const std::string& message)>;

    static void init(LogLevel level, const std::string& log_file_path = "");
    static void log(LogLevel level, const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();
    static void set_sink(Sink sink);

    // "debug", "info", "warn"/"warning", "error"; anything else maps to INFO
    static LogLevel parse_level(const std::string& name);
    static const char* level_name(LogLevel level);

    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    static void info(const std::string& message) { log(LogLevel::INFO, message); }
    static void warn(const std::string& message) { log(LogLevel::WARN, message); }
    static void error(const std::string& message) { log(LogLevel::ERROR, message); }

private:
    static LogLevel current_level;
    static std::ofstream log_file;
    static std::mutex log_mutex;
    static Sink sink;
};
