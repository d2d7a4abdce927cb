#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>

LogLevel Logger::current_level = LogLevel::INFO;
std::ofstream Logger::log_file;
std::mutex Logger::log_mutex;
Logger::Sink Logger::sink;

void Logger::init(LogLevel level, const std::string& log_file_path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
    if (log_file.is_open()) {
        log_file.close();
    }
    if (!log_file_path.empty()) {
        log_file.open(log_file_path, std::ios::app);
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
}

LogLevel Logger::get_level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return current_level;
}

void Logger::set_sink(Sink new_sink) {
    std::lock_guard<std::mutex> lock(log_mutex);
    sink = std::move(new_sink);
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "[DEBUG]";
        case LogLevel::INFO:  return "[INFO] ";
        case LogLevel::WARN:  return "[WARN] ";
        case LogLevel::ERROR: return "[ERROR]";
    }
    return "[INFO] ";
}

void Logger::log(LogLevel level, const std::string& message) {
    std::unique_lock<std::mutex> lock(log_mutex);
    if (level < current_level) return;

    if (sink) {
        // Called unlocked so a sink may log itself
        Sink target = sink;
        lock.unlock();
        target(level, message);
        return;
    }

    // Timestamp
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    const char* level_str = level_name(level);

    if (log_file.is_open()) {
        log_file << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S")
                 << " " << level_str << " " << message << std::endl;
    }

    std::cout << std::put_time(std::localtime(&time), "%H:%M:%S")
              << " " << level_str << " " << message << std::endl;
}
