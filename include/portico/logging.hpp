#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace portico {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

namespace detail {

inline std::atomic<int>& log_threshold() {
    static std::atomic<int> threshold{static_cast<int>(LogLevel::Info)};
    return threshold;
}

inline std::mutex& log_mutex() {
    static std::mutex mutex;
    return mutex;
}

inline const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

} // namespace detail

inline void set_log_level(LogLevel level) {
    detail::log_threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline LogLevel log_level() {
    return static_cast<LogLevel>(detail::log_threshold().load(std::memory_order_relaxed));
}

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

inline void write_log(LogLevel level, const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    if (static_cast<int>(level) < detail::log_threshold().load(std::memory_order_relaxed)) {
        return;
    }
    nlohmann::json log_entry = {
        {"level", detail::level_name(level)},
        {"message", message},
        {"component", component},
        {"timestamp", now_iso8601()}
    };
    if (fields.is_object()) {
        for (auto& [key, value] : fields.items()) {
            log_entry[key] = value;
        }
    }
    auto line = log_entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    std::cout << line << std::endl;
}

inline void log_debug(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    write_log(LogLevel::Debug, component, message, fields);
}

inline void log_info(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    write_log(LogLevel::Info, component, message, fields);
}

inline void log_warn(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    write_log(LogLevel::Warn, component, message, fields);
}

inline void log_error(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    write_log(LogLevel::Error, component, message, fields);
}

}  // namespace portico
