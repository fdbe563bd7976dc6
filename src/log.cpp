#include "log.hpp"
#include "util.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>

namespace cedarmcp {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::atomic<int> g_format{static_cast<int>(LogFormat::Text)};
std::mutex g_write_mutex;

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string n = to_upper(trim(name));
    if (n == "DEBUG") return LogLevel::Debug;
    if (n == "INFO") return LogLevel::Info;
    if (n == "WARNING" || n == "WARN") return LogLevel::Warning;
    if (n == "ERROR") return LogLevel::Error;
    return std::nullopt;
}

std::optional<LogFormat> parse_log_format(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "text") return LogFormat::Text;
    if (n == "json") return LogFormat::Json;
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

void log_init(LogLevel level, LogFormat format) {
    g_level.store(static_cast<int>(level));
    g_format.store(static_cast<int>(format));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

std::string format_log_line(LogLevel level, LogFormat format,
                            const std::string& tag, const std::string& message) {
    if (format == LogFormat::Json) {
        nlohmann::json record = {
            {"timestamp", timestamp_now()},
            {"level", log_level_name(level)},
            {"tag", tag},
            {"message", message}
        };
        // Invalid UTF-8 in a path must not take the logger down
        return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return "[" + timestamp_now() + "] " + log_level_name(level) + " [" + tag + "] " + message;
}

void log_write(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) return;
    auto format = static_cast<LogFormat>(g_format.load());
    std::string line = format_log_line(level, format, tag, message);
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << line << '\n';
}

} // namespace cedarmcp
