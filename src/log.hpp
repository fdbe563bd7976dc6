#pragma once
#include <optional>
#include <string>

namespace cedarmcp {

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };
enum class LogFormat { Text, Json };

// Case-insensitive; accepts DEBUG, INFO, WARNING (or WARN), ERROR.
std::optional<LogLevel> parse_log_level(const std::string& name);
std::optional<LogFormat> parse_log_format(const std::string& name);
const char* log_level_name(LogLevel level);

// Process-wide sink settings. Output always goes to stderr since stdout
// carries the protocol stream.
void log_init(LogLevel level, LogFormat format);
LogLevel log_level();

// Render one record without writing it (used by log_write and tests).
std::string format_log_line(LogLevel level, LogFormat format,
                            const std::string& tag, const std::string& message);

void log_write(LogLevel level, const std::string& tag, const std::string& message);

inline void log_debug(const std::string& tag, const std::string& message) {
    log_write(LogLevel::Debug, tag, message);
}
inline void log_info(const std::string& tag, const std::string& message) {
    log_write(LogLevel::Info, tag, message);
}
inline void log_warn(const std::string& tag, const std::string& message) {
    log_write(LogLevel::Warning, tag, message);
}
inline void log_error(const std::string& tag, const std::string& message) {
    log_write(LogLevel::Error, tag, message);
}

} // namespace cedarmcp
