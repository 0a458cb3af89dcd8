#ifndef AGENTFLOW_COMMON_UTILS_LOG_H
#define AGENTFLOW_COMMON_UTILS_LOG_H

#include <optional>
#include <string>
#include <string_view>

namespace agentflow {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

// Process-wide threshold; messages below it are dropped.
void set_log_level(LogLevel level);
LogLevel log_level();

// "DEBUG" / "INFO" / "WARNING" (or "WARN") / "ERROR", case-insensitive.
std::optional<LogLevel> parse_log_level(std::string_view text);

// Writes "[LEVEL] message" to std::cerr (thread-safe).
void log(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) { log(LogLevel::DEBUG, message); }
inline void log_info(const std::string& message) { log(LogLevel::INFO, message); }
inline void log_warning(const std::string& message) { log(LogLevel::WARNING, message); }
inline void log_error(const std::string& message) { log(LogLevel::ERROR, message); }

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_LOG_H
