#pragma once

#include <string>
#include <cstdint>

namespace runbox {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

// Process-wide logger: "YYYY-MM-DD HH:MM:SS [LEVEL]: message" to stdout,
// plus an optional daily file (<log_dir>/<YYYY-MM-DD>.log). A day's file that
// reaches the size cap continues in <YYYY-MM-DD>.1.log, .2.log, ...
class Logger {
public:
    static void set_level(LogLevel level) noexcept;
    static LogLevel level() noexcept;

    // Enable the daily file sink. Empty dir disables it.
    static void set_log_dir(const std::string& dir);

    // Size at which the current file rolls over to the next part
    static void set_max_file_size(uintmax_t bytes) noexcept;

    // Delete all but the newest `keep` .log files in the log directory
    static void prune_old_logs(int keep);

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }

    // "error", "warn", "info", "debug" (case-insensitive). Throws on anything else.
    static LogLevel parse_level(const std::string& name);
    static const char* level_to_string(LogLevel level) noexcept;

    // Format a log line without emitting it
    static std::string format_line(LogLevel level, const std::string& message);
};

} // namespace runbox

#define LOG_ERROR(msg) ::runbox::Logger::error(msg)
#define LOG_WARN(msg)  ::runbox::Logger::warn(msg)
#define LOG_INFO(msg)  ::runbox::Logger::info(msg)
#define LOG_DEBUG(msg) ::runbox::Logger::debug(msg)
