/*
 * AirGap C++ - Diagnostic Logger
 *
 * Process-wide, printf-style diagnostic logger. Writes to stderr by default.
 * This is NOT the audit log: audit records go through AuditLogger.
 */
#ifndef airgap_CORE_LOGGER_HPP
#define airgap_CORE_LOGGER_HPP

#include <string>
#include <mutex>
#include <cstdio>
#include <cstdarg>

namespace airgap {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Returns false and leaves `out` untouched for anything else.
bool parse_log_level(const std::string& name, LogLevel& out);

const char* log_level_name(LogLevel level);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Redirect output (tests use a tmpfile). Passing NULL restores stderr.
    void set_output(FILE* out);

    // Colors are enabled automatically when the output is a terminal
    void set_color(bool enabled);

    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func,
                  const char* fmt, va_list args);

    LogLevel level_;
    FILE* out_;
    bool color_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) airgap::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)  airgap::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)  airgap::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...) airgap::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace airgap

#endif // airgap_CORE_LOGGER_HPP
