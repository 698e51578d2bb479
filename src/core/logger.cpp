/*
 * AirGap C++ - Diagnostic Logger Implementation
 */
#include <airgap/core/logger.hpp>
#include <airgap/core/utils.hpp>

#include <ctime>
#include <unistd.h>

namespace airgap {

static const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m"; // Blue
        case LogLevel::INFO: return "\033[32m";  // Green
        case LogLevel::WARN: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        default: return "\033[0m";
    }
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string lower = to_lower(trim(name));
    if (lower == "debug") {
        out = LogLevel::DEBUG;
    } else if (lower == "info") {
        out = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        out = LogLevel::WARN;
    } else if (lower == "error") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

// "bool airgap::PathSecurityContext::foo(const string&) const" -> "PathSecurityContext::foo"
static std::string short_function_name(const char* pretty_function) {
    std::string pf = pretty_function ? pretty_function : "";

    size_t paren_pos = pf.find('(');
    std::string signature = (paren_pos == std::string::npos) ? pf : pf.substr(0, paren_pos);

    size_t space_pos = signature.rfind(' ');
    if (space_pos != std::string::npos) {
        signature = signature.substr(space_pos + 1);
    }
    while (!signature.empty() && (signature[0] == '*' || signature[0] == '&')) {
        signature.erase(0, 1);
    }
    if (starts_with(signature, "airgap::")) {
        signature = signature.substr(8);
    }
    return signature;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , out_(stderr)
    , color_(isatty(fileno(stderr)) != 0) {}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::set_output(FILE* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out ? out : stderr;
    color_ = isatty(fileno(out_)) != 0;
}

void Logger::set_color(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    color_ = enabled;
}

void Logger::debug(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, file, line, func, fmt, args);
    va_end(args);
}

void Logger::info(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, file, line, func, fmt, args);
    va_end(args);
}

void Logger::warn(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, file, line, func, fmt, args);
    va_end(args);
}

void Logger::error(const char* file, int line, const char* func, const char* fmt, ...) {
    if (level_ > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, file, line, func, fmt, args);
    va_end(args);
}

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func,
                      const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    std::lock_guard<std::mutex> lock(mutex_);

    if (color_) {
        fprintf(out_, "[%s] %s[%s]\033[0m ", timestamp, level_color(level), log_level_name(level));
    } else {
        fprintf(out_, "[%s] [%s] ", timestamp, log_level_name(level));
    }

    // Source location only at debug verbosity
    if (level_ == LogLevel::DEBUG) {
        std::string fn = short_function_name(func);
        if (color_) {
            fprintf(out_, "\033[36m(%s)\033[0m at \033[33m%s:%d\033[0m ", fn.c_str(), file, line);
        } else {
            fprintf(out_, "(%s) at %s:%d ", fn.c_str(), file, line);
        }
    }

    vfprintf(out_, fmt, args);
    fputc('\n', out_);
    fflush(out_);
}

} // namespace airgap
