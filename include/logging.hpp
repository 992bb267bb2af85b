#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace rawlink {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR, OFF };

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    void log(LogLevel lvl, const char* fmt, ...);
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    const char* level_str(LogLevel lvl);
};

// Accepts "trace", "debug", "info", "warn", "error", "off" (case-insensitive).
bool parse_log_level(const std::string& s, LogLevel& out);

} // namespace rawlink
