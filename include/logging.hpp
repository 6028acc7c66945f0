#pragma once
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <string>

namespace rkprobe {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

// Parses "trace", "debug", "info", "warn"/"warning", "error" (any case).
bool log_level_from_string(const std::string& s, LogLevel& out);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    void set_sink(std::FILE* sink);
    void log(LogLevel lvl, const char* fmt, ...);
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::WARN;
    std::FILE* sink_ = stderr;
    const char* level_str(LogLevel lvl);
};

} // namespace rkprobe
