#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace rkprobe {

bool log_level_from_string(const std::string &s, LogLevel &out) {
  std::string v = s;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (v == "trace")
    out = LogLevel::TRACE;
  else if (v == "debug")
    out = LogLevel::DEBUG;
  else if (v == "info")
    out = LogLevel::INFO;
  else if (v == "warn" || v == "warning")
    out = LogLevel::WARN;
  else if (v == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_ = lvl; }

void Logger::set_sink(std::FILE *sink) {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = sink ? sink : stderr;
}

const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (lvl < level_)
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", std::localtime(&t));
  std::fprintf(sink_, "%s [%s] ", ts, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(sink_, fmt, ap);
  va_end(ap);
  std::fprintf(sink_, "\n");
}

} // namespace rkprobe
