#include "logging.hpp"
#include <cctype>
#include <chrono>
#include <ctime>

namespace rawlink {

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_ = lvl; }
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
  if (lvl < level_ || lvl == LogLevel::OFF)
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  char ts[32];
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
  std::fprintf(stderr, "%s.%03d [%s] ", ts, (int)ms, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(stderr, fmt, ap);
  va_end(ap);
  std::fprintf(stderr, "\n");
}

bool parse_log_level(const std::string &s, LogLevel &out) {
  std::string l;
  for (char c : s)
    l.push_back((char)std::tolower((unsigned char)c));
  if (l == "trace")
    out = LogLevel::TRACE;
  else if (l == "debug")
    out = LogLevel::DEBUG;
  else if (l == "info")
    out = LogLevel::INFO;
  else if (l == "warn" || l == "warning")
    out = LogLevel::WARN;
  else if (l == "error")
    out = LogLevel::ERROR;
  else if (l == "off")
    out = LogLevel::OFF;
  else
    return false;
  return true;
}

} // namespace rawlink
