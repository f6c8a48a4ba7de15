#include "logging.hpp"
#include <chrono>
#include <ctime>

namespace drtp {

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_ = lvl; }
void Logger::set_stream(std::FILE *out) {
  std::lock_guard<std::mutex> lk(mtx_);
  out_ = out;
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
  if (lvl < level_ || lvl == LogLevel::OFF)
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  char ts[32];
  std::strftime(ts, sizeof(ts), "%H:%M:%S", std::localtime(&t));
  std::fprintf(out_, "%s.%03d [%s] ", ts, (int)ms, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out_, fmt, ap);
  va_end(ap);
  std::fprintf(out_, "\n");
  std::fflush(out_);
}

} // namespace drtp
