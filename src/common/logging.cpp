#include "logging.hpp"
#include <chrono>
#include <ctime>

namespace btflash {

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

void Logger::set_level(LogLevel lvl) { level_ = lvl; }

void Logger::set_output(FILE *out) {
  std::lock_guard<std::mutex> lk(mtx_);
  out_ = out;
}

void Logger::set_prelude(std::function<void()> fn) {
  std::lock_guard<std::mutex> lk(mtx_);
  prelude_ = std::move(fn);
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
  FILE *out = out_ ? out_ : stderr;
  if (prelude_)
    prelude_();
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  char ts[32];
  std::tm tmv{};
  localtime_r(&t, &tmv);
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tmv);
  std::fprintf(out, "%s [%-5s] ", ts, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);
  std::fprintf(out, "\n");
  std::fflush(out);
}

LogLevel level_for_verbosity(int verbose) {
  if (verbose <= 0)
    return LogLevel::INFO;
  if (verbose == 1)
    return LogLevel::DEBUG;
  return LogLevel::TRACE;
}

} // namespace btflash
