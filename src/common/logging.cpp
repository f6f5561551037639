#include "logging.hpp"
#include <chrono>
#include <ctime>
#include <vector>

namespace tilecast {

bool parse_log_level(const std::string &s, LogLevel &out) {
  if (s == "trace")
    out = LogLevel::TRACE;
  else if (s == "debug")
    out = LogLevel::DEBUG;
  else if (s == "info")
    out = LogLevel::INFO;
  else if (s == "warn")
    out = LogLevel::WARN;
  else if (s == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

const char *level_name(LogLevel lvl) {
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

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

Logger::~Logger() {
  if (file_)
    std::fclose(file_);
}

bool Logger::open_file(const std::string &path) {
  FILE *f = std::fopen(path.c_str(), "a");
  if (!f)
    return false;
  std::lock_guard<std::mutex> lk(mtx_);
  if (file_)
    std::fclose(file_);
  file_ = f;
  return true;
}

void Logger::set_sink(Sink sink) {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = std::move(sink);
}

std::string Logger::stamp() const {
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  size_t n = std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
  std::snprintf(ts + n, sizeof(ts) - n, ".%03d", (int)ms);
  return ts;
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (!enabled(lvl))
    return;
  // format outside the lock; most lines fit the stack buffer
  char small[256];
  std::vector<char> big;
  const char *msg = small;
  va_list ap;
  va_start(ap, fmt);
  va_list ap2;
  va_copy(ap2, ap);
  int need = std::vsnprintf(small, sizeof(small), fmt, ap);
  va_end(ap);
  if (need >= (int)sizeof(small)) {
    big.resize((size_t)need + 1);
    std::vsnprintf(big.data(), big.size(), fmt, ap2);
    msg = big.data();
  } else if (need < 0) {
    msg = fmt;
  }
  va_end(ap2);

  std::string line = stamp() + " [" + level_name(lvl) + "] " + msg;
  std::lock_guard<std::mutex> lk(mtx_);
  if (sink_) {
    sink_(lvl, line);
    return;
  }
  FILE *out = file_ ? file_ : stderr;
  std::fprintf(out, "%s\n", line.c_str());
  if (file_)
    std::fflush(file_);
}

} // namespace tilecast
