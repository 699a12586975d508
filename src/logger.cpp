#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace respbench {
namespace {
std::mutex g_log_mutex;
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

const char* to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Debug:
      return "DEBUG";
  }
  return "UNKNOWN";
}
}  // namespace

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

bool parse_log_level(const std::string& name, LogLevel& out) {
  if (name == "error") {
    out = LogLevel::Error;
  } else if (name == "warn") {
    out = LogLevel::Warn;
  } else if (name == "info") {
    out = LogLevel::Info;
  } else if (name == "debug") {
    out = LogLevel::Debug;
  } else {
    return false;
  }
  return true;
}

void log(LogLevel level, const std::string& message) {
  if (static_cast<int>(level) > g_level.load()) {
    return;
  }

  const auto now = std::chrono::system_clock::now();
  const auto now_time = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_buf {};
  localtime_r(&now_time, &tm_buf);

  std::ostringstream ts;
  ts << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;

  // stdout carries the report, diagnostics stay on stderr
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::cerr << "[" << ts.str() << "] [" << to_string(level) << "] " << message << '\n';
}

}  // namespace respbench
