#pragma once

#include <string>

namespace respbench {

enum class LogLevel {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3,
};

void set_log_level(LogLevel level);

// Returns false and leaves `out` untouched for an unrecognized name.
bool parse_log_level(const std::string& name, LogLevel& out);

void log(LogLevel level, const std::string& message);

} // namespace respbench
