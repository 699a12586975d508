#include "config.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <utility>

namespace respbench {
namespace {

std::string trim(const std::string& s) {
  const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  if (first == s.end()) return "";
  const auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return std::string(first, last);
}

bool parse_u64(const std::string& s, std::uint64_t& out) {
  if (s.empty()) return false;
  std::uint64_t value = 0;
  for (const char c : s) {
    if (c < '0' || c > '9') return false;
    const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
    if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) return false;
    value = value * 10 + digit;
  }
  out = value;
  return true;
}

bool parse_int_in_range(const std::string& s, int lo, int hi, int& out) {
  std::uint64_t value = 0;
  if (!parse_u64(s, value)) return false;
  if (value < static_cast<std::uint64_t>(lo) || value > static_cast<std::uint64_t>(hi)) return false;
  out = static_cast<int>(value);
  return true;
}

bool parse_bool(const std::string& s, bool& out) {
  if (s == "yes" || s == "1" || s == "true") {
    out = true;
    return true;
  }
  if (s == "no" || s == "0" || s == "false") {
    out = false;
    return true;
  }
  return false;
}

}  // namespace

bool parse_operation_list(const std::string& value, std::vector<Operation>& out, std::string& err) {
  std::string normalized = value;
  std::replace(normalized.begin(), normalized.end(), ',', ' ');

  std::vector<Operation> ops;
  std::istringstream iss(normalized);
  std::string token;
  while (iss >> token) {
    const auto op = parse_operation(token);
    if (!op) {
      err = "unknown operation '" + token + "' (expected PING, SET, GET or DEL)";
      return false;
    }
    ops.push_back(*op);
  }
  if (ops.empty()) {
    err = "operation list is empty";
    return false;
  }
  out = std::move(ops);
  return true;
}

bool apply_directive(BenchConfig& cfg, const std::string& key, const std::string& value, std::string& err) {
  if (key == "host") {
    if (value.empty()) {
      err = "host must not be empty";
      return false;
    }
    cfg.host = value;
  } else if (key == "port") {
    if (!parse_int_in_range(value, 1, 65535, cfg.port)) {
      err = "invalid port '" + value + "'";
      return false;
    }
  } else if (key == "iterations") {
    std::uint64_t n = 0;
    if (!parse_u64(value, n) || n == 0 || n > kMaxIterations) {
      err = "iterations must be between 1 and " + std::to_string(kMaxIterations) + ", got '" + value + "'";
      return false;
    }
    cfg.iterations = n;
  } else if (key == "operations") {
    if (!parse_operation_list(value, cfg.operations, err)) return false;
  } else if (key == "clients") {
    if (!parse_int_in_range(value, 1, 4096, cfg.clients)) {
      err = "clients must be between 1 and 4096, got '" + value + "'";
      return false;
    }
  } else if (key == "timeout-ms") {
    if (!parse_int_in_range(value, 0, std::numeric_limits<int>::max(), cfg.timeout_ms)) {
      err = "invalid timeout-ms '" + value + "'";
      return false;
    }
  } else if (key == "on-error") {
    if (value == "abort") {
      cfg.on_error = FailurePolicy::Abort;
    } else if (value == "continue") {
      cfg.on_error = FailurePolicy::Continue;
    } else {
      err = "on-error must be 'abort' or 'continue', got '" + value + "'";
      return false;
    }
  } else if (key == "loglevel") {
    LogLevel level{};
    if (!parse_log_level(value, level)) {
      err = "loglevel must be error, warn, info or debug, got '" + value + "'";
      return false;
    }
    cfg.log_level = value;
  } else if (key == "strict") {
    if (!parse_bool(value, cfg.strict)) {
      err = "strict must be yes or no, got '" + value + "'";
      return false;
    }
  } else if (key == "user") {
    cfg.user = value;
  } else if (key == "password") {
    cfg.password = value;
  }
  cfg.raw[key] = value;
  return true;
}

bool parse_command_line(int argc, const char* const* argv, CommandLine& out, std::string& err) {
  static const char* const kValueOptions[] = {"host",     "port",     "iterations", "operations", "clients",
                                              "timeout-ms", "on-error", "user",       "password",   "loglevel"};
  CommandLine cl;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      cl.show_help = true;
      continue;
    }
    if (arg == "--strict") {
      cl.overrides.emplace_back("strict", "yes");
      continue;
    }
    if (arg.rfind("--", 0) != 0) {
      err = "unexpected argument: " + arg;
      return false;
    }
    const std::string key = arg.substr(2);
    const bool known = key == "config" || std::find(std::begin(kValueOptions), std::end(kValueOptions), key) !=
                                              std::end(kValueOptions);
    if (!known) {
      err = "unknown option: " + arg;
      return false;
    }
    if (i + 1 >= argc) {
      err = "missing value for " + arg;
      return false;
    }
    const std::string value = argv[++i];
    if (key == "config") {
      cl.config_path = value;
    } else {
      cl.overrides.emplace_back(key, value);
    }
  }
  out = std::move(cl);
  return true;
}

bool resolve_config(const CommandLine& cl, BenchConfig& cfg, std::string& err) {
  if (!cl.config_path.empty() && !load_config(cl.config_path, cfg, err)) return false;
  // Flags win over the config file.
  for (const auto& kv : cl.overrides) {
    if (!apply_directive(cfg, kv.first, kv.second, err)) {
      err = "--" + kv.first + ": " + err;
      return false;
    }
  }
  return true;
}

bool load_config(const std::string& path, BenchConfig& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    err = "cannot open config file '" + path + "'";
    return false;
  }

  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const auto no_comment = line.substr(0, line.find('#'));
    const auto cleaned = trim(no_comment);
    if (cleaned.empty()) continue;

    std::istringstream iss(cleaned);
    std::string key;
    if (!(iss >> key)) continue;

    std::string value;
    std::getline(iss, value);
    value = trim(value);
    if (value.empty()) continue;

    if (!apply_directive(cfg, key, value, err)) {
      err = path + ":" + std::to_string(line_no) + ": " + err;
      return false;
    }
  }
  return true;
}

std::string operation_list_string(const std::vector<Operation>& ops) {
  std::string out;
  for (const auto op : ops) {
    if (!out.empty()) out += ",";
    out += operation_name(op);
  }
  return out;
}

}  // namespace respbench
