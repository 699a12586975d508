#pragma once

#include "operation.hpp"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace respbench {

enum class FailurePolicy {
  // A connection failure ends the whole run.
  Abort,
  // A connection failure marks the operation failed; later operations still run.
  Continue,
};

struct BenchConfig {
  std::string host = "127.0.0.1";
  int port = 6380;
  std::uint64_t iterations = 10000;
  std::vector<Operation> operations = {Operation::Ping, Operation::Set, Operation::Get};
  std::string log_level = "info";
  int timeout_ms = 0;  // 0 = block forever
  int clients = 1;
  FailurePolicy on_error = FailurePolicy::Abort;
  bool strict = false;
  std::string user;
  std::string password;
  std::unordered_map<std::string, std::string> raw;
};

// Parses "PING,SET,GET" (commas and/or spaces). Fails on an unknown name or an empty list.
bool parse_operation_list(const std::string& value, std::vector<Operation>& out, std::string& err);

// Applies one `key value` directive. Unknown keys are accepted and only kept in `raw`.
bool apply_directive(BenchConfig& cfg, const std::string& key, const std::string& value, std::string& err);

// Reads directives from `path` on top of `cfg`. A missing file is an error.
bool load_config(const std::string& path, BenchConfig& cfg, std::string& err);

// Command-line flags, kept apart from the config so the file can be applied first.
struct CommandLine {
  std::string config_path;
  std::vector<std::pair<std::string, std::string>> overrides;  // directive name, value; in flag order
  bool show_help = false;
};

// Recognizes --help/-h, --strict, --config <path> and --<directive> <value>.
bool parse_command_line(int argc, const char* const* argv, CommandLine& out, std::string& err);

// Loads cl.config_path (if any) into `cfg`, then applies the flag overrides.
bool resolve_config(const CommandLine& cl, BenchConfig& cfg, std::string& err);

std::string operation_list_string(const std::vector<Operation>& ops);

} // namespace respbench
