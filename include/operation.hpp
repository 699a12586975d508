#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace respbench {

enum class Operation {
  Ping,
  Set,
  Get,
  Del,
};

// GET and DEL cycle over this many distinct keys.
constexpr std::uint64_t kKeyCycle = 1000;

// Largest accepted iteration count per operation; bounds the sample buffer.
constexpr std::uint64_t kMaxIterations = 100000000;

const char* operation_name(Operation op);

// Case-insensitive; nullopt for anything other than PING/SET/GET/DEL.
std::optional<Operation> parse_operation(const std::string& name);

// Argument list for iteration `i`, command name first.
std::vector<std::string> build_command(Operation op, std::uint64_t i);

} // namespace respbench
