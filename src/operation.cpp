#include "operation.hpp"

#include <algorithm>
#include <cctype>

namespace respbench {

const char* operation_name(Operation op) {
  switch (op) {
    case Operation::Ping:
      return "PING";
    case Operation::Set:
      return "SET";
    case Operation::Get:
      return "GET";
    case Operation::Del:
      return "DEL";
  }
  return "UNKNOWN";
}

std::optional<Operation> parse_operation(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "PING") return Operation::Ping;
  if (upper == "SET") return Operation::Set;
  if (upper == "GET") return Operation::Get;
  if (upper == "DEL") return Operation::Del;
  return std::nullopt;
}

std::vector<std::string> build_command(Operation op, std::uint64_t i) {
  switch (op) {
    case Operation::Ping:
      return {"PING"};
    case Operation::Set:
      return {"SET", "key" + std::to_string(i), "value" + std::to_string(i)};
    case Operation::Get:
      return {"GET", std::to_string(i % kKeyCycle)};
    case Operation::Del:
      return {"DEL", std::to_string(i % kKeyCycle)};
  }
  return {};
}

}  // namespace respbench
