#include "operation.hpp"

#include <iostream>
#include <string>
#include <vector>

int main() {
  using respbench::Operation;

  if (respbench::build_command(Operation::Ping, 5) != std::vector<std::string>{"PING"}) {
    std::cerr << "PING takes no arguments\n";
    return 1;
  }
  if (respbench::build_command(Operation::Set, 42) != std::vector<std::string>{"SET", "key42", "value42"}) {
    std::cerr << "SET key/value naming mismatch\n";
    return 1;
  }
  if (respbench::build_command(Operation::Del, 1999) != std::vector<std::string>{"DEL", "999"}) {
    std::cerr << "DEL key should wrap at 1000\n";
    return 1;
  }

  // GET over i = 0..9999 visits 0..999 ten times, in order.
  std::vector<int> seen(1000, 0);
  for (std::uint64_t i = 0; i < 10000; ++i) {
    const auto cmd = respbench::build_command(Operation::Get, i);
    if (cmd.size() != 2 || cmd[0] != "GET") {
      std::cerr << "GET shape mismatch at " << i << "\n";
      return 1;
    }
    const int key = std::stoi(cmd[1]);
    if (key != static_cast<int>(i % 1000)) {
      std::cerr << "GET key out of order at " << i << "\n";
      return 1;
    }
    ++seen[static_cast<std::size_t>(key)];
  }
  for (int count : seen) {
    if (count != 10) {
      std::cerr << "each GET key should be issued 10 times\n";
      return 1;
    }
  }

  if (respbench::parse_operation("get") != Operation::Get || respbench::parse_operation("Del") != Operation::Del) {
    std::cerr << "operation names should parse case-insensitively\n";
    return 1;
  }
  if (respbench::parse_operation("INCR")) {
    std::cerr << "unsupported command should not parse\n";
    return 1;
  }
  if (std::string(respbench::operation_name(Operation::Set)) != "SET") {
    std::cerr << "operation name mismatch\n";
    return 1;
  }

  std::cout << "operation_test passed\n";
  return 0;
}
