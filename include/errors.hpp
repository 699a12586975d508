#pragma once

#include <cerrno>
#include <cstring>
#include <string>

namespace respbench {

inline std::string errno_message(const std::string& call) {
  return call + " failed: " + std::string(std::strerror(errno));
}

inline std::string endpoint_string(const std::string& host, int port) {
  return host + ":" + std::to_string(port);
}

inline std::string connect_error(const std::string& host, int port, const std::string& reason) {
  return "cannot connect to " + endpoint_string(host, port) + ": " + reason;
}

} // namespace respbench
