#pragma once

#include "protocol.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace respbench {

// Upper bound of a single reply read. One recv() per request, no reassembly.
constexpr std::size_t kReadBufferSize = 1024;

struct ConnectOptions {
  std::string host = "127.0.0.1";
  int port = 6380;
  int timeout_ms = 0;  // applied to send and recv; 0 = block forever
  std::string user;
  std::string password;  // non-empty: AUTH is sent right after connecting
};

// Blocking TCP connection to a RESP server. Owns the socket; closes on destruction.
class Connection {
 public:
  Connection() = default;
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;
  Connection(Connection&& other) noexcept;
  Connection& operator=(Connection&& other) noexcept;

  bool open(const ConnectOptions& options, std::string& err);
  void close();
  bool is_open() const { return fd_ >= 0; }

  bool send_all(const std::string& payload, std::string& err);

  // Performs exactly one bounded read. Zero bytes (peer closed) is not an
  // error and yields an Empty reply; a socket error or timeout is.
  bool read_reply(DecodedReply& out, std::string& err);

  // Encode + send + one read.
  bool round_trip(const std::vector<std::string>& args, DecodedReply& out, std::string& err);

 private:
  bool authenticate(const ConnectOptions& options, std::string& err);

  int fd_ = -1;
};

} // namespace respbench
