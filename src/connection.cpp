#include "connection.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

namespace respbench {

namespace {

bool set_tcp_nodelay(int fd) {
  int yes = 1;
  return setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes)) == 0;
}

bool set_io_timeout(int fd, int timeout_ms) {
  timeval tv{};
  tv.tv_sec = static_cast<long>(timeout_ms / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
  return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool resolve_ipv4(const std::string& host, int port, sockaddr_in& out, std::string& err) {
  out = sockaddr_in{};
  out.sin_family = AF_INET;
  out.sin_port = htons(static_cast<uint16_t>(port));
  if (inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) return true;

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
  if (rc != 0 || res == nullptr) {
    err = "cannot resolve host: " + std::string(gai_strerror(rc));
    return false;
  }
  out.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
  freeaddrinfo(res);
  return true;
}

bool is_timeout_errno(int e) { return e == EAGAIN || e == EWOULDBLOCK; }

}  // namespace

Connection::~Connection() { close(); }

Connection::Connection(Connection&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

Connection& Connection::operator=(Connection&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

bool Connection::open(const ConnectOptions& options, std::string& err) {
  close();

  sockaddr_in sa{};
  std::string reason;
  if (!resolve_ipv4(options.host, options.port, sa, reason)) {
    err = connect_error(options.host, options.port, reason);
    return false;
  }

  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    err = connect_error(options.host, options.port, errno_message("socket()"));
    return false;
  }

  if (options.timeout_ms > 0 && !set_io_timeout(fd, options.timeout_ms)) {
    err = connect_error(options.host, options.port, errno_message("setsockopt(SO_RCVTIMEO)"));
    ::close(fd);
    return false;
  }

  if (connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
    err = connect_error(options.host, options.port, errno_message("connect()"));
    ::close(fd);
    return false;
  }

  if (!set_tcp_nodelay(fd)) {
    log(LogLevel::Warn, errno_message("setsockopt(TCP_NODELAY)"));
  }

  fd_ = fd;
  log(LogLevel::Debug, "connected to " + endpoint_string(options.host, options.port));

  if (!options.password.empty() && !authenticate(options, err)) {
    close();
    return false;
  }
  return true;
}

void Connection::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool Connection::send_all(const std::string& payload, std::string& err) {
  if (fd_ < 0) {
    err = "send on closed connection";
    return false;
  }
  std::size_t sent = 0;
  while (sent < payload.size()) {
    const auto rc = ::send(fd_, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
    if (rc < 0) {
      if (errno == EINTR) continue;
      err = is_timeout_errno(errno) ? std::string("send timed out") : errno_message("send()");
      return false;
    }
    sent += static_cast<std::size_t>(rc);
  }
  return true;
}

bool Connection::read_reply(DecodedReply& out, std::string& err) {
  if (fd_ < 0) {
    err = "read on closed connection";
    return false;
  }
  char buf[kReadBufferSize];
  ssize_t rc = 0;
  do {
    rc = ::recv(fd_, buf, sizeof(buf), 0);
  } while (rc < 0 && errno == EINTR);

  if (rc < 0) {
    err = is_timeout_errno(errno) ? std::string("read timed out") : errno_message("recv()");
    return false;
  }
  out = decode_reply(std::string_view(buf, static_cast<std::size_t>(rc)));
  return true;
}

bool Connection::round_trip(const std::vector<std::string>& args, DecodedReply& out, std::string& err) {
  return send_all(encode_command(args), err) && read_reply(out, err);
}

bool Connection::authenticate(const ConnectOptions& options, std::string& err) {
  std::vector<std::string> args = {"AUTH"};
  if (!options.user.empty()) args.push_back(options.user);
  args.push_back(options.password);

  DecodedReply reply;
  if (!round_trip(args, reply, err)) {
    err = "AUTH failed: " + err;
    return false;
  }
  if (reply.kind != ReplyKind::SimpleString) {
    std::string text = reply.text;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
    err = "AUTH rejected by " + endpoint_string(options.host, options.port) + ": " +
          (text.empty() ? std::string("connection closed") : text);
    return false;
  }
  return true;
}

}  // namespace respbench
