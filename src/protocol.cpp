#include "protocol.hpp"

#include <limits>
#include <utility>

namespace respbench {
namespace {

bool parse_i32(std::string_view sv, int& out) {
  if (sv.empty()) return false;
  bool negative = false;
  std::size_t i = 0;
  if (sv[0] == '-') {
    negative = true;
    i = 1;
    if (i == sv.size()) return false;
  }
  int value = 0;
  for (; i < sv.size(); ++i) {
    const char c = sv[i];
    if (c < '0' || c > '9') return false;
    const int digit = c - '0';
    if (value > (std::numeric_limits<int>::max() - digit) / 10) return false;
    value = value * 10 + digit;
  }
  out = negative ? -value : value;
  return true;
}

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Length of the valid UTF-8 sequence starting at `pos`, or 0 with `bad_len`
// set to the number of bytes forming the invalid prefix.
std::size_t valid_sequence_length(std::string_view s, std::size_t pos, std::size_t& bad_len) {
  const auto lead = static_cast<unsigned char>(s[pos]);
  bad_len = 1;
  if (lead < 0x80) return 1;

  std::size_t need = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    need = 1;
  } else if (lead == 0xE0) {
    need = 2;
    lo = 0xA0;
  } else if (lead >= 0xE1 && lead <= 0xEC) {
    need = 2;
  } else if (lead == 0xED) {
    need = 2;
    hi = 0x9F;
  } else if (lead >= 0xEE && lead <= 0xEF) {
    need = 2;
  } else if (lead == 0xF0) {
    need = 3;
    lo = 0x90;
  } else if (lead >= 0xF1 && lead <= 0xF3) {
    need = 3;
  } else if (lead == 0xF4) {
    need = 3;
    hi = 0x8F;
  } else {
    return 0;
  }

  for (std::size_t k = 1; k <= need; ++k) {
    if (pos + k >= s.size()) return 0;
    const auto c = static_cast<unsigned char>(s[pos + k]);
    if (k == 1) {
      if (c < lo || c > hi) return 0;
    } else if (!is_continuation(c)) {
      return 0;
    }
    bad_len = k + 1;
  }
  return need + 1;
}

}  // namespace

std::string encode_command(const std::vector<std::string>& args) {
  std::size_t total = 16;
  for (const auto& a : args) total += a.size() + 16;

  std::string out;
  out.reserve(total);
  out += "*" + std::to_string(args.size()) + "\r\n";
  for (const auto& a : args) {
    out += "$" + std::to_string(a.size()) + "\r\n";
    out += a;
    out += "\r\n";
  }
  return out;
}

std::optional<ParsedCommand> parse_one_command(std::string_view buffer) {
  if (buffer.empty() || buffer[0] != '*') return std::nullopt;

  const auto line_end = buffer.find("\r\n");
  if (line_end == std::string::npos) return std::nullopt;

  int count = 0;
  if (!parse_i32(buffer.substr(1, line_end - 1), count)) {
    return ParsedCommand{{"__parse_error__"}, line_end + 2};
  }

  if (count < 0) return ParsedCommand{{"__parse_error__"}, line_end + 2};

  std::size_t pos = line_end + 2;
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(count));

  for (int i = 0; i < count; ++i) {
    if (pos >= buffer.size()) return std::nullopt;
    if (buffer[pos] != '$') return ParsedCommand{{"__parse_error__"}, pos};
    const auto bulk_end = buffer.find("\r\n", pos);
    if (bulk_end == std::string::npos) return std::nullopt;

    int len = 0;
    if (!parse_i32(buffer.substr(pos + 1, bulk_end - pos - 1), len)) {
      return ParsedCommand{{"__parse_error__"}, bulk_end + 2};
    }

    if (len < 0) return ParsedCommand{{"__parse_error__"}, bulk_end + 2};

    const std::size_t data_start = bulk_end + 2;
    const std::size_t required = data_start + static_cast<std::size_t>(len) + 2;
    if (required > buffer.size()) return std::nullopt;
    if (buffer[required - 2] != '\r' || buffer[required - 1] != '\n') {
      return ParsedCommand{{"__parse_error__"}, required};
    }

    args.emplace_back(buffer.substr(data_start, static_cast<std::size_t>(len)));
    pos = required;
  }

  return ParsedCommand{std::move(args), pos};
}

ReplyKind classify_reply(std::string_view bytes) {
  if (bytes.empty()) return ReplyKind::Empty;
  switch (bytes[0]) {
    case '+':
      return ReplyKind::SimpleString;
    case '-':
      return ReplyKind::Error;
    case ':':
      return ReplyKind::Integer;
    case '$':
      return ReplyKind::BulkString;
    case '*':
      return ReplyKind::Array;
    default:
      return ReplyKind::Unknown;
  }
}

DecodedReply decode_reply(std::string_view bytes) {
  DecodedReply reply;
  reply.kind = classify_reply(bytes);
  reply.text.reserve(bytes.size());

  std::size_t pos = 0;
  while (pos < bytes.size()) {
    std::size_t bad_len = 0;
    const std::size_t len = valid_sequence_length(bytes, pos, bad_len);
    if (len == 0) {
      reply.text.append(kReplacementMarker.data(), kReplacementMarker.size());
      reply.lossy = true;
      pos += bad_len;
      continue;
    }
    reply.text.append(bytes.data() + pos, len);
    pos += len;
  }
  return reply;
}

const char* reply_kind_name(ReplyKind kind) {
  switch (kind) {
    case ReplyKind::Empty:
      return "empty";
    case ReplyKind::SimpleString:
      return "simple-string";
    case ReplyKind::Error:
      return "error";
    case ReplyKind::Integer:
      return "integer";
    case ReplyKind::BulkString:
      return "bulk-string";
    case ReplyKind::Array:
      return "array";
    case ReplyKind::Unknown:
      return "unknown";
  }
  return "unknown";
}

}  // namespace respbench
