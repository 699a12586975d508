#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace respbench {

struct ParsedCommand {
  std::vector<std::string> args;
  std::size_t consumed = 0;
};

enum class ReplyKind {
  Empty,
  SimpleString,
  Error,
  Integer,
  BulkString,
  Array,
  Unknown,
};

// Text of one reply after lossy UTF-8 decoding.
struct DecodedReply {
  std::string text;
  ReplyKind kind = ReplyKind::Empty;
  bool lossy = false;  // at least one invalid sequence was replaced
};

// U+FFFD, substituted for each invalid byte sequence.
constexpr std::string_view kReplacementMarker = "\xEF\xBF\xBD";

// *<argc>\r\n then $<len>\r\n<bytes>\r\n per argument. Lengths count bytes.
std::string encode_command(const std::vector<std::string>& args);

// Parses one array-of-bulk-strings request. nullopt when the buffer holds an
// incomplete frame; args == {"__parse_error__"} when the framing is invalid.
std::optional<ParsedCommand> parse_one_command(std::string_view buffer);

ReplyKind classify_reply(std::string_view bytes);

DecodedReply decode_reply(std::string_view bytes);

const char* reply_kind_name(ReplyKind kind);

} // namespace respbench
