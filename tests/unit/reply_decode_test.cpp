#include "protocol.hpp"

#include <iostream>
#include <string>

int main() {
  using respbench::ReplyKind;

  const auto pong = respbench::decode_reply("+PONG\r\n");
  if (pong.text != "+PONG\r\n" || pong.lossy || pong.kind != ReplyKind::SimpleString) {
    std::cerr << "clean reply should pass through untouched\n";
    return 1;
  }

  const auto empty = respbench::decode_reply("");
  if (!empty.text.empty() || empty.lossy || empty.kind != ReplyKind::Empty) {
    std::cerr << "zero bytes should decode to an empty reply\n";
    return 1;
  }

  const std::string marker(respbench::kReplacementMarker);
  const auto invalid = respbench::decode_reply("$3\r\na\xff" "b\r\n");
  if (!invalid.lossy || invalid.text != "$3\r\na" + marker + "b\r\n" || invalid.kind != ReplyKind::BulkString) {
    std::cerr << "invalid byte should become one replacement marker\n";
    return 1;
  }

  // Truncated three-byte sequence at the end of the buffer, as a bounded read can produce.
  const auto cut = respbench::decode_reply("$3\r\n\xe2\x82");
  if (!cut.lossy || cut.text != "$3\r\n" + marker) {
    std::cerr << "truncated sequence should collapse to one marker\n";
    return 1;
  }

  const auto multibyte = respbench::decode_reply("$3\r\n\xe2\x82\xac\r\n");
  if (multibyte.lossy || multibyte.text != "$3\r\n\xe2\x82\xac\r\n") {
    std::cerr << "valid multi-byte text should not be replaced\n";
    return 1;
  }

  // Encoded surrogate halves are not valid UTF-8.
  const auto surrogate = respbench::decode_reply("\xed\xa0\x80");
  if (!surrogate.lossy || surrogate.kind != ReplyKind::Unknown) {
    std::cerr << "surrogate should be rejected\n";
    return 1;
  }

  if (respbench::classify_reply("-ERR x\r\n") != ReplyKind::Error ||
      respbench::classify_reply(":1\r\n") != ReplyKind::Integer ||
      respbench::classify_reply("*0\r\n") != ReplyKind::Array ||
      respbench::classify_reply("$-1\r\n") != ReplyKind::BulkString) {
    std::cerr << "reply classification mismatch\n";
    return 1;
  }

  std::cout << "reply_decode_test passed\n";
  return 0;
}
