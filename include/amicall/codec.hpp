// include/amicall/codec.hpp
// AMI wire framing: CRLF "Key: Value" lines, blocks end with an empty line.

#pragma once

#include "amicall/message.hpp"

#include <string>
#include <vector>

namespace amicall {
namespace codec {

constexpr const char* kLineEnd = "\r\n";
constexpr const char* kBlockEnd = "\r\n\r\n";

std::string encode(const Message& action);

struct DecodeResult {
  std::vector<Message> messages;
  std::string remainder;  // trailing incomplete block, feed it back next time
  size_t discarded = 0;   // complete blocks dropped as malformed
};

// Never throws. Blocks that are neither Event, Response nor Action are
// dropped with a warning and counted in discarded; lines without ": " are
// skipped.
DecodeResult decode(const std::string& buffer);

// Parses a single block without its terminator. Returns false when the block
// has no classifying field.
bool parse_block(const std::string& block, Message& out);

}  // namespace codec
}  // namespace amicall
