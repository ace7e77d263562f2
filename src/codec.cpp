// src/codec.cpp

#include "amicall/codec.hpp"
#include "amicall/log.hpp"

#include <cstring>

namespace amicall {
namespace codec {

std::string encode(const Message& action) {
  std::string out;
  for (const auto& f : action.fields()) {
    out.append(f.first).append(": ").append(f.second).append(kLineEnd);
  }
  out.append(kLineEnd);
  return out;
}

bool parse_block(const std::string& block, Message& out) {
  std::vector<Message::Field> fields;
  size_t pos = 0;
  while (pos <= block.size()) {
    size_t eol = block.find(kLineEnd, pos);
    if (eol == std::string::npos) eol = block.size();
    std::string line = block.substr(pos, eol - pos);
    pos = eol + 2;

    auto sep = line.find(": ");
    if (sep == std::string::npos) continue;
    fields.emplace_back(line.substr(0, sep), line.substr(sep + 2));
  }

  auto has = [&](const char* key) {
    for (const auto& f : fields) {
      if (f.first == key) return true;
    }
    return false;
  };

  MessageKind kind;
  if (has("Event")) {
    kind = MessageKind::Event;
  } else if (has("Response")) {
    kind = MessageKind::Response;
  } else if (has("Action")) {
    kind = MessageKind::Action;
  } else {
    return false;
  }
  out = Message(kind, std::move(fields));
  return true;
}

DecodeResult decode(const std::string& buffer) {
  DecodeResult result;
  const size_t term_len = std::strlen(kBlockEnd);
  size_t pos = 0;
  while (true) {
    size_t end = buffer.find(kBlockEnd, pos);
    if (end == std::string::npos) break;
    std::string block = buffer.substr(pos, end - pos);
    pos = end + term_len;

    // Stray CRLFs between blocks show up as empty blocks.
    if (block.empty()) continue;

    Message msg;
    if (parse_block(block, msg)) {
      result.messages.push_back(std::move(msg));
    } else {
      result.discarded++;
      logger()->warn("discarding malformed AMI block ({} bytes): no Event, Response or Action field",
                     block.size());
    }
  }
  result.remainder = buffer.substr(pos);
  return result;
}

}  // namespace codec
}  // namespace amicall
