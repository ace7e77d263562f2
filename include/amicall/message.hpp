// include/amicall/message.hpp
// One AMI block: ordered Key/Value fields plus what kind of block it is.

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace amicall {

enum class MessageKind { Response, Event, Action };

class Message {
public:
  using Field = std::pair<std::string, std::string>;

  Message() = default;
  explicit Message(MessageKind kind) : kind_(kind) {}
  Message(MessageKind kind, std::vector<Field> fields)
      : kind_(kind), fields_(std::move(fields)) {}

  // Convenience for building outgoing actions: Message::action("Hangup").
  static Message action(const std::string& name) {
    Message m(MessageKind::Action);
    m.add("Action", name);
    return m;
  }

  MessageKind kind() const noexcept { return kind_; }
  void set_kind(MessageKind kind) noexcept { kind_ = kind; }

  // Missing fields read as "" so callers never need to test first.
  const std::string& get(const std::string& key) const;
  bool has(const std::string& key) const;

  // Replace the first field named key, or append it.
  Message& set(const std::string& key, std::string value);
  // Always append (AMI allows repeated keys such as Variable).
  Message& add(std::string key, std::string value);

  const std::vector<Field>& fields() const noexcept { return fields_; }
  bool empty() const noexcept { return fields_.empty(); }

  bool is_success() const;  // Response: Success (case-insensitive)

  // "Event: Hangup, Channel: SIP/1000" for logs.
  std::string summary() const;

private:
  MessageKind kind_ = MessageKind::Event;
  std::vector<Field> fields_;
};

}  // namespace amicall
