// include/amicall/event_dispatcher.hpp
// Event fan-out: call tracker first, then user callbacks.

#pragma once

#include "amicall/call_tracker.hpp"
#include "amicall/message.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace amicall {

using EventHandler = std::function<void(const Message&)>;

// Lifecycle feed for tracked calls. Handlers receive the raw AMI event that
// caused the transition.
namespace lifecycle {
constexpr const char* kCallAnswered = "call_answered";
constexpr const char* kCallConnected = "call_connected";
constexpr const char* kCallEnded = "call_ended";
constexpr const char* kCallFailed = "call_failed";

// nullptr for states that have no lifecycle notification.
const char* name_for(CallStatus status) noexcept;
bool is_lifecycle_name(const std::string& key) noexcept;
}  // namespace lifecycle

// Keys are AMI event names ("Hangup") or lifecycle names ("call_ended").
// Handlers for one key run in registration order.
class CallbackRegistry {
public:
  void add(const std::string& key, EventHandler handler);
  // Drops every handler for key, then adds this one.
  void replace(const std::string& key, EventHandler handler);
  void remove(const std::string& key);

  std::vector<EventHandler> handlers(const std::string& key) const;
  size_t count(const std::string& key) const;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::vector<EventHandler>> handlers_;
};

class EventDispatcher {
public:
  EventDispatcher(CallTracker& tracker, CallbackRegistry& callbacks)
      : tracker_(tracker), callbacks_(callbacks) {}

  // Runs on the reader thread. Handler exceptions are logged and contained.
  void handle(const Message& event);

private:
  void invoke(const std::string& key, const Message& event);

  CallTracker& tracker_;
  CallbackRegistry& callbacks_;
};

}  // namespace amicall
