// include/amicall/call_tracker.hpp
// Per-call lifecycle derived from AMI events. Calls are matched by the channel
// they were originated on, or by Uniqueid once the PBX has announced it.

#pragma once

#include "amicall/message.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace amicall {

// Declaration order is lifecycle order; a call only ever moves down this list.
enum class CallStatus { Originating, Dialing, Ringing, Answered, Connected, Ended, Failed };

const char* to_string(CallStatus status) noexcept;
bool is_terminal(CallStatus status) noexcept;

using WallClock = std::chrono::system_clock;

struct CallRecord {
  std::string call_id;
  std::string channel;    // fixed at creation
  std::string unique_id;  // learned from the first matching Newchannel
  std::string phone_number;
  CallStatus status = CallStatus::Originating;
  uint64_t originate_action_id = 0;

  WallClock::time_point start_time;
  std::optional<WallClock::time_point> answer_time;
  std::optional<WallClock::time_point> bridge_time;
  std::optional<WallClock::time_point> end_time;
  std::optional<std::string> hangup_cause;
};

struct CallTransition {
  std::string call_id;
  CallStatus from;
  CallStatus to;
};

class CallTracker {
public:
  CallTracker() = default;
  CallTracker(const CallTracker&) = delete;
  CallTracker& operator=(const CallTracker&) = delete;

  // A reserved record receives events but is invisible to readers until
  // commit(). discard() drops it (originate rejected).
  void reserve(CallRecord record);
  void commit(const std::string& call_id);
  void discard(const std::string& call_id);

  // Applies one event; returns the status changes it caused. Events for
  // channels nobody tracks change nothing.
  std::vector<CallTransition> apply(const Message& event);

  std::optional<CallRecord> find(const std::string& call_id) const;
  std::vector<CallRecord> all() const;     // oldest first
  std::vector<CallRecord> active() const;  // non-terminal only

  bool purge(const std::string& call_id);
  size_t purge_finished();
  void clear();
  size_t size() const;

private:
  struct Entry {
    CallRecord record;
    uint64_t seq = 0;
    bool committed = false;
  };

  Entry* match_channel(const std::string& channel);
  Entry* match_unique_id(const std::string& unique_id);
  Entry* match(const Message& event, const char* channel_field);
  void unindex(const Entry& e);
  // Moves e forward to target. Returns false for a terminal call, a duplicate
  // or an event that would move the call backwards.
  bool advance(Entry& e, CallStatus target, std::vector<CallTransition>& out);
  std::vector<CallRecord> snapshot(bool active_only) const;

  mutable std::mutex mu_;
  uint64_t next_seq_ = 0;
  std::unordered_map<std::string, Entry> calls_;
  std::unordered_map<std::string, std::vector<std::string>> by_channel_;  // channel -> call ids
  std::unordered_map<std::string, std::string> by_unique_id_;            // uniqueid -> call id
};

}  // namespace amicall
