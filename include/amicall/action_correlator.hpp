// include/amicall/action_correlator.hpp
// Matches responses to the action that asked for them, by ActionID.

#pragma once

#include "amicall/error.hpp"
#include "amicall/message.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace amicall {

class ActionCorrelator {
public:
  using Writer = std::function<void(const std::string&)>;
  using ResponseHandler = std::function<void(const Message&)>;

  explicit ActionCorrelator(Writer writer) : writer_(std::move(writer)) {}

  ActionCorrelator(const ActionCorrelator&) = delete;
  ActionCorrelator& operator=(const ActionCorrelator&) = delete;

  // Stamps a fresh ActionID, writes the action and blocks until the matching
  // response arrives. Throws AmiError: ActionTimeout (entry evicted, outcome
  // unknown), ConnectionLost (write failed or reader gave up).
  // action_id 0 draws the next id; callers that need the id before the write
  // (to tag state with it) pass one from next_action_id().
  Message send(Message action, std::chrono::milliseconds timeout, uint64_t action_id = 0);

  // Stamps an ActionID and writes the action without waiting. The response,
  // when it comes, is logged and handed to on_response on the reader side.
  // Returns the ActionID. Throws AmiError(ConnectionLost) when the write
  // fails.
  uint64_t post(Message action, uint64_t action_id = 0, ResponseHandler on_response = nullptr);

  // Reader side. Hands the response to the waiter with the same ActionID.
  // Returns false when nobody is waiting for it (late, posted or foreign
  // response).
  bool resolve(const Message& response);

  // Fails every outstanding waiter with error.
  void fail_all(const AmiError& error);

  size_t pending_count() const;

  // Process-wide, strictly increasing.
  static uint64_t next_action_id();

private:
  struct PendingAction {
    uint64_t action_id = 0;
    std::string action;
    std::chrono::steady_clock::time_point submitted_at;
    std::promise<Message> result;
  };

  struct PostedAction {
    std::string action;
    ResponseHandler on_response;
  };

  Writer writer_;
  mutable std::mutex mu_;
  std::unordered_map<uint64_t, std::shared_ptr<PendingAction>> pending_;
  std::unordered_map<uint64_t, PostedAction> posted_;
};

}  // namespace amicall
