// src/action_correlator.cpp

#include "amicall/action_correlator.hpp"
#include "amicall/codec.hpp"
#include "amicall/log.hpp"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <vector>

namespace amicall {

static std::atomic<uint64_t> g_action_id{0};

uint64_t ActionCorrelator::next_action_id() {
  return g_action_id.fetch_add(1) + 1;
}

Message ActionCorrelator::send(Message action, std::chrono::milliseconds timeout,
                               uint64_t action_id) {
  auto pending = std::make_shared<PendingAction>();
  pending->action_id = action_id != 0 ? action_id : next_action_id();
  pending->action = action.get("Action");
  pending->submitted_at = std::chrono::steady_clock::now();
  action.set("ActionID", std::to_string(pending->action_id));

  auto future = pending->result.get_future();
  const uint64_t id = pending->action_id;
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending_[id] = pending;
  }

  try {
    writer_(codec::encode(action));
  } catch (...) {
    std::lock_guard<std::mutex> lk(mu_);
    pending_.erase(id);
    throw;
  }
  logger()->debug("sent {} (ActionID {})", pending->action, id);

  if (future.wait_for(timeout) == std::future_status::ready) {
    return future.get();
  }

  size_t evicted = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    evicted = pending_.erase(id);
  }
  if (evicted == 0) {
    // resolve() claimed the entry between our timeout and the eviction; the
    // value is on its way.
    return future.get();
  }
  logger()->warn("{} (ActionID {}) timed out after {} ms", pending->action, id,
                 timeout.count());
  throw AmiError::timeout(pending->action, id);
}

uint64_t ActionCorrelator::post(Message action, uint64_t action_id,
                                ResponseHandler on_response) {
  const uint64_t id = action_id != 0 ? action_id : next_action_id();
  const std::string name = action.get("Action");
  action.set("ActionID", std::to_string(id));
  {
    std::lock_guard<std::mutex> lk(mu_);
    posted_[id] = PostedAction{name, std::move(on_response)};
  }
  try {
    writer_(codec::encode(action));
  } catch (...) {
    std::lock_guard<std::mutex> lk(mu_);
    posted_.erase(id);
    throw;
  }
  logger()->debug("posted {} (ActionID {})", name, id);
  return id;
}

bool ActionCorrelator::resolve(const Message& response) {
  const std::string& raw = response.get("ActionID");
  if (raw.empty()) {
    logger()->warn("response without ActionID discarded: {}", response.summary());
    return false;
  }
  char* end = nullptr;
  errno = 0;
  unsigned long long id = std::strtoull(raw.c_str(), &end, 10);
  if (errno != 0 || end == raw.c_str() || *end != '\0') {
    logger()->warn("response with foreign ActionID '{}' discarded", raw);
    return false;
  }

  std::shared_ptr<PendingAction> pending;
  bool was_posted = false;
  PostedAction posted;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = pending_.find(id);
    if (it != pending_.end()) {
      pending = it->second;
      pending_.erase(it);
    } else {
      auto pit = posted_.find(id);
      if (pit != posted_.end()) {
        was_posted = true;
        posted = std::move(pit->second);
        posted_.erase(pit);
      }
    }
  }
  if (was_posted) {
    if (response.is_success()) {
      logger()->debug("{} (ActionID {}) accepted", posted.action, id);
    } else {
      logger()->warn("{} (ActionID {}) rejected: {}", posted.action, id, response.summary());
    }
    if (posted.on_response) posted.on_response(response);
    return false;
  }
  if (!pending) {
    logger()->warn("late response for ActionID {} discarded: {}", id, response.summary());
    return false;
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - pending->submitted_at);
  logger()->debug("{} (ActionID {}) answered in {} ms", pending->action, id, elapsed.count());
  pending->result.set_value(response);
  return true;
}

void ActionCorrelator::fail_all(const AmiError& error) {
  std::vector<std::shared_ptr<PendingAction>> failed;
  {
    std::lock_guard<std::mutex> lk(mu_);
    failed.reserve(pending_.size());
    for (auto& kv : pending_) failed.push_back(kv.second);
    pending_.clear();
    posted_.clear();
  }
  for (auto& p : failed) {
    p->result.set_exception(std::make_exception_ptr(error));
  }
  if (!failed.empty()) {
    logger()->warn("failed {} pending action(s): {}", failed.size(), error.what());
  }
}

size_t ActionCorrelator::pending_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return pending_.size();
}

}  // namespace amicall
