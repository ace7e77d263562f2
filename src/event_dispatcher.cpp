// src/event_dispatcher.cpp

#include "amicall/event_dispatcher.hpp"
#include "amicall/log.hpp"

#include <exception>

namespace amicall {

namespace lifecycle {

const char* name_for(CallStatus status) noexcept {
  switch (status) {
    case CallStatus::Answered: return kCallAnswered;
    case CallStatus::Connected: return kCallConnected;
    case CallStatus::Ended: return kCallEnded;
    case CallStatus::Failed: return kCallFailed;
    default: return nullptr;
  }
}

bool is_lifecycle_name(const std::string& key) noexcept {
  return key == kCallAnswered || key == kCallConnected || key == kCallEnded ||
         key == kCallFailed;
}

}  // namespace lifecycle

void CallbackRegistry::add(const std::string& key, EventHandler handler) {
  std::lock_guard<std::mutex> lk(mu_);
  handlers_[key].push_back(std::move(handler));
}

void CallbackRegistry::replace(const std::string& key, EventHandler handler) {
  std::lock_guard<std::mutex> lk(mu_);
  auto& list = handlers_[key];
  list.clear();
  list.push_back(std::move(handler));
}

void CallbackRegistry::remove(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  handlers_.erase(key);
}

std::vector<EventHandler> CallbackRegistry::handlers(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = handlers_.find(key);
  if (it == handlers_.end()) return {};
  return it->second;
}

size_t CallbackRegistry::count(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = handlers_.find(key);
  return it == handlers_.end() ? 0 : it->second.size();
}

void EventDispatcher::invoke(const std::string& key, const Message& event) {
  // Copy taken under the registry lock; handlers run without it so they may
  // register more callbacks.
  for (const auto& handler : callbacks_.handlers(key)) {
    try {
      handler(event);
    } catch (const std::exception& ex) {
      logger()->error("{} callback threw: {}", key, ex.what());
    } catch (...) {
      logger()->error("{} callback threw a non-standard exception", key);
    }
  }
}

void EventDispatcher::handle(const Message& event) {
  const std::string& name = event.get("Event");
  if (name.empty()) return;

  auto transitions = tracker_.apply(event);

  invoke(name, event);

  for (const auto& t : transitions) {
    const char* lc = lifecycle::name_for(t.to);
    if (lc) invoke(lc, event);
  }
}

}  // namespace amicall
