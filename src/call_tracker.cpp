// src/call_tracker.cpp

#include "amicall/call_tracker.hpp"
#include "amicall/log.hpp"

#include <algorithm>
#include <cctype>

namespace amicall {

const char* to_string(CallStatus status) noexcept {
  switch (status) {
    case CallStatus::Originating: return "originating";
    case CallStatus::Dialing: return "dialing";
    case CallStatus::Ringing: return "ringing";
    case CallStatus::Answered: return "answered";
    case CallStatus::Connected: return "connected";
    case CallStatus::Ended: return "ended";
    case CallStatus::Failed: return "failed";
  }
  return "unknown";
}

bool is_terminal(CallStatus status) noexcept {
  return status == CallStatus::Ended || status == CallStatus::Failed;
}

static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

void CallTracker::reserve(CallRecord record) {
  std::lock_guard<std::mutex> lk(mu_);
  Entry e;
  e.seq = next_seq_++;
  e.record = std::move(record);
  const std::string id = e.record.call_id;
  by_channel_[e.record.channel].push_back(id);
  calls_[id] = std::move(e);
}

void CallTracker::commit(const std::string& call_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = calls_.find(call_id);
  if (it != calls_.end()) it->second.committed = true;
}

void CallTracker::discard(const std::string& call_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = calls_.find(call_id);
  if (it == calls_.end()) return;
  unindex(it->second);
  calls_.erase(it);
}

void CallTracker::unindex(const Entry& e) {
  auto cit = by_channel_.find(e.record.channel);
  if (cit != by_channel_.end()) {
    auto& ids = cit->second;
    ids.erase(std::remove(ids.begin(), ids.end(), e.record.call_id), ids.end());
    if (ids.empty()) by_channel_.erase(cit);
  }
  if (!e.record.unique_id.empty()) {
    auto uit = by_unique_id_.find(e.record.unique_id);
    if (uit != by_unique_id_.end() && uit->second == e.record.call_id) by_unique_id_.erase(uit);
  }
}

CallTracker::Entry* CallTracker::match_channel(const std::string& channel) {
  if (channel.empty()) return nullptr;
  auto cit = by_channel_.find(channel);
  if (cit == by_channel_.end()) return nullptr;

  // Same number dialled twice: the oldest live call owns the events.
  Entry* terminal = nullptr;
  for (const auto& id : cit->second) {
    auto it = calls_.find(id);
    if (it == calls_.end()) continue;
    if (!is_terminal(it->second.record.status)) return &it->second;
    if (!terminal) terminal = &it->second;
  }
  return terminal;
}

CallTracker::Entry* CallTracker::match_unique_id(const std::string& unique_id) {
  if (unique_id.empty()) return nullptr;
  auto uit = by_unique_id_.find(unique_id);
  if (uit == by_unique_id_.end()) return nullptr;
  auto it = calls_.find(uit->second);
  return it == calls_.end() ? nullptr : &it->second;
}

CallTracker::Entry* CallTracker::match(const Message& event, const char* channel_field) {
  Entry* e = match_unique_id(event.get("Uniqueid"));
  if (e) return e;
  return match_channel(event.get(channel_field));
}

bool CallTracker::advance(Entry& e, CallStatus target, std::vector<CallTransition>& out) {
  CallRecord& r = e.record;
  if (is_terminal(r.status)) return false;
  if (static_cast<int>(target) <= static_cast<int>(r.status)) return false;
  out.push_back(CallTransition{r.call_id, r.status, target});
  logger()->info("call {} ({}): {} -> {}", r.call_id, r.channel, to_string(r.status),
                 to_string(target));
  r.status = target;
  return true;
}

std::vector<CallTransition> CallTracker::apply(const Message& m) {
  std::vector<CallTransition> out;
  const std::string& event = m.get("Event");
  if (event.empty()) return out;

  std::lock_guard<std::mutex> lk(mu_);
  const auto now = WallClock::now();

  if (event == "Newchannel") {
    Entry* e = match_channel(m.get("Channel"));
    if (!e || is_terminal(e->record.status)) return out;
    const std::string& uid = m.get("Uniqueid");
    if (e->record.unique_id.empty() && !uid.empty()) {
      e->record.unique_id = uid;
      by_unique_id_[uid] = e->record.call_id;
    }
    advance(*e, CallStatus::Ringing, out);
    return out;
  }

  if (event == "Dial") {
    Entry* e = match(m, "Channel");
    if (!e) return out;
    const std::string& sub = m.get("SubEvent");
    if (sub == "Begin") {
      advance(*e, CallStatus::Dialing, out);
    } else if (sub == "Answer") {
      if (is_terminal(e->record.status)) return out;
      if (!e->record.answer_time) e->record.answer_time = now;
      advance(*e, CallStatus::Answered, out);
    }
    return out;
  }

  if (event == "Bridge") {
    // Both legs may be ours.
    Entry* first = match_channel(m.get("Channel1"));
    Entry* second = match_channel(m.get("Channel2"));
    if (second == first) second = nullptr;
    for (Entry* e : {first, second}) {
      if (!e || is_terminal(e->record.status)) continue;
      if (!e->record.bridge_time) e->record.bridge_time = now;
      advance(*e, CallStatus::Connected, out);
    }
    return out;
  }

  if (event == "Hangup") {
    Entry* e = match(m, "Channel");
    if (!e || is_terminal(e->record.status)) return out;
    e->record.end_time = now;
    e->record.hangup_cause = m.get("Cause");
    advance(*e, CallStatus::Ended, out);
    return out;
  }

  if (event == "OriginateResponse") {
    if (lower(m.get("Response")) != "failure") return out;
    Entry* e = nullptr;
    const std::string& action_id = m.get("ActionID");
    for (auto& kv : calls_) {
      if (!action_id.empty() &&
          std::to_string(kv.second.record.originate_action_id) == action_id) {
        e = &kv.second;
        break;
      }
    }
    if (!e) e = match_channel(m.get("Channel"));
    if (!e || is_terminal(e->record.status)) return out;
    e->record.end_time = now;
    e->record.hangup_cause = m.get("Reason");
    advance(*e, CallStatus::Failed, out);
    return out;
  }

  return out;
}

std::optional<CallRecord> CallTracker::find(const std::string& call_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = calls_.find(call_id);
  if (it == calls_.end() || !it->second.committed) return std::nullopt;
  return it->second.record;
}

std::vector<CallRecord> CallTracker::snapshot(bool active_only) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<const Entry*> entries;
  for (const auto& kv : calls_) {
    if (!kv.second.committed) continue;
    if (active_only && is_terminal(kv.second.record.status)) continue;
    entries.push_back(&kv.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const Entry* a, const Entry* b) { return a->seq < b->seq; });
  std::vector<CallRecord> out;
  out.reserve(entries.size());
  for (const Entry* e : entries) out.push_back(e->record);
  return out;
}

std::vector<CallRecord> CallTracker::all() const {
  return snapshot(false);
}

std::vector<CallRecord> CallTracker::active() const {
  return snapshot(true);
}

bool CallTracker::purge(const std::string& call_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = calls_.find(call_id);
  if (it == calls_.end() || !it->second.committed) return false;
  unindex(it->second);
  calls_.erase(it);
  return true;
}

size_t CallTracker::purge_finished() {
  std::lock_guard<std::mutex> lk(mu_);
  size_t n = 0;
  for (auto it = calls_.begin(); it != calls_.end();) {
    if (it->second.committed && is_terminal(it->second.record.status)) {
      unindex(it->second);
      it = calls_.erase(it);
      n++;
    } else {
      ++it;
    }
  }
  return n;
}

void CallTracker::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  calls_.clear();
  by_channel_.clear();
  by_unique_id_.clear();
}

size_t CallTracker::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  size_t n = 0;
  for (const auto& kv : calls_) {
    if (kv.second.committed) n++;
  }
  return n;
}

}  // namespace amicall
