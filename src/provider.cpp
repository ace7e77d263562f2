// src/provider.cpp

#include "amicall/provider.hpp"
#include "amicall/log.hpp"

namespace amicall {

TelephonyProvider::TelephonyProvider(ProviderConfig config)
    : config_(std::move(config)), client_(config_.credentials(), config_.client) {}

bool TelephonyProvider::initialize() {
  logger()->info("initializing telephony provider ({}:{})", config_.ami_host, config_.ami_port);
  if (!client_.connect()) return false;
  if (!client_.login()) return false;
  logger()->info("telephony provider ready");
  return true;
}

std::string TelephonyProvider::clean_number(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    if (c == ' ' || c == '-' || c == '(' || c == ')' || c == '.') continue;
    out.push_back(c);
  }
  return out;
}

CallResult TelephonyProvider::make_call(const std::string& phone_number) {
  std::string number = clean_number(phone_number);
  logger()->info("making call to {}", number);
  return client_.originate_call(number, config_.channel_tech, config_.context, config_.extension,
                                config_.caller_id);
}

CallResult TelephonyProvider::end_call(const std::string& call_id) {
  return client_.hangup_call(call_id);
}

std::optional<CallRecord> TelephonyProvider::call_status(const std::string& call_id) const {
  return client_.call_status(call_id);
}

std::vector<CallRecord> TelephonyProvider::list_active_calls() const {
  return client_.list_active_calls();
}

void TelephonyProvider::register_call_callback(const std::string& lifecycle_name,
                                               EventHandler handler) {
  if (!lifecycle::is_lifecycle_name(lifecycle_name)) {
    throw AmiError::invalid_argument("not a call lifecycle name: " + lifecycle_name);
  }
  client_.replace_callback(lifecycle_name, std::move(handler));
}

void TelephonyProvider::cleanup() {
  client_.disconnect();
}

}  // namespace amicall
