// include/amicall/provider.hpp
// TelephonyProvider: the client with dialling defaults from ProviderConfig,
// for callers that just want make_call(number) / end_call(id).

#pragma once

#include "amicall/client.hpp"
#include "amicall/config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace amicall {

class TelephonyProvider {
public:
  explicit TelephonyProvider(ProviderConfig config);

  // connect + login. Safe to call again after a failure.
  bool initialize();

  // Strips spaces, dashes, dots and parentheses before dialling.
  CallResult make_call(const std::string& phone_number);
  CallResult end_call(const std::string& call_id);

  std::optional<CallRecord> call_status(const std::string& call_id) const;
  std::vector<CallRecord> list_active_calls() const;

  // One handler per lifecycle name; a second registration replaces the first.
  // Throws AmiError(InvalidArgument) for names outside lifecycle::.
  void register_call_callback(const std::string& lifecycle_name, EventHandler handler);

  void cleanup();
  bool is_available() const noexcept { return client_.is_authenticated(); }

  const ProviderConfig& config() const noexcept { return config_; }
  TelephonyClient& client() noexcept { return client_; }

  static std::string clean_number(const std::string& raw);

private:
  ProviderConfig config_;
  TelephonyClient client_;
};

}  // namespace amicall
