// src/config.cpp

#include "amicall/config.hpp"

#include <cstdlib>

namespace amicall {

static int parse_int(const std::string& name, const std::string& value) {
  size_t used = 0;
  int out = 0;
  try {
    out = std::stoi(value, &used);
  } catch (const std::exception&) {
    throw AmiError::invalid_argument(name + " is not a number: '" + value + "'");
  }
  if (used != value.size() || out < 0) {
    throw AmiError::invalid_argument(name + " is not a valid value: '" + value + "'");
  }
  return out;
}

ProviderConfig ProviderConfig::from_args_and_env(int argc, const char* const* argv) {
  ProviderConfig cfg;

  // CLI: host port user secret
  if (argc >= 3) { cfg.ami_host = argv[1]; cfg.ami_port = parse_int("port", argv[2]); }
  if (argc >= 4) cfg.ami_user = argv[3];
  if (argc >= 5) cfg.ami_secret = argv[4];

  auto getenv_s = [](const char* k) -> std::string {
    const char* v = std::getenv(k);
    return v ? std::string(v) : "";
  };

  if (!getenv_s("AMI_HOST").empty()) cfg.ami_host = getenv_s("AMI_HOST");
  if (!getenv_s("AMI_PORT").empty()) cfg.ami_port = parse_int("AMI_PORT", getenv_s("AMI_PORT"));
  if (!getenv_s("AMI_USER").empty()) cfg.ami_user = getenv_s("AMI_USER");
  if (!getenv_s("AMI_SECRET").empty()) cfg.ami_secret = getenv_s("AMI_SECRET");

  if (!getenv_s("AMI_CHANNEL_TECH").empty()) cfg.channel_tech = getenv_s("AMI_CHANNEL_TECH");
  if (!getenv_s("AMI_CONTEXT").empty()) cfg.context = getenv_s("AMI_CONTEXT");
  if (!getenv_s("AMI_EXTEN").empty()) cfg.extension = getenv_s("AMI_EXTEN");
  if (!getenv_s("AMI_CALLER_ID").empty()) cfg.caller_id = getenv_s("AMI_CALLER_ID");
  if (!getenv_s("AMI_ACTION_TIMEOUT_MS").empty()) {
    cfg.client.action_timeout = std::chrono::milliseconds(
        parse_int("AMI_ACTION_TIMEOUT_MS", getenv_s("AMI_ACTION_TIMEOUT_MS")));
  }

  if (cfg.ami_port == 0 || cfg.ami_port > 65535) {
    throw AmiError::invalid_argument("port out of range: " + std::to_string(cfg.ami_port));
  }
  return cfg;
}

}  // namespace amicall
