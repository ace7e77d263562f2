// include/amicall/config.hpp
// Connection credentials, client tuning and provider defaults.

#pragma once

#include "amicall/error.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace amicall {

class Credentials {
public:
  Credentials(std::string host, int port, std::string username, std::string secret)
      : host_(std::move(host)), port_(port),
        username_(std::move(username)), secret_(std::move(secret)) {}

  const std::string& host() const noexcept { return host_; }
  int port() const noexcept { return port_; }
  const std::string& username() const noexcept { return username_; }
  const std::string& secret() const noexcept { return secret_; }

private:
  std::string host_;
  int port_;
  std::string username_;
  std::string secret_;
};

struct ClientOptions {
  using ErrorCallback = std::function<void(const AmiError&)>;

  std::chrono::milliseconds connect_timeout{10000};
  // Reader wakes at least this often to check for shutdown.
  std::chrono::milliseconds read_timeout{500};
  std::chrono::milliseconds action_timeout{5000};

  // Errors handled inside the client (decode failures, lost connection) are
  // reported here in addition to the log. Called on the reader thread.
  ErrorCallback on_error;
};

struct ProviderConfig {
  std::string ami_host = "127.0.0.1";
  int ami_port = 5038;
  std::string ami_user = "admin";
  std::string ami_secret = "secret";

  // Originate defaults
  std::string channel_tech = "SIP";
  std::string context = "outbound";
  std::string extension = "s";
  std::string caller_id = "AI Agent <1000>";

  ClientOptions client;

  Credentials credentials() const {
    return Credentials(ami_host, ami_port, ami_user, ami_secret);
  }

  // CLI: host port user secret, then AMI_* environment overrides.
  // Throws AmiError(InvalidArgument) on a non-numeric port or timeout.
  static ProviderConfig from_args_and_env(int argc, const char* const* argv);
  static ProviderConfig from_env() { return from_args_and_env(0, nullptr); }
};

}  // namespace amicall
