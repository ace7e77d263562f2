// include/amicall/error.hpp
// Error taxonomy for the AMI client: one exception type tagged with a kind.

#pragma once

#include <stdexcept>
#include <string>

namespace amicall {

enum class ErrorKind {
  ConnectionError,      // socket could not be established
  ConnectionLost,       // peer closed or read failed while actions were pending
  AuthenticationError,  // Login rejected
  ActionTimeout,        // no matching response in time, outcome unknown
  ActionFailed,         // PBX answered Response: Error
  ProtocolDecodeError,  // malformed block, logged and skipped
  UnknownCallError,     // callID not in the tracker
  InvalidArgument,      // bad phone number, bad config value
  NotAuthenticated,     // action attempted before login
  CallbackReentry       // blocking call made from an event callback
};

const char* to_string(ErrorKind kind) noexcept;

class AmiError : public std::runtime_error {
public:
  AmiError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

  static AmiError connection(const std::string& msg) {
    return AmiError(ErrorKind::ConnectionError, "connection error: " + msg);
  }
  static AmiError connection_lost(const std::string& msg) {
    return AmiError(ErrorKind::ConnectionLost, "connection lost: " + msg);
  }
  static AmiError authentication(const std::string& msg) {
    return AmiError(ErrorKind::AuthenticationError, "authentication failed: " + msg);
  }
  static AmiError timeout(const std::string& action, unsigned long long action_id) {
    return AmiError(ErrorKind::ActionTimeout,
                    "timeout waiting for response to " + action + " (ActionID " +
                        std::to_string(action_id) + ")");
  }
  static AmiError action_failed(const std::string& msg) {
    return AmiError(ErrorKind::ActionFailed, "action failed: " + msg);
  }
  static AmiError decode(const std::string& msg) {
    return AmiError(ErrorKind::ProtocolDecodeError, "decode error: " + msg);
  }
  static AmiError unknown_call(const std::string& call_id) {
    return AmiError(ErrorKind::UnknownCallError, "unknown call: " + call_id);
  }
  static AmiError invalid_argument(const std::string& msg) {
    return AmiError(ErrorKind::InvalidArgument, "invalid argument: " + msg);
  }
  static AmiError callback_reentry(const std::string& action) {
    return AmiError(ErrorKind::CallbackReentry,
                    action + " needs a response and cannot wait for it inside an event callback");
  }
  static AmiError not_authenticated() {
    return AmiError(ErrorKind::NotAuthenticated, "client is not authenticated");
  }

private:
  ErrorKind kind_;
};

}  // namespace amicall
