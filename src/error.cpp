// src/error.cpp

#include "amicall/error.hpp"

namespace amicall {

const char* to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::ConnectionError: return "ConnectionError";
    case ErrorKind::ConnectionLost: return "ConnectionLost";
    case ErrorKind::AuthenticationError: return "AuthenticationError";
    case ErrorKind::ActionTimeout: return "ActionTimeout";
    case ErrorKind::ActionFailed: return "ActionFailed";
    case ErrorKind::ProtocolDecodeError: return "ProtocolDecodeError";
    case ErrorKind::UnknownCallError: return "UnknownCallError";
    case ErrorKind::InvalidArgument: return "InvalidArgument";
    case ErrorKind::NotAuthenticated: return "NotAuthenticated";
    case ErrorKind::CallbackReentry: return "CallbackReentry";
  }
  return "Unknown";
}

}  // namespace amicall
