// include/amicall/client.hpp
// TelephonyClient: one AMI session. Originates and hangs up calls, and keeps a
// live view of every call it started.
//
// Typical use:
//   amicall::TelephonyClient client(amicall::Credentials("pbx", 5038, "user", "pw"));
//   if (client.connect() && client.login()) {
//     auto r = client.originate_call("+15551234", "PJSIP", "outbound", "s");
//     ...
//     client.disconnect();
//   }
//
// Callbacks run on the client's reader thread, the only thread that delivers
// responses. From there hangup_call, originate_call and disconnect write their
// action and return without waiting; send_action and login throw or fail with
// CallbackReentry, and connect fails. The client must not be destroyed from
// its own callback.

#pragma once

#include "amicall/action_correlator.hpp"
#include "amicall/call_tracker.hpp"
#include "amicall/config.hpp"
#include "amicall/connection.hpp"
#include "amicall/error.hpp"
#include "amicall/event_dispatcher.hpp"
#include "amicall/message.hpp"
#include "amicall/reader_loop.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace amicall {

enum class ConnectionState { Disconnected, Connected, Authenticated };

const char* to_string(ConnectionState state) noexcept;

// Outcome of originate_call / hangup_call. Expected failures (not logged in,
// timeout, PBX said no) come back here instead of as exceptions.
struct CallResult {
  bool success = false;
  std::string call_id;
  std::optional<ErrorKind> error;
  std::string message;

  explicit operator bool() const noexcept { return success; }

  static CallResult ok(std::string call_id, std::string message = "") {
    CallResult r;
    r.success = true;
    r.call_id = std::move(call_id);
    r.message = std::move(message);
    return r;
  }
  static CallResult failure(ErrorKind kind, std::string message, std::string call_id = "") {
    CallResult r;
    r.error = kind;
    r.message = std::move(message);
    r.call_id = std::move(call_id);
    return r;
  }
};

// Optional leading '+', then 2 to 15 digits.
bool is_valid_phone_number(const std::string& number);

class TelephonyClient {
public:
  explicit TelephonyClient(Credentials credentials, ClientOptions options = ClientOptions());
  ~TelephonyClient();

  TelephonyClient(const TelephonyClient&) = delete;
  TelephonyClient& operator=(const TelephonyClient&) = delete;

  // Opens the socket and starts the reader. Failure reason in last_error().
  bool connect();

  // Sends Login. On rejection the state stays Connected and last_error()
  // carries the server's Message.
  bool login();
  bool login(const Credentials& credentials);

  // Returns as soon as the PBX accepted the Originate; progress arrives as
  // events. The call is dialled on "<channel_tech>/<phone_number>". Text
  // arguments must not contain CR or LF (InvalidArgument). From a callback the
  // record is created at once and dropped again if the PBX rejects the action.
  CallResult originate_call(const std::string& phone_number, const std::string& channel_tech,
                            const std::string& context, const std::string& extension,
                            const std::optional<std::string>& caller_id = std::nullopt);

  // Asks the PBX to hang up the call's channel. The record changes only when
  // the resulting Hangup event arrives.
  CallResult hangup_call(const std::string& call_id);

  std::optional<CallRecord> call_status(const std::string& call_id) const;
  std::vector<CallRecord> list_active_calls() const;
  std::vector<CallRecord> list_calls() const;
  bool purge_call(const std::string& call_id);
  size_t purge_finished_calls();

  // event_type is an AMI event name or one of the lifecycle:: names.
  void register_callback(const std::string& event_type, EventHandler handler);
  void replace_callback(const std::string& event_type, EventHandler handler);

  // Best-effort Logoff, then stop the reader, close, and forget all calls.
  // From a callback while another thread is already disconnecting, returns at
  // once and leaves the teardown to that thread.
  void disconnect();

  // Raw action round trip. Requires Authenticated (Login and Logoff aside).
  // Throws AmiError, CallbackReentry when called from a callback.
  Message send_action(Message action);

  ConnectionState state() const noexcept { return state_.load(); }
  bool is_connected() const noexcept { return state() != ConnectionState::Disconnected; }
  bool is_authenticated() const noexcept { return state() == ConnectionState::Authenticated; }

  std::optional<AmiError> last_error() const;
  Credentials credentials() const;
  const ClientOptions& options() const noexcept { return options_; }

private:
  // Throws AmiError unless the state allows sending action_name.
  void check_can_send(const std::string& action_name) const;
  // State check plus correlated send. Throws AmiError.
  Message send_checked(Message action, uint64_t action_id = 0);
  // State check plus write without waiting. Throws AmiError.
  void post_checked(Message action, uint64_t action_id = 0,
                    ActionCorrelator::ResponseHandler on_response = nullptr);
  // True on this client's reader thread, i.e. inside one of its callbacks.
  bool on_reader_thread() const noexcept;
  void enter_reader_thread() noexcept;
  void on_reader_exit(const std::string& reason);
  void report(const AmiError& err);
  void set_last_error(const AmiError& err);
  void teardown();

  mutable std::mutex mu_;  // credentials_, last_error_
  Credentials credentials_;
  std::optional<AmiError> last_error_;
  ClientOptions options_;

  std::mutex lifecycle_mu_;  // connect / disconnect
  std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
  std::atomic<bool> closing_{false};

  CallTracker tracker_;
  CallbackRegistry callbacks_;
  EventDispatcher dispatcher_{tracker_, callbacks_};

  // Declaration order matters: the reader references the connection.
  std::unique_ptr<Connection> conn_;
  std::unique_ptr<ActionCorrelator> correlator_;
  std::unique_ptr<ReaderLoop> reader_;
};

}  // namespace amicall
