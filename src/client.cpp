// src/client.cpp

#include "amicall/client.hpp"
#include "amicall/codec.hpp"
#include "amicall/log.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>

namespace amicall {

const char* to_string(ConnectionState state) noexcept {
  switch (state) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connected: return "connected";
    case ConnectionState::Authenticated: return "authenticated";
  }
  return "unknown";
}

// Set on a reader thread to the client that owns it.
static thread_local const TelephonyClient* t_reader_owner = nullptr;

static inline bool has_line_break(const std::string& s) {
  return s.find_first_of("\r\n") != std::string::npos;
}

bool is_valid_phone_number(const std::string& number) {
  std::string digits = number;
  if (!digits.empty() && digits.front() == '+') digits.erase(0, 1);
  if (digits.size() < 2 || digits.size() > 15) return false;
  return std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

TelephonyClient::TelephonyClient(Credentials credentials, ClientOptions options)
    : credentials_(std::move(credentials)), options_(std::move(options)) {}

TelephonyClient::~TelephonyClient() {
  disconnect();
}

std::optional<AmiError> TelephonyClient::last_error() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_error_;
}

Credentials TelephonyClient::credentials() const {
  std::lock_guard<std::mutex> lk(mu_);
  return credentials_;
}

void TelephonyClient::set_last_error(const AmiError& err) {
  std::lock_guard<std::mutex> lk(mu_);
  last_error_ = err;
}

void TelephonyClient::report(const AmiError& err) {
  set_last_error(err);
  if (options_.on_error) {
    try {
      options_.on_error(err);
    } catch (const std::exception& ex) {
      logger()->error("on_error hook threw: {}", ex.what());
    }
  }
}

bool TelephonyClient::on_reader_thread() const noexcept {
  return t_reader_owner == this;
}

void TelephonyClient::enter_reader_thread() noexcept {
  t_reader_owner = this;
}

void TelephonyClient::teardown() {
  // Reader first: it holds references to the connection and correlator.
  if (reader_) reader_->stop();
  if (conn_) conn_->close();
  if (correlator_) correlator_->fail_all(AmiError::connection_lost("client disconnected"));
}

bool TelephonyClient::connect() {
  if (on_reader_thread()) {
    // Reconnecting from inside a callback would destroy the running reader.
    set_last_error(AmiError::connection("connect() called from an event callback"));
    return false;
  }
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  if (state_.load() != ConnectionState::Disconnected) return true;

  const Credentials creds = credentials();
  reader_.reset();
  correlator_.reset();
  conn_.reset();

  conn_ = std::make_unique<Connection>(creds.host(), creds.port(), options_.connect_timeout,
                                       options_.read_timeout);
  Connection* conn = conn_.get();
  correlator_ = std::make_unique<ActionCorrelator>(
      [conn](const std::string& bytes) { conn->send(bytes); });
  ActionCorrelator* correlator = correlator_.get();

  reader_ = std::make_unique<ReaderLoop>(
      *conn,
      [this, correlator](const Message& m) {
        enter_reader_thread();
        correlator->resolve(m);
      },
      [this](const Message& m) {
        enter_reader_thread();
        dispatcher_.handle(m);
      },
      [this](const std::string& reason) {
        enter_reader_thread();
        on_reader_exit(reason);
      },
      [this](const std::string& what) {
        enter_reader_thread();
        logger()->error("decode error: {}", what);
        report(AmiError::decode(what));
      });

  logger()->info("connecting to AMI at {}:{}", creds.host(), creds.port());
  try {
    conn_->open();
  } catch (const AmiError& ex) {
    logger()->error("{}", ex.what());
    set_last_error(ex);
    return false;
  }

  closing_.store(false);
  state_.store(ConnectionState::Connected);
  reader_->start();
  return true;
}

void TelephonyClient::on_reader_exit(const std::string& reason) {
  state_.store(ConnectionState::Disconnected);
  AmiError err = AmiError::connection_lost(reason);
  if (correlator_) correlator_->fail_all(err);
  if (!closing_.load()) {
    logger()->error("{}", err.what());
    report(err);
  }
}

void TelephonyClient::check_can_send(const std::string& name) const {
  ConnectionState st = state_.load();
  if (st == ConnectionState::Disconnected || !correlator_) {
    throw AmiError::connection_lost("not connected");
  }
  if (st != ConnectionState::Authenticated && name != "Login" && name != "Logoff") {
    throw AmiError::not_authenticated();
  }
}

Message TelephonyClient::send_checked(Message action, uint64_t action_id) {
  const std::string name = action.get("Action");
  check_can_send(name);
  // Only the reader thread could deliver the response.
  if (on_reader_thread()) throw AmiError::callback_reentry(name);
  return correlator_->send(std::move(action), options_.action_timeout, action_id);
}

void TelephonyClient::post_checked(Message action, uint64_t action_id,
                                   ActionCorrelator::ResponseHandler on_response) {
  check_can_send(action.get("Action"));
  correlator_->post(std::move(action), action_id, std::move(on_response));
}

Message TelephonyClient::send_action(Message action) {
  return send_checked(std::move(action));
}

bool TelephonyClient::login(const Credentials& credentials) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    credentials_ = credentials;
  }
  return login();
}

bool TelephonyClient::login() {
  ConnectionState st = state_.load();
  if (st == ConnectionState::Authenticated) return true;
  if (st == ConnectionState::Disconnected) {
    set_last_error(AmiError::connection("login attempted while disconnected"));
    return false;
  }

  const Credentials creds = credentials();
  Message action = Message::action("Login");
  action.add("Username", creds.username());
  action.add("Secret", creds.secret());
  action.add("Events", "on");

  try {
    Message resp = send_checked(std::move(action));
    if (resp.is_success()) {
      state_.store(ConnectionState::Authenticated);
      logger()->info("AMI login success as '{}'", creds.username());
      return true;
    }
    std::string reason = resp.get("Message").empty() ? "rejected" : resp.get("Message");
    AmiError err = AmiError::authentication(reason);
    logger()->error("{}", err.what());
    set_last_error(err);
    return false;
  } catch (const AmiError& ex) {
    logger()->error("AMI login failed: {}", ex.what());
    set_last_error(ex);
    return false;
  }
}

CallResult TelephonyClient::originate_call(const std::string& phone_number,
                                           const std::string& channel_tech,
                                           const std::string& context,
                                           const std::string& extension,
                                           const std::optional<std::string>& caller_id) {
  if (!is_authenticated()) {
    return CallResult::failure(ErrorKind::NotAuthenticated, "not authenticated");
  }
  if (!is_valid_phone_number(phone_number)) {
    return CallResult::failure(ErrorKind::InvalidArgument,
                               "invalid phone number '" + phone_number + "'");
  }
  if (has_line_break(channel_tech) || has_line_break(context) || has_line_break(extension) ||
      (caller_id && has_line_break(*caller_id))) {
    return CallResult::failure(ErrorKind::InvalidArgument,
                               "originate arguments must not contain line breaks");
  }

  const uint64_t action_id = ActionCorrelator::next_action_id();
  const std::string call_id =
      "call_" + std::to_string(std::time(nullptr)) + "_" + std::to_string(action_id);
  const std::string channel = channel_tech + "/" + phone_number;

  // Reserved before the write so events racing the response are kept.
  CallRecord rec;
  rec.call_id = call_id;
  rec.channel = channel;
  rec.phone_number = phone_number;
  rec.status = CallStatus::Originating;
  rec.originate_action_id = action_id;
  rec.start_time = WallClock::now();
  tracker_.reserve(rec);

  Message action = Message::action("Originate");
  action.add("Channel", channel);
  action.add("Context", context);
  action.add("Exten", extension);
  action.add("Priority", "1");
  action.add("Variable", "CALL_ID=" + call_id);
  action.add("Async", "true");
  if (caller_id && !caller_id->empty()) action.add("CallerID", *caller_id);

  try {
    if (on_reader_thread()) {
      tracker_.commit(call_id);
      post_checked(std::move(action), action_id, [this, call_id](const Message& resp) {
        if (!resp.is_success()) tracker_.discard(call_id);
      });
      logger()->info("originate to {} on {} sent from a callback, call_id: {}", phone_number,
                     channel, call_id);
      return CallResult::ok(call_id, "originate sent");
    }
    Message resp = send_checked(std::move(action), action_id);
    if (!resp.is_success()) {
      tracker_.discard(call_id);
      std::string msg = resp.get("Message").empty() ? "originate rejected" : resp.get("Message");
      logger()->error("failed to originate call to {}: {}", phone_number, msg);
      set_last_error(AmiError::action_failed(msg));
      return CallResult::failure(ErrorKind::ActionFailed, msg);
    }
  } catch (const AmiError& ex) {
    tracker_.discard(call_id);
    logger()->error("failed to originate call to {}: {}", phone_number, ex.what());
    set_last_error(ex);
    std::string msg = ex.what();
    if (ex.kind() == ErrorKind::ActionTimeout) msg += " (outcome unknown)";
    return CallResult::failure(ex.kind(), msg);
  }

  tracker_.commit(call_id);
  logger()->info("originated call to {} on {}, call_id: {}", phone_number, channel, call_id);
  return CallResult::ok(call_id, "call originated");
}

CallResult TelephonyClient::hangup_call(const std::string& call_id) {
  auto rec = tracker_.find(call_id);
  if (!rec) {
    logger()->warn("hangup requested for unknown call {}", call_id);
    AmiError err = AmiError::unknown_call(call_id);
    set_last_error(err);
    return CallResult::failure(ErrorKind::UnknownCallError, err.what(), call_id);
  }

  Message action = Message::action("Hangup");
  action.add("Channel", rec->channel);
  try {
    if (on_reader_thread()) {
      post_checked(std::move(action));
      logger()->info("hangup sent from a callback for call {} ({})", call_id, rec->channel);
      return CallResult::ok(call_id, "hangup sent");
    }
    Message resp = send_checked(std::move(action));
    if (!resp.is_success()) {
      std::string msg = resp.get("Message").empty() ? "hangup rejected" : resp.get("Message");
      logger()->error("failed to hang up call {}: {}", call_id, msg);
      set_last_error(AmiError::action_failed(msg));
      return CallResult::failure(ErrorKind::ActionFailed, msg, call_id);
    }
  } catch (const AmiError& ex) {
    logger()->error("failed to hang up call {}: {}", call_id, ex.what());
    set_last_error(ex);
    return CallResult::failure(ex.kind(), ex.what(), call_id);
  }

  logger()->info("hangup requested for call {} ({})", call_id, rec->channel);
  return CallResult::ok(call_id, "hangup requested");
}

std::optional<CallRecord> TelephonyClient::call_status(const std::string& call_id) const {
  return tracker_.find(call_id);
}

std::vector<CallRecord> TelephonyClient::list_active_calls() const {
  return tracker_.active();
}

std::vector<CallRecord> TelephonyClient::list_calls() const {
  return tracker_.all();
}

bool TelephonyClient::purge_call(const std::string& call_id) {
  return tracker_.purge(call_id);
}

size_t TelephonyClient::purge_finished_calls() {
  return tracker_.purge_finished();
}

void TelephonyClient::register_callback(const std::string& event_type, EventHandler handler) {
  callbacks_.add(event_type, std::move(handler));
}

void TelephonyClient::replace_callback(const std::string& event_type, EventHandler handler) {
  callbacks_.replace(event_type, std::move(handler));
}

void TelephonyClient::disconnect() {
  const bool from_callback = on_reader_thread();
  std::unique_lock<std::mutex> lk(lifecycle_mu_, std::defer_lock);
  if (from_callback) {
    // The lock holder may be joining this thread; it finishes the teardown.
    if (!lk.try_lock()) {
      closing_.store(true);
      logger()->debug("disconnect from callback skipped, teardown in progress");
      return;
    }
  } else {
    lk.lock();
  }
  if (!conn_) return;

  closing_.store(true);
  if (state_.load() == ConnectionState::Authenticated) {
    try {
      if (from_callback) {
        post_checked(Message::action("Logoff"));
      } else {
        send_checked(Message::action("Logoff"));
      }
    } catch (const AmiError& ex) {
      logger()->debug("logoff ignored: {}", ex.what());
    }
  }

  teardown();
  tracker_.clear();
  if (state_.exchange(ConnectionState::Disconnected) != ConnectionState::Disconnected) {
    logger()->info("disconnected from AMI");
  }
}

}  // namespace amicall
