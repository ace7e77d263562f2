// include/amicall/connection.hpp
// TCP link to the AMI port. Blocking API with bounded waits: each wait runs the
// connection's private io_context for at most the configured timeout.

#pragma once

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace amicall {

class Connection {
public:
  enum class ReadStatus { Data, Timeout, Closed };

  Connection(std::string host, int port,
             std::chrono::milliseconds connect_timeout,
             std::chrono::milliseconds read_timeout);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Connects and consumes the "Asterisk Call Manager/x.y" greeting line.
  // Throws AmiError(ConnectionError).
  void open();

  // Idempotent. Waits for an in-flight send(). Must not race receive(): call
  // it from the reading thread or after that thread has stopped.
  void close() noexcept;

  bool is_open() const noexcept { return open_.load(); }
  const std::string& greeting() const noexcept { return greeting_; }
  // Why the last receive() returned Closed.
  const std::string& close_reason() const noexcept { return close_reason_; }

  // Writes every byte. Safe from any thread. Throws AmiError(ConnectionLost).
  void send(const std::string& bytes);

  // Appends whatever arrives within the read timeout to out.
  // Only one thread may call this.
  ReadStatus receive(std::string& out);

private:
  // Runs the io_context until the outstanding operation finishes or timeout
  // passes. On timeout the operation is cancelled and drained; returns false.
  bool run_with_timeout(std::chrono::milliseconds timeout, const bool& done);

  std::string host_;
  int port_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds read_timeout_;

  boost::asio::io_context io_;
  boost::asio::ip::tcp::socket socket_;
  std::atomic<bool> open_{false};
  std::mutex write_mu_;

  std::string greeting_;
  std::string pending_;  // bytes read past the greeting
  std::string close_reason_;
  std::array<char, 4096> read_buf_{};
};

}  // namespace amicall
