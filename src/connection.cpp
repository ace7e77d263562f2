// src/connection.cpp

#include "amicall/connection.hpp"
#include "amicall/error.hpp"
#include "amicall/log.hpp"

namespace amicall {

using boost::asio::ip::tcp;

Connection::Connection(std::string host, int port,
                       std::chrono::milliseconds connect_timeout,
                       std::chrono::milliseconds read_timeout)
    : host_(std::move(host)), port_(port),
      connect_timeout_(connect_timeout), read_timeout_(read_timeout),
      socket_(io_) {}

Connection::~Connection() {
  close();
}

bool Connection::run_with_timeout(std::chrono::milliseconds timeout, const bool& done) {
  io_.restart();
  io_.run_for(timeout);
  if (done) return true;

  // cancel() keeps the socket usable for the next read.
  boost::system::error_code ignored;
  socket_.cancel(ignored);
  io_.restart();
  io_.run();
  return false;
}

void Connection::open() {
  if (open_.load()) return;

  boost::system::error_code ec;
  tcp::resolver resolver(io_);
  auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
  if (ec) {
    throw AmiError::connection("resolve " + host_ + ": " + ec.message());
  }

  bool done = false;
  boost::system::error_code connect_ec;
  boost::asio::async_connect(socket_, endpoints,
                             [&](const boost::system::error_code& e, const tcp::endpoint&) {
                               connect_ec = e;
                               done = true;
                             });
  io_.restart();
  io_.run_for(connect_timeout_);
  if (!done) {
    // The composed connect only stops when the socket is closed.
    boost::system::error_code ignored;
    socket_.close(ignored);
    io_.restart();
    io_.run();
    throw AmiError::connection("connect to " + host_ + ":" + std::to_string(port_) +
                               " timed out");
  }
  if (connect_ec) {
    socket_.close(ec);
    throw AmiError::connection("connect to " + host_ + ":" + std::to_string(port_) + ": " +
                               connect_ec.message());
  }

  socket_.set_option(tcp::no_delay(true), ec);

  // Greeting: "Asterisk Call Manager/5.0.1\r\n"
  done = false;
  boost::system::error_code read_ec;
  size_t line_len = 0;
  boost::asio::async_read_until(socket_, boost::asio::dynamic_buffer(pending_), "\r\n",
                                [&](const boost::system::error_code& e, size_t n) {
                                  read_ec = e;
                                  line_len = n;
                                  done = true;
                                });
  bool in_time = run_with_timeout(connect_timeout_, done);
  if (!in_time || read_ec) {
    socket_.close(ec);
    throw AmiError::connection(in_time ? "reading greeting: " + read_ec.message()
                                       : std::string("no greeting from server"));
  }
  greeting_ = pending_.substr(0, line_len - 2);
  pending_.erase(0, line_len);

  open_.store(true);
  logger()->info("connected to {}:{} ({})", host_, port_, greeting_);
}

void Connection::close() noexcept {
  std::lock_guard<std::mutex> lk(write_mu_);
  if (!socket_.is_open()) {
    open_.store(false);
    return;
  }
  boost::system::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  if (open_.exchange(false)) {
    logger()->debug("connection to {}:{} closed", host_, port_);
  }
}

void Connection::send(const std::string& bytes) {
  if (!open_.load()) {
    throw AmiError::connection_lost("not connected");
  }
  std::lock_guard<std::mutex> lk(write_mu_);
  boost::system::error_code ec;
  boost::asio::write(socket_, boost::asio::buffer(bytes), ec);
  if (ec) {
    throw AmiError::connection_lost("write: " + ec.message());
  }
}

Connection::ReadStatus Connection::receive(std::string& out) {
  if (!pending_.empty()) {
    out.append(pending_);
    pending_.clear();
    return ReadStatus::Data;
  }
  if (!socket_.is_open()) {
    close_reason_ = "socket closed";
    return ReadStatus::Closed;
  }

  bool done = false;
  boost::system::error_code ec;
  size_t n = 0;
  socket_.async_read_some(boost::asio::buffer(read_buf_),
                          [&](const boost::system::error_code& e, size_t got) {
                            ec = e;
                            n = got;
                            done = true;
                          });
  run_with_timeout(read_timeout_, done);

  if (ec == boost::asio::error::operation_aborted) {
    return ReadStatus::Timeout;
  }
  if (ec) {
    close_reason_ = ec == boost::asio::error::eof ? "peer closed the connection" : ec.message();
    open_.store(false);
    return ReadStatus::Closed;
  }
  if (n == 0) {
    close_reason_ = "empty read";
    open_.store(false);
    return ReadStatus::Closed;
  }
  out.append(read_buf_.data(), n);
  return ReadStatus::Data;
}

}  // namespace amicall
