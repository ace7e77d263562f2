// include/amicall/reader_loop.hpp
// Background thread that turns the byte stream into responses and events.

#pragma once

#include "amicall/connection.hpp"
#include "amicall/message.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace amicall {

class ReaderLoop {
public:
  using MessageSink = std::function<void(const Message&)>;
  // Called once, on the reader thread, when the peer goes away. The
  // connection is already closed. Not called after stop().
  using ExitHandler = std::function<void(const std::string& reason)>;
  // Undecodable input that had to be thrown away, once per dropped block.
  using DecodeErrorHandler = std::function<void(const std::string& what)>;

  ReaderLoop(Connection& conn, MessageSink on_response, MessageSink on_event,
             ExitHandler on_exit, DecodeErrorHandler on_decode_error = nullptr);
  // Joins the thread. Must not run on the reader thread (from a sink): that
  // terminates the process.
  ~ReaderLoop();

  ReaderLoop(const ReaderLoop&) = delete;
  ReaderLoop& operator=(const ReaderLoop&) = delete;

  void start();
  // Waits for the thread unless called from it (a callback shutting the
  // client down); then it only flags the loop to exit.
  void stop();

  bool running() const noexcept { return running_.load(); }

  // A block larger than this without a terminator is dropped.
  static constexpr size_t kMaxBuffered = 1 << 20;

private:
  void run();
  void route(const Message& msg);

  Connection& conn_;
  MessageSink on_response_;
  MessageSink on_event_;
  ExitHandler on_exit_;
  DecodeErrorHandler on_decode_error_;

  std::thread thread_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> running_{false};
  std::string buffer_;
};

}  // namespace amicall
