// src/reader_loop.cpp

#include "amicall/reader_loop.hpp"
#include "amicall/codec.hpp"
#include "amicall/log.hpp"

#include <exception>
#include <string>

namespace amicall {

ReaderLoop::ReaderLoop(Connection& conn, MessageSink on_response, MessageSink on_event,
                       ExitHandler on_exit, DecodeErrorHandler on_decode_error)
    : conn_(conn),
      on_response_(std::move(on_response)),
      on_event_(std::move(on_event)),
      on_exit_(std::move(on_exit)),
      on_decode_error_(std::move(on_decode_error)) {}

ReaderLoop::~ReaderLoop() {
  stop();
  if (thread_.joinable()) {
    // Only reachable from the reader thread itself: a callback destroyed the
    // loop that is running it. Nothing can be joined and the thread still
    // uses this object.
    logger()->critical("reader loop destroyed from its own thread");
    logger()->flush();
    std::terminate();
  }
}

void ReaderLoop::start() {
  if (thread_.joinable()) return;
  stop_.store(false);
  running_.store(true);
  thread_ = std::thread([this]() { run(); });
}

void ReaderLoop::stop() {
  stop_.store(true);
  if (!thread_.joinable()) return;
  if (thread_.get_id() == std::this_thread::get_id()) return;
  thread_.join();
}

void ReaderLoop::route(const Message& msg) {
  try {
    switch (msg.kind()) {
      case MessageKind::Response:
        on_response_(msg);
        break;
      case MessageKind::Event:
        on_event_(msg);
        break;
      case MessageKind::Action:
        logger()->warn("server sent an Action block, ignored: {}", msg.summary());
        break;
    }
  } catch (const std::exception& ex) {
    logger()->error("dispatch failed for [{}]: {}", msg.summary(), ex.what());
  }
}

void ReaderLoop::run() {
  logger()->debug("reader started");
  std::string reason;
  bool lost = false;

  while (!stop_.load()) {
    auto status = conn_.receive(buffer_);
    if (status == Connection::ReadStatus::Timeout) continue;
    if (status == Connection::ReadStatus::Closed) {
      reason = conn_.close_reason();
      lost = true;
      break;
    }

    auto decoded = codec::decode(buffer_);
    buffer_ = std::move(decoded.remainder);
    if (on_decode_error_) {
      for (size_t i = 0; i < decoded.discarded; i++) {
        on_decode_error_("malformed block without Event, Response or Action field");
      }
    }
    if (buffer_.size() > kMaxBuffered) {
      std::string what = "dropped " + std::to_string(buffer_.size()) +
                         " bytes without a block terminator";
      logger()->error("{}", what);
      buffer_.clear();
      if (on_decode_error_) on_decode_error_(what);
    }

    for (const auto& msg : decoded.messages) route(msg);
  }

  if (lost) conn_.close();
  running_.store(false);
  if (lost && !stop_.load()) {
    logger()->warn("reader stopped: {}", reason);
    if (on_exit_) on_exit_(reason);
  } else {
    logger()->debug("reader stopped");
  }
}

}  // namespace amicall
