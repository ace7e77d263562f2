// src/log.cpp

#include "amicall/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace amicall {

std::shared_ptr<spdlog::logger> logger() {
  static std::mutex mu;
  std::lock_guard<std::mutex> lk(mu);
  auto lg = spdlog::get(kLoggerName);
  if (!lg) {
    lg = spdlog::stderr_color_mt(kLoggerName);
  }
  return lg;
}

}  // namespace amicall
