// include/amicall/log.hpp
// Library logger. Applications may register their own spdlog logger named
// "amicall" before first use to redirect library output.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace amicall {

constexpr const char* kLoggerName = "amicall";

std::shared_ptr<spdlog::logger> logger();

}  // namespace amicall
