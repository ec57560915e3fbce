#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace sovereign::common {

/// Log, flush and terminate. Reserved for faults the process cannot recover
/// from (storage corruption, broken startup configuration).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace sovereign::common
