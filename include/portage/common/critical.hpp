#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace portage::common {

/// Fail-stop for faults the node cannot recover from (storage corruption,
/// impossible codec failures). Flushes logs before terminating.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace portage::common
