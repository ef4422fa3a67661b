#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace batchstake::common {

/// Report a broken invariant and bring the process down.
///
/// Reserved for states that indicate a defect elsewhere in the system
/// (counter exhaustion, storage failure, corrupt persisted values). User
/// errors are reported through result codes instead.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace batchstake::common
