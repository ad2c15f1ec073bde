#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace auditchain::common {

/// Unrecoverable fault. Flushes every sink before the process goes down so
/// the last log line names the cause.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("Fatal: {}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename Arg, typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  critical(fmt::format(format, std::forward<Arg>(arg),
                       std::forward<Args>(args)...));
}

}  // namespace auditchain::common
