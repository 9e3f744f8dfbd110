#pragma once

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <string_view>
#include <system_error>
#include <utility>

namespace rangeserve {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("bind failed for port {}", port);
template <typename... Args>
[[noreturn]] void throw_errno(std::string_view fmtStr, Args&&... args) {
  const int savedErr = errno;
  std::error_code ec(savedErr, std::generic_category());
  throw std::system_error(ec, fmt::vformat(fmtStr, fmt::make_format_args(args...)));
}

}  // namespace rangeserve
