#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace devtasks::util {

using Clock = std::chrono::steady_clock;

[[nodiscard]] inline auto to_millis(Clock::duration d) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

[[nodiscard]] inline auto to_seconds(Clock::duration d) -> double {
  return std::chrono::duration<double>(d).count();
}

// "850ms" below one second, "1.23s" above.
[[nodiscard]] inline auto format_duration(Clock::duration d) -> std::string {
  auto ms = to_millis(d);
  if (ms < 1000) {
    return std::format("{}ms", ms);
  }
  return std::format("{:.2f}s", to_seconds(d));
}

// Converts time_point to Unix epoch milliseconds.
[[nodiscard]] inline auto
to_unix_millis(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

} // namespace devtasks::util
