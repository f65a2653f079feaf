#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace flowforge::util {

// ISO 8601 UTC with milliseconds; empty for an unset time point.
[[nodiscard]] inline auto
format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
  if (tp == std::chrono::system_clock::time_point{}) {
    return {};
  }
  auto const ms_tp = std::chrono::floor<std::chrono::milliseconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}", ms_tp);
}

[[nodiscard]] inline auto
to_unix_millis(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Elapsed wall time between two points, "-" unless both are set.
[[nodiscard]] inline auto
format_elapsed(std::chrono::system_clock::time_point from,
               std::chrono::system_clock::time_point to) -> std::string {
  if (from == std::chrono::system_clock::time_point{} ||
      to == std::chrono::system_clock::time_point{} || to < from) {
    return "-";
  }
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(to - from);
  if (ms.count() < 1000) {
    return std::format("{}ms", ms.count());
  }
  return std::format("{:.1f}s", static_cast<double>(ms.count()) / 1000.0);
}

} // namespace flowforge::util
