#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace uuidforge::util {

// Converts time_point to Unix epoch milliseconds.
[[nodiscard]] inline auto
to_unix_millis(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto now_unix_millis() -> std::int64_t {
  return to_unix_millis(std::chrono::system_clock::now());
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t millis)
    -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::time_point{
      std::chrono::milliseconds{millis}};
}

// Formats epoch milliseconds to ISO 8601 with millisecond precision
// (YYYY-MM-DDTHH:MM:SS.mmmZ).
[[nodiscard]] inline auto format_iso8601_millis(std::int64_t millis)
    -> std::string {
  const auto tp = std::chrono::floor<std::chrono::milliseconds>(
      from_unix_millis(millis));
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", tp);
}

} // namespace uuidforge::util
