#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace mailsync::util {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Formats time point to ISO 8601 (YYYY-MM-DDTHH:MM:SSZ)
[[nodiscard]] inline auto format_iso8601(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return {};
  }
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}

// Formats time point for tables (YYYY-MM-DD HH:MM)
[[nodiscard]] inline auto format_local_timestamp(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return "-";
  }
  return std::format("{:%Y-%m-%d %H:%M}",
                     std::chrono::floor<std::chrono::minutes>(tp));
}

[[nodiscard]] inline auto to_unix_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t millis) -> TimePoint {
  if (millis <= 0) {
    return {};
  }
  return TimePoint{std::chrono::milliseconds{millis}};
}

// "3m 12s", "45s", "2h 05m"
[[nodiscard]] inline auto format_duration(std::chrono::seconds d)
    -> std::string {
  auto s = d.count();
  if (s < 0) {
    s = 0;
  }
  if (s < 60) {
    return std::format("{}s", s);
  }
  if (s < 3600) {
    return std::format("{}m {:02}s", s / 60, s % 60);
  }
  return std::format("{}h {:02}m", s / 3600, (s % 3600) / 60);
}

} // namespace mailsync::util
