#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace cadence {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  // RFC 4122 version 4, variant 1
  a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL);
}

[[nodiscard]] inline auto to_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_millis(std::int64_t ms) -> TimePoint {
  return TimePoint(std::chrono::milliseconds(ms));
}

// Millisecond-precision UTC timestamp, e.g. 2026-10-18T09:30:00.125Z
[[nodiscard]] auto format_iso8601(TimePoint tp) -> std::string;

// Accepts YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM); a date alone means
// midnight UTC.
[[nodiscard]] auto parse_iso8601(std::string_view text)
    -> std::optional<TimePoint>;

[[nodiscard]] inline auto truncate(std::string_view text, std::size_t max_len)
    -> std::string_view {
  return text.size() > max_len ? text.substr(0, max_len) : text;
}

}  // namespace cadence
