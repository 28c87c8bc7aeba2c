#pragma once

#include "ferry/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace ferry {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// UTC, millisecond precision: 2026-10-17T09:30:00.000Z
[[nodiscard]] auto to_iso8601(TimePoint tp) -> std::string;

// Accepts YYYY-MM-DDTHH:MM:SS with an optional fraction and an optional
// zone (Z, +HH:MM, -HH:MM, +HHMM). A space may replace the 'T'. No zone
// means UTC.
[[nodiscard]] auto parse_iso8601(std::string_view text) -> Result<TimePoint>;

// Local wall-clock time for tables: 2026-10-17 11:30:00
[[nodiscard]] auto format_local(TimePoint tp) -> std::string;

[[nodiscard]] inline auto to_epoch_ms(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_epoch_ms(std::int64_t ms) -> TimePoint {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(
      std::chrono::milliseconds(ms)));
}

// Persisted timestamps carry milliseconds; truncating in-memory values the
// same way keeps save/load round trips exact.
[[nodiscard]] inline auto truncate_ms(TimePoint tp) -> TimePoint {
  return std::chrono::time_point_cast<Clock::duration>(
      std::chrono::floor<std::chrono::milliseconds>(tp));
}

}  // namespace ferry
