#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace crowd_ews::core {

// Representable range: 0001-01-01T00:00:00.000Z through 9999-12-31T23:59:59.999Z.
inline constexpr std::int64_t kMinTimestampMs = -62'135'596'800'000LL;
inline constexpr std::int64_t kMaxTimestampMs = 253'402'300'799'999LL;

inline constexpr bool timestamp_in_range(const std::int64_t unix_ms) noexcept {
  return unix_ms >= kMinTimestampMs && unix_ms <= kMaxTimestampMs;
}

inline std::int64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

// Accepts "YYYY-MM-DDTHH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]" ('T' or ' ' as separator).
// A missing zone designator is read as UTC.
std::optional<std::int64_t> parse_iso8601_ms(std::string_view text);

// Formats as "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string format_iso8601_ms(std::int64_t unix_ms);

// Minute of the local day [0, 1440) for a fixed UTC offset.
std::uint32_t minute_of_day(std::int64_t unix_ms, std::int32_t utc_offset_minutes) noexcept;

}  // namespace crowd_ews::core
