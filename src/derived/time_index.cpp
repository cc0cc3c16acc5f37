#include "derived/time_index.hpp"

#include <algorithm>
#include <utility>

#include "core/math.hpp"
#include "core/timestamp.hpp"

namespace crowd_ews::derived {
namespace {

constexpr std::uint32_t kMinutesPerDay = 1440;

bool inside(const core::PeakWindow& window, const std::uint32_t minute) {
  if (window.start_minute < window.end_minute) {
    return minute >= window.start_minute && minute < window.end_minute;
  }
  return minute >= window.start_minute || minute < window.end_minute;
}

std::uint32_t circular_distance(const std::uint32_t a, const std::uint32_t b) {
  const std::uint32_t forward = a > b ? a - b : b - a;
  return std::min(forward, kMinutesPerDay - forward);
}

}  // namespace

TimeIndex::TimeIndex(core::TimeConfig config) : config_(std::move(config)) {}

float TimeIndex::at(const std::int64_t unix_ms) const noexcept {
  return at_minute(core::minute_of_day(unix_ms, config_.utc_offset_minutes));
}

float TimeIndex::at_minute(const std::uint32_t minute_of_day) const noexcept {
  const std::uint32_t minute = minute_of_day % kMinutesPerDay;

  std::uint32_t nearest_edge = kMinutesPerDay;
  for (const auto& window : config_.peak_windows) {
    if (inside(window, minute)) {
      return core::clamp01(config_.base + config_.peak_gain);
    }
    nearest_edge = std::min({nearest_edge, circular_distance(minute, window.start_minute),
                             circular_distance(minute, window.end_minute)});
  }

  if (config_.shoulder_minutes > 0 && nearest_edge < config_.shoulder_minutes) {
    const float proximity =
        1.0F - (static_cast<float>(nearest_edge) / static_cast<float>(config_.shoulder_minutes));
    return core::clamp01(config_.base + (config_.peak_gain * proximity));
  }

  return core::clamp01(config_.base);
}

}  // namespace crowd_ews::derived
