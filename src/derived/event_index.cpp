#include "derived/event_index.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "core/math.hpp"

namespace crowd_ews::derived {

EventIndex::EventIndex(core::EventConfig config) : config_(std::move(config)) {}

float EventIndex::at(const std::int64_t unix_ms, const std::optional<float> sample_intensity) const noexcept {
  bool matched = false;
  float intensity = 0.0F;

  for (const auto& window : config_.calendar) {
    if (unix_ms >= window.start_ms && unix_ms < window.end_ms) {
      intensity = matched ? std::max(intensity, window.intensity) : window.intensity;
      matched = true;
    }
  }

  if (sample_intensity.has_value() && std::isfinite(*sample_intensity)) {
    const float reported = core::clamp01(*sample_intensity);
    intensity = matched ? std::max(intensity, reported) : reported;
    matched = true;
  }

  return core::clamp01(matched ? intensity : config_.baseline);
}

}  // namespace crowd_ews::derived
