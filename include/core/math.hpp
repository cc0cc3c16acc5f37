#pragma once

#include <algorithm>
#include <cmath>

namespace crowd_ews::core {

inline constexpr float clamp01(const float value) noexcept {
  return std::clamp(value, 0.0F, 1.0F);
}

// NaN maps to 0 so that a bad reading can never leave a score outside [0, 1].
inline float sanitize01(const float value) noexcept {
  return std::isnan(value) ? 0.0F : clamp01(value);
}

}  // namespace crowd_ews::core
