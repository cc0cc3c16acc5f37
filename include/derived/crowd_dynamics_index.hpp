#pragma once

#include <optional>

#include "core/config.hpp"

namespace crowd_ews::derived {

// Fruin-style level-of-service bands, scaled so the "severe" band starts at
// critical_density: <=2/7 c low, <=4/7 c moderate, <=c high, beyond severe.
float normalize_density(float density_p_m2, float critical_density_p_m2) noexcept;

// 0 at or above free-flow speed, 1 at standstill.
float normalize_speed(float speed_mps, float free_flow_speed_mps) noexcept;

class CrowdDynamicsIndex {
 public:
  explicit CrowdDynamicsIndex(const core::NormalizerConfig& config = {}) noexcept;

  [[nodiscard]] float compute(float density_p_m2, float speed_mps, std::optional<float> speed_variance) const noexcept;

 private:
  float critical_density_p_m2_;
  float free_flow_speed_mps_;
  float speed_variance_band_;
};

}  // namespace crowd_ews::derived
