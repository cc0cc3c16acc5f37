#include "derived/crowd_dynamics_index.hpp"

#include <algorithm>
#include <cmath>

#include "core/math.hpp"

namespace crowd_ews::derived {

float normalize_density(const float density_p_m2, const float critical_density_p_m2) noexcept {
  // Bands are defined on the 3.5 p/m^2 reference scale.
  const float d = std::max(0.0F, density_p_m2) * (3.5F / critical_density_p_m2);
  if (d <= 1.0F) {
    return 0.15F * d;
  }
  if (d <= 2.0F) {
    return 0.15F + (0.25F * (d - 1.0F));
  }
  if (d <= 3.5F) {
    return 0.40F + (0.35F * ((d - 2.0F) / 1.5F));
  }
  return 0.75F + (0.25F * std::min(1.0F, (d - 3.5F) / 1.5F));
}

float normalize_speed(const float speed_mps, const float free_flow_speed_mps) noexcept {
  const float speed = std::clamp(speed_mps, 0.0F, free_flow_speed_mps);
  return 1.0F - (speed / free_flow_speed_mps);
}

CrowdDynamicsIndex::CrowdDynamicsIndex(const core::NormalizerConfig& config) noexcept
    : critical_density_p_m2_(config.critical_density_p_m2),
      free_flow_speed_mps_(config.free_flow_speed_mps),
      speed_variance_band_(config.speed_variance_band) {}

float CrowdDynamicsIndex::compute(const float density_p_m2, const float speed_mps,
                                  const std::optional<float> speed_variance) const noexcept {
  const float dn = normalize_density(density_p_m2, critical_density_p_m2_);
  const float sn = normalize_speed(speed_mps, free_flow_speed_mps_);

  // Turbulence when the collector measures it, otherwise the joint
  // low-speed/high-density congestion term.
  float coupling = dn * sn;
  if (speed_variance.has_value() && std::isfinite(*speed_variance)) {
    coupling = core::clamp01(*speed_variance / speed_variance_band_);
  }

  return core::sanitize01((0.5F * dn) + (0.2F * sn) + (0.3F * coupling));
}

}  // namespace crowd_ews::derived
