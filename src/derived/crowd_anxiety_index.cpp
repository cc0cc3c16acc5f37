#include "derived/crowd_anxiety_index.hpp"

#include <cmath>

#include "core/math.hpp"
#include "derived/crowd_dynamics_index.hpp"

namespace crowd_ews::derived {
namespace {

float rate_or_zero(const std::optional<float>& rate) {
  return rate.has_value() && std::isfinite(*rate) ? *rate : 0.0F;
}

float mean_abs_step(const history::RingBuffer<float>& window) {
  float sum = 0.0F;
  for (std::size_t i = 1; i < window.size(); ++i) {
    sum += std::fabs(window.at(i) - window.at(i - 1));
  }
  return sum / static_cast<float>(window.size() - 1);
}

}  // namespace

float normalize_anxiety_signals(const anxiety_signals& signals) noexcept {
  const float pr = core::clamp01(rate_or_zero(signals.push_rate) / 10.0F);
  const float sr = core::clamp01(rate_or_zero(signals.shout_rate) / 20.0F);
  const float nf = core::clamp01(rate_or_zero(signals.near_falls) / 10.0F);
  return core::clamp01((0.4F * pr) + (0.3F * sr) + (0.3F * nf));
}

CrowdAnxietyIndex::CrowdAnxietyIndex(const core::NormalizerConfig& config)
    : config_(config), densities_(config.volatility_window), speeds_(config.volatility_window) {}

std::optional<float> CrowdAnxietyIndex::volatility() const noexcept {
  if (densities_.size() < 2) {
    return std::nullopt;
  }
  const float density_norm = core::clamp01(mean_abs_step(densities_) / config_.density_volatility_band);
  const float speed_norm = core::clamp01(mean_abs_step(speeds_) / config_.speed_volatility_band);
  return (0.5F * density_norm) + (0.5F * speed_norm);
}

float CrowdAnxietyIndex::sample(const float density_p_m2, const float speed_mps,
                                const anxiety_signals& signals) noexcept {
  densities_.push(density_p_m2);
  speeds_.push(speed_mps);

  const float dn = normalize_density(density_p_m2, config_.critical_density_p_m2);
  const float sn = normalize_speed(speed_mps, config_.free_flow_speed_mps);
  const float amplification = 0.25F * dn;

  const auto volatility_norm = volatility();
  float base = 0.5F * dn * sn;
  if (volatility_norm.has_value() && signals.any()) {
    base = 0.5F * (*volatility_norm + normalize_anxiety_signals(signals));
  } else if (volatility_norm.has_value()) {
    base = *volatility_norm;
  } else if (signals.any()) {
    base = normalize_anxiety_signals(signals);
  }

  return core::sanitize01(base + amplification);
}

}  // namespace crowd_ews::derived
