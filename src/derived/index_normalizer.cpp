#include "derived/index_normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

#include "core/math.hpp"

namespace crowd_ews::derived {
namespace {

constexpr float kMinTemperatureC = -50.0F;
constexpr float kMaxTemperatureC = 60.0F;
constexpr float kMaxDensityPM2 = 10.0F;
constexpr float kMaxSpeedMps = 10.0F;
constexpr float kNeutralBehavioral = 0.5F;

float resolve(const std::optional<float>& value, float& last_good, const float lo, const float hi,
              const std::uint32_t field, std::uint32_t& degraded_fields) {
  if (!value.has_value() || !std::isfinite(*value)) {
    degraded_fields |= field;
    return last_good;
  }

  float resolved = *value;
  if (resolved < lo || resolved > hi) {
    degraded_fields |= field;
    resolved = std::clamp(resolved, lo, hi);
  }
  last_good = resolved;
  return resolved;
}

// Behavioral proxies are pre-scaled upstream; small excursions are collector
// noise and are clamped without degrading the sample.
float resolve_behavioral(const std::optional<float>& value, float& last_good, const std::uint32_t field,
                         std::uint32_t& degraded_fields) {
  if (!value.has_value() || !std::isfinite(*value)) {
    degraded_fields |= field;
    return last_good;
  }
  last_good = core::clamp01(*value);
  return last_good;
}

}  // namespace

IndexNormalizer::IndexNormalizer(const core::EngineConfig& config)
    : thi_(config.normalizer.thi_comfort, config.normalizer.thi_danger),
      cdi_(config.normalizer),
      cai_(config.normalizer),
      ti_(config.time),
      ei_(config.events),
      last_good_{.temperature_c = config.normalizer.thi_comfort,
                 .humidity_pct = 50.0F,
                 .density_p_m2 = 1.0F,
                 .speed_mps = config.normalizer.free_flow_speed_mps,
                 .attitude = kNeutralBehavioral,
                 .subjective_norm = kNeutralBehavioral,
                 .perceived_control = kNeutralBehavioral} {}

normalized_sample IndexNormalizer::normalize(const model::raw_sample& sample,
                                             const std::int64_t evaluation_time_ms) noexcept {
  normalized_sample out{};
  std::uint32_t& degraded = out.degraded_fields;

  const float temperature_c = resolve(sample.temperature_c, last_good_.temperature_c, kMinTemperatureC,
                                      kMaxTemperatureC, model::FIELD_TEMPERATURE, degraded);
  const float humidity_pct =
      resolve(sample.humidity_pct, last_good_.humidity_pct, 0.0F, 100.0F, model::FIELD_HUMIDITY, degraded);
  const float density_p_m2 =
      resolve(sample.density_p_m2, last_good_.density_p_m2, 0.0F, kMaxDensityPM2, model::FIELD_DENSITY, degraded);
  const float speed_mps =
      resolve(sample.speed_mps, last_good_.speed_mps, 0.0F, kMaxSpeedMps, model::FIELD_SPEED, degraded);

  const anxiety_signals signals{
      .push_rate = sample.push_rate, .shout_rate = sample.shout_rate, .near_falls = sample.near_falls};

  auto& indices = out.indices;
  indices.thi = thi_.compute(temperature_c, humidity_pct);
  indices.cdi = cdi_.compute(density_p_m2, speed_mps, sample.speed_variance);
  indices.cai = cai_.sample(density_p_m2, speed_mps, signals);
  indices.ti = ti_.at(evaluation_time_ms);
  indices.ei = ei_.at(evaluation_time_ms, sample.event_intensity);

  indices.ati = resolve_behavioral(sample.attitude, last_good_.attitude, model::FIELD_ATTITUDE, degraded);
  indices.sni =
      resolve_behavioral(sample.subjective_norm, last_good_.subjective_norm, model::FIELD_SUBJECTIVE_NORM, degraded);
  indices.pci = resolve_behavioral(sample.perceived_control, last_good_.perceived_control,
                                   model::FIELD_PERCEIVED_CONTROL, degraded);

  return out;
}

}  // namespace crowd_ews::derived
