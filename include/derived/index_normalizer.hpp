#pragma once

#include <cstdint>

#include "core/config.hpp"
#include "derived/crowd_anxiety_index.hpp"
#include "derived/crowd_dynamics_index.hpp"
#include "derived/event_index.hpp"
#include "derived/thermal_humidity_index.hpp"
#include "derived/time_index.hpp"
#include "model/raw_sample.hpp"
#include "model/risk_snapshot.hpp"

namespace crowd_ews::derived {

struct normalized_sample {
  model::index_set indices{};
  std::uint32_t degraded_fields{0};

  [[nodiscard]] bool degraded() const noexcept { return degraded_fields != 0; }
};

// Maps one raw sample to the eight indices. Missing or non-finite fields fall
// back to the last good value (neutral defaults before the first one) and
// physically impossible values are clamped; both are reported in
// degraded_fields. Never fails.
class IndexNormalizer {
 public:
  explicit IndexNormalizer(const core::EngineConfig& config);

  // evaluation_time_ms is the instant TI and EI are evaluated at.
  normalized_sample normalize(const model::raw_sample& sample, std::int64_t evaluation_time_ms) noexcept;

 private:
  struct last_good_values {
    float temperature_c;
    float humidity_pct;
    float density_p_m2;
    float speed_mps;
    float attitude;
    float subjective_norm;
    float perceived_control;
  };

  ThermalHumidityIndex thi_;
  CrowdDynamicsIndex cdi_;
  CrowdAnxietyIndex cai_;
  TimeIndex ti_;
  EventIndex ei_;
  last_good_values last_good_;
};

}  // namespace crowd_ews::derived
