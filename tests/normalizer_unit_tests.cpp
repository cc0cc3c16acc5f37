#include <cmath>
#include <iostream>
#include <limits>
#include <optional>

#include "core/config.hpp"
#include "core/timestamp.hpp"
#include "derived/crowd_anxiety_index.hpp"
#include "derived/crowd_dynamics_index.hpp"
#include "derived/event_index.hpp"
#include "derived/index_normalizer.hpp"
#include "derived/thermal_humidity_index.hpp"
#include "derived/time_index.hpp"
#include "model/raw_sample.hpp"

using crowd_ews::core::EngineConfig;
using crowd_ews::core::EventConfig;
using crowd_ews::core::EventWindow;
using crowd_ews::core::NormalizerConfig;
using crowd_ews::core::TimeConfig;
using crowd_ews::core::parse_iso8601_ms;
using crowd_ews::derived::CrowdAnxietyIndex;
using crowd_ews::derived::CrowdDynamicsIndex;
using crowd_ews::derived::EventIndex;
using crowd_ews::derived::IndexNormalizer;
using crowd_ews::derived::ThermalHumidityIndex;
using crowd_ews::derived::TimeIndex;
using crowd_ews::derived::anxiety_signals;
using crowd_ews::derived::normalize_density;
using crowd_ews::derived::normalize_speed;
using crowd_ews::derived::thi_celsius;
using crowd_ews::model::raw_sample;

namespace {

bool almost_equal(float a, float b, float epsilon = 1e-4F) {
  return std::fabs(a - b) <= epsilon;
}

bool in_unit_range(float value) {
  return value >= 0.0F && value <= 1.0F;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

int test_thi_rescales_against_comfort_and_danger() {
  if (!almost_equal(thi_celsius(30.0F, 50.0F), 25.7375F)) {
    return fail("test_thi_rescales_against_comfort_and_danger", "raw THI formula mismatch");
  }

  ThermalHumidityIndex thi;
  if (!almost_equal(thi.compute(22.0F, 50.0F), 0.0F)) {
    return fail("test_thi_rescales_against_comfort_and_danger", "comfortable air should map to 0");
  }
  if (!almost_equal(thi.compute(35.0F, 60.0F), 0.849F)) {
    return fail("test_thi_rescales_against_comfort_and_danger", "hot humid air rescale mismatch");
  }
  if (!almost_equal(thi.compute(55.0F, 100.0F), 1.0F)) {
    return fail("test_thi_rescales_against_comfort_and_danger", "extreme heat should clamp to 1");
  }
  if (!almost_equal(thi.compute(std::numeric_limits<float>::quiet_NaN(), 50.0F), 0.0F)) {
    return fail("test_thi_rescales_against_comfort_and_danger", "NaN input must not escape the unit range");
  }

  return 0;
}

int test_density_and_speed_normalization() {
  if (!almost_equal(normalize_density(1.0F, 3.5F), 0.15F) || !almost_equal(normalize_density(2.0F, 3.5F), 0.40F) ||
      !almost_equal(normalize_density(3.5F, 3.5F), 0.75F) || !almost_equal(normalize_density(5.0F, 3.5F), 1.0F) ||
      !almost_equal(normalize_density(10.0F, 3.5F), 1.0F)) {
    return fail("test_density_and_speed_normalization", "density band edges mismatch");
  }
  if (!almost_equal(normalize_density(3.5F, 7.0F), normalize_density(1.75F, 3.5F))) {
    return fail("test_density_and_speed_normalization", "bands should scale with critical density");
  }

  if (!almost_equal(normalize_speed(0.6F, 1.2F), 0.5F) || !almost_equal(normalize_speed(2.0F, 1.2F), 0.0F) ||
      !almost_equal(normalize_speed(0.0F, 1.2F), 1.0F)) {
    return fail("test_density_and_speed_normalization", "speed normalization mismatch");
  }

  return 0;
}

int test_cdi_congestion_and_turbulence() {
  CrowdDynamicsIndex cdi;

  if (!almost_equal(cdi.compute(5.0F, 0.0F, std::nullopt), 1.0F)) {
    return fail("test_cdi_congestion_and_turbulence", "standstill at severe density should saturate");
  }
  if (!almost_equal(cdi.compute(1.0F, 1.2F, std::nullopt), 0.075F)) {
    return fail("test_cdi_congestion_and_turbulence", "free flow at low density mismatch");
  }
  if (!almost_equal(cdi.compute(1.0F, 1.2F, 0.25F), 0.225F)) {
    return fail("test_cdi_congestion_and_turbulence", "speed variance should replace the congestion term");
  }
  if (!(cdi.compute(4.0F, 0.2F, std::nullopt) > cdi.compute(4.0F, 1.0F, std::nullopt)) ||
      !(cdi.compute(4.0F, 0.2F, std::nullopt) > cdi.compute(1.5F, 0.2F, std::nullopt))) {
    return fail("test_cdi_congestion_and_turbulence", "low speed and high density should both raise CDI");
  }

  return 0;
}

int test_cai_fallback_volatility_and_signals() {
  CrowdAnxietyIndex cai;
  const anxiety_signals none{};

  if (!almost_equal(cai.sample(2.0F, 0.6F, none), 0.2F)) {
    return fail("test_cai_fallback_volatility_and_signals", "first sample should use the density/speed fallback");
  }
  if (cai.volatility().has_value()) {
    return fail("test_cai_fallback_volatility_and_signals", "volatility needs two samples");
  }

  if (!almost_equal(cai.sample(2.0F, 0.6F, none), 0.1F)) {
    return fail("test_cai_fallback_volatility_and_signals", "steady crowd should only carry the density term");
  }

  if (!almost_equal(cai.sample(2.5F, 0.4F, none), 0.629167F, 1e-3F)) {
    return fail("test_cai_fallback_volatility_and_signals", "volatility term mismatch");
  }

  CrowdAnxietyIndex signalled;
  const anxiety_signals signals{.push_rate = 5.0F, .shout_rate = 10.0F, .near_falls = std::nullopt};
  if (!almost_equal(signalled.sample(1.0F, 1.2F, signals), 0.3875F)) {
    return fail("test_cai_fallback_volatility_and_signals", "event rates should replace the fallback");
  }

  CrowdAnxietyIndex saturated;
  const anxiety_signals extreme{.push_rate = 50.0F, .shout_rate = 50.0F, .near_falls = 50.0F};
  saturated.sample(1.0F, 1.2F, extreme);
  if (!in_unit_range(saturated.sample(6.0F, 0.0F, extreme))) {
    return fail("test_cai_fallback_volatility_and_signals", "CAI must stay within [0, 1]");
  }

  return 0;
}

int test_time_index_peak_windows() {
  TimeIndex ti;

  if (!almost_equal(ti.at_minute(240), 0.9F)) {
    return fail("test_time_index_peak_windows", "inside a peak window should be base + gain");
  }
  if (!almost_equal(ti.at_minute(720), 0.1F)) {
    return fail("test_time_index_peak_windows", "midday should be the base value");
  }
  if (!almost_equal(ti.at_minute(630), 0.5F)) {
    return fail("test_time_index_peak_windows", "shoulder should ramp linearly");
  }
  if (!almost_equal(ti.at_minute(1439), 0.1F)) {
    return fail("test_time_index_peak_windows", "late night should be the base value");
  }

  const auto four_am_local = parse_iso8601_ms("2026-10-18T22:30:00Z");
  if (!four_am_local.has_value() || !almost_equal(ti.at(*four_am_local), 0.9F)) {
    return fail("test_time_index_peak_windows", "UTC offset should shift into the local peak");
  }

  TimeConfig wrapping{};
  wrapping.utc_offset_minutes = 0;
  wrapping.peak_windows = {{.start_minute = 1380, .end_minute = 60}};
  TimeIndex overnight(wrapping);
  if (!almost_equal(overnight.at_minute(10), 0.9F) || !almost_equal(overnight.at_minute(1400), 0.9F)) {
    return fail("test_time_index_peak_windows", "windows should wrap past midnight");
  }

  return 0;
}

int test_event_index_calendar_and_baseline() {
  EventIndex baseline_only;
  if (!almost_equal(baseline_only.at(1'000), 0.2F)) {
    return fail("test_event_index_calendar_and_baseline", "no calendar should yield the baseline");
  }

  EventConfig config{};
  config.calendar.push_back(EventWindow{.name = "procession", .start_ms = 1'000, .end_ms = 2'000, .intensity = 0.9F});
  config.calendar.push_back(EventWindow{.name = "aarti", .start_ms = 1'500, .end_ms = 3'000, .intensity = 0.6F});
  EventIndex calendar(config);

  if (!almost_equal(calendar.at(1'600), 0.9F)) {
    return fail("test_event_index_calendar_and_baseline", "overlapping windows should take the maximum");
  }
  if (!almost_equal(calendar.at(2'000), 0.6F)) {
    return fail("test_event_index_calendar_and_baseline", "window end should be exclusive");
  }
  if (!almost_equal(calendar.at(5'000), 0.2F)) {
    return fail("test_event_index_calendar_and_baseline", "outside every window should be the baseline");
  }
  if (!almost_equal(calendar.at(5'000, 0.05F), 0.05F)) {
    return fail("test_event_index_calendar_and_baseline", "sample intensity should override the baseline");
  }
  if (!almost_equal(calendar.at(1'600, 1.7F), 1.0F)) {
    return fail("test_event_index_calendar_and_baseline", "sample intensity should be clamped");
  }

  return 0;
}

raw_sample complete_sample(std::int64_t timestamp_ms) {
  raw_sample sample{};
  sample.timestamp_ms = timestamp_ms;
  sample.temperature_c = 30.0F;
  sample.humidity_pct = 50.0F;
  sample.density_p_m2 = 2.0F;
  sample.speed_mps = 0.6F;
  sample.attitude = 0.4F;
  sample.subjective_norm = 0.5F;
  sample.perceived_control = 0.6F;
  return sample;
}

int test_normalizer_substitutes_missing_fields() {
  IndexNormalizer normalizer{EngineConfig{}};

  raw_sample first = complete_sample(1'000);
  first.temperature_c.reset();
  first.attitude.reset();
  const auto initial = normalizer.normalize(first, 1'000);

  if ((initial.degraded_fields & crowd_ews::model::FIELD_TEMPERATURE) == 0 ||
      (initial.degraded_fields & crowd_ews::model::FIELD_ATTITUDE) == 0) {
    return fail("test_normalizer_substitutes_missing_fields", "missing fields must be flagged");
  }
  if (!almost_equal(initial.indices.thi, ThermalHumidityIndex{}.compute(22.0F, 50.0F))) {
    return fail("test_normalizer_substitutes_missing_fields", "first missing temperature should use the comfort value");
  }
  if (!almost_equal(initial.indices.ati, 0.5F)) {
    return fail("test_normalizer_substitutes_missing_fields", "first missing attitude should be neutral");
  }

  const auto good = normalizer.normalize(complete_sample(2'000), 2'000);
  if (good.degraded()) {
    return fail("test_normalizer_substitutes_missing_fields", "complete sample must not be degraded");
  }

  raw_sample gap = complete_sample(3'000);
  gap.temperature_c = std::numeric_limits<float>::quiet_NaN();
  gap.subjective_norm.reset();
  const auto substituted = normalizer.normalize(gap, 3'000);
  if (!almost_equal(substituted.indices.thi, good.indices.thi)) {
    return fail("test_normalizer_substitutes_missing_fields", "non-finite temperature should reuse the last good value");
  }
  if (!almost_equal(substituted.indices.sni, 0.5F)) {
    return fail("test_normalizer_substitutes_missing_fields", "missing SNI should reuse the last good value");
  }
  if (substituted.degraded_fields !=
      (crowd_ews::model::FIELD_TEMPERATURE | crowd_ews::model::FIELD_SUBJECTIVE_NORM)) {
    return fail("test_normalizer_substitutes_missing_fields", "only substituted fields should be flagged");
  }

  return 0;
}

int test_normalizer_clamps_out_of_range_inputs() {
  IndexNormalizer normalizer{EngineConfig{}};

  raw_sample sample = complete_sample(1'000);
  sample.density_p_m2 = 14.0F;
  sample.humidity_pct = 130.0F;
  sample.attitude = 1.05F;
  sample.perceived_control = -0.02F;
  sample.phase = "procession";
  const auto out = normalizer.normalize(sample, 1'000);

  if ((out.degraded_fields & crowd_ews::model::FIELD_DENSITY) == 0 ||
      (out.degraded_fields & crowd_ews::model::FIELD_HUMIDITY) == 0) {
    return fail("test_normalizer_clamps_out_of_range_inputs", "impossible physical values must be flagged");
  }
  if ((out.degraded_fields & (crowd_ews::model::FIELD_ATTITUDE | crowd_ews::model::FIELD_PERCEIVED_CONTROL)) != 0) {
    return fail("test_normalizer_clamps_out_of_range_inputs", "behavioral noise should be clamped silently");
  }
  if (!almost_equal(out.indices.ati, 1.0F) || !almost_equal(out.indices.pci, 0.0F)) {
    return fail("test_normalizer_clamps_out_of_range_inputs", "behavioral proxies should clamp to [0, 1]");
  }

  const float values[] = {out.indices.cai, out.indices.cdi, out.indices.thi, out.indices.ti,
                          out.indices.ei,  out.indices.ati, out.indices.sni, out.indices.pci};
  for (const float value : values) {
    if (!in_unit_range(value)) {
      return fail("test_normalizer_clamps_out_of_range_inputs", "every index must stay within [0, 1]");
    }
  }

  return 0;
}

int test_phase_tag_never_changes_indices() {
  IndexNormalizer tagged{EngineConfig{}};
  IndexNormalizer untagged{EngineConfig{}};

  raw_sample with_phase = complete_sample(1'000);
  with_phase.phase = "stampede-drill";
  const auto a = tagged.normalize(with_phase, 1'000);
  const auto b = untagged.normalize(complete_sample(1'000), 1'000);

  if (!almost_equal(a.indices.cai, b.indices.cai) || !almost_equal(a.indices.cdi, b.indices.cdi) ||
      !almost_equal(a.indices.thi, b.indices.thi) || !almost_equal(a.indices.ti, b.indices.ti) ||
      !almost_equal(a.indices.ei, b.indices.ei)) {
    return fail("test_phase_tag_never_changes_indices", "phase label must not influence any index");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_thi_rescales_against_comfort_and_danger(); rc != 0) return rc;
  if (int rc = test_density_and_speed_normalization(); rc != 0) return rc;
  if (int rc = test_cdi_congestion_and_turbulence(); rc != 0) return rc;
  if (int rc = test_cai_fallback_volatility_and_signals(); rc != 0) return rc;
  if (int rc = test_time_index_peak_windows(); rc != 0) return rc;
  if (int rc = test_event_index_calendar_and_baseline(); rc != 0) return rc;
  if (int rc = test_normalizer_substitutes_missing_fields(); rc != 0) return rc;
  if (int rc = test_normalizer_clamps_out_of_range_inputs(); rc != 0) return rc;
  if (int rc = test_phase_tag_never_changes_indices(); rc != 0) return rc;

  std::cout << "[PASS] normalizer unit tests\n";
  return 0;
}
