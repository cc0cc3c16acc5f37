#include "derived/thermal_humidity_index.hpp"

#include "core/math.hpp"

namespace crowd_ews::derived {

float thi_celsius(const float temp_c, const float humidity_pct) noexcept {
  return temp_c - ((0.55F - (0.0055F * humidity_pct)) * (temp_c - 14.5F));
}

ThermalHumidityIndex::ThermalHumidityIndex(const float comfort_thi, const float danger_thi) noexcept
    : comfort_thi_(comfort_thi), danger_thi_(danger_thi > comfort_thi ? danger_thi : comfort_thi + 10.0F) {}

float ThermalHumidityIndex::compute(const float temp_c, const float humidity_pct) const noexcept {
  const float thi = thi_celsius(temp_c, humidity_pct);
  return core::sanitize01((thi - comfort_thi_) / (danger_thi_ - comfort_thi_));
}

}  // namespace crowd_ews::derived
