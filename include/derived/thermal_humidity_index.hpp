#pragma once

namespace crowd_ews::derived {

// Raw Celsius-scale THI: T - (0.55 - 0.0055 * RH) * (T - 14.5).
float thi_celsius(float temp_c, float humidity_pct) noexcept;

class ThermalHumidityIndex {
 public:
  explicit ThermalHumidityIndex(float comfort_thi = 22.0F, float danger_thi = 32.0F) noexcept;

  [[nodiscard]] float compute(float temp_c, float humidity_pct) const noexcept;

 private:
  float comfort_thi_{22.0F};
  float danger_thi_{32.0F};
};

}  // namespace crowd_ews::derived
