#pragma once

#include <optional>

#include "core/config.hpp"
#include "history/ring_buffer.hpp"

namespace crowd_ews::derived {

struct anxiety_signals {
  std::optional<float> push_rate{};   // pushes / min / 1000 people, 0..10 typical
  std::optional<float> shout_rate{};  // shouts / min / 1000 people, 0..20 typical
  std::optional<float> near_falls{};  // near-fall incidents / 5 min, 0..10 typical

  [[nodiscard]] bool any() const noexcept {
    return push_rate.has_value() || shout_rate.has_value() || near_falls.has_value();
  }
};

// Missing rates count as zero.
float normalize_anxiety_signals(const anxiety_signals& signals) noexcept;

// CAI from short-window volatility of density and speed, blended with anxiety
// event rates when the collector reports them and amplified by density.
class CrowdAnxietyIndex {
 public:
  explicit CrowdAnxietyIndex(const core::NormalizerConfig& config = {});

  float sample(float density_p_m2, float speed_mps, const anxiety_signals& signals) noexcept;

  // Requires at least two samples in the window.
  [[nodiscard]] std::optional<float> volatility() const noexcept;

 private:
  core::NormalizerConfig config_;
  history::RingBuffer<float> densities_;
  history::RingBuffer<float> speeds_;
};

}  // namespace crowd_ews::derived
