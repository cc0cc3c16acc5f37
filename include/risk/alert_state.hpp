#pragma once

#include <cstdint>
#include <optional>

#include "core/config.hpp"
#include "model/risk_snapshot.hpp"

namespace crowd_ews::risk {

struct alert_transition {
  model::alert_level previous;
  model::alert_level current;
  bool changed;
};

// Four-level alert ladder with instant upgrades and guarded downgrades.
//
// HYSTERESIS: a downgrade to target T is taken only when the score is below the
// fall-back threshold of every level above T up to the current one.
// DWELL: a downgrade is taken only once min_hold has elapsed since the last
// upgrade, measured on sample timestamps.
//
// Either way the downgrade must hold for downgrade_confirm_samples consecutive
// steps. Scores are clamped to [0, 1]; a NaN score leaves the level unchanged.
class AlertStateMachine {
 public:
  explicit AlertStateMachine(core::AlertConfig config = {});

  alert_transition step(float extended_risk, std::int64_t timestamp_ms) noexcept;

  [[nodiscard]] model::alert_level level() const noexcept { return level_; }

  // Highest level whose rising threshold is <= risk.
  [[nodiscard]] model::alert_level target_level(float risk) const noexcept;

  [[nodiscard]] const core::AlertConfig& config() const noexcept { return config_; }

 private:
  [[nodiscard]] bool downgrade_eligible(model::alert_level target, float risk, std::int64_t timestamp_ms) const noexcept;

  core::AlertConfig config_;
  model::alert_level level_{model::alert_level::GREEN};
  std::optional<std::int64_t> last_upgrade_ms_{};
  std::uint32_t pending_downgrades_{0};
};

}  // namespace crowd_ews::risk
