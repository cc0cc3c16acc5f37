#include "risk/alert_state.hpp"

#include <cmath>
#include <cstddef>
#include <utility>

#include "core/math.hpp"

namespace crowd_ews::risk {
namespace {

std::size_t rank(const model::alert_level level) {
  return static_cast<std::size_t>(level);
}

}  // namespace

AlertStateMachine::AlertStateMachine(core::AlertConfig config) : config_(std::move(config)) {
  core::validate_alert_config(config_);
}

model::alert_level AlertStateMachine::target_level(const float risk) const noexcept {
  const float r = core::sanitize01(risk);
  if (r >= config_.rising[2]) {
    return model::alert_level::RED;
  }
  if (r >= config_.rising[1]) {
    return model::alert_level::ORANGE;
  }
  if (r >= config_.rising[0]) {
    return model::alert_level::YELLOW;
  }
  return model::alert_level::GREEN;
}

bool AlertStateMachine::downgrade_eligible(const model::alert_level target, const float risk,
                                           const std::int64_t timestamp_ms) const noexcept {
  if (config_.policy == core::AlertPolicy::DWELL) {
    if (!last_upgrade_ms_.has_value()) {
      return true;
    }
    return (timestamp_ms - *last_upgrade_ms_) >= config_.min_hold.count();
  }

  // falling[i] guards level i + 1 (YELLOW is rank 1).
  for (std::size_t level = rank(target) + 1; level <= rank(level_); ++level) {
    if (risk >= config_.falling[level - 1]) {
      return false;
    }
  }
  return true;
}

alert_transition AlertStateMachine::step(const float extended_risk, const std::int64_t timestamp_ms) noexcept {
  const model::alert_level previous = level_;
  if (std::isnan(extended_risk)) {
    return alert_transition{.previous = previous, .current = level_, .changed = false};
  }

  const float risk = core::clamp01(extended_risk);
  const model::alert_level target = target_level(risk);

  if (rank(target) > rank(level_)) {
    level_ = target;
    last_upgrade_ms_ = timestamp_ms;
    pending_downgrades_ = 0;
    return alert_transition{.previous = previous, .current = level_, .changed = true};
  }

  if (target == level_ || !downgrade_eligible(target, risk, timestamp_ms)) {
    pending_downgrades_ = 0;
    return alert_transition{.previous = previous, .current = level_, .changed = false};
  }

  ++pending_downgrades_;
  if (pending_downgrades_ < config_.downgrade_confirm_samples) {
    return alert_transition{.previous = previous, .current = level_, .changed = false};
  }

  level_ = target;
  pending_downgrades_ = 0;
  return alert_transition{.previous = previous, .current = level_, .changed = true};
}

}  // namespace crowd_ews::risk
