#pragma once

#include "core/config.hpp"
#include "model/risk_snapshot.hpp"

namespace crowd_ews::risk {

struct risk_scores {
  float physical;
  float behavioral_intention;
  float extended;
};

// DANP-weighted physical risk, TPB behavioral intention, and their blend.
// Stateless; weights are fixed at construction.
class CompositeRisk {
 public:
  CompositeRisk(core::PhysicalWeights weights, core::BehavioralWeights behavioral, core::BlendWeights blend) noexcept;
  explicit CompositeRisk(const core::EngineConfig& config) noexcept;

  [[nodiscard]] float physical(const model::index_set& indices) const noexcept;
  [[nodiscard]] float behavioral_intention(const model::index_set& indices) const noexcept;
  [[nodiscard]] float extended(float physical_risk, float behavioral_intention) const noexcept;

  [[nodiscard]] risk_scores evaluate(const model::index_set& indices) const noexcept;

 private:
  core::PhysicalWeights weights_;
  core::BehavioralWeights behavioral_;
  core::BlendWeights blend_;
};

}  // namespace crowd_ews::risk
