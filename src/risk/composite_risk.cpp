#include "risk/composite_risk.hpp"

#include "core/math.hpp"

namespace crowd_ews::risk {

CompositeRisk::CompositeRisk(const core::PhysicalWeights weights, const core::BehavioralWeights behavioral,
                             const core::BlendWeights blend) noexcept
    : weights_(weights), behavioral_(behavioral), blend_(blend) {}

CompositeRisk::CompositeRisk(const core::EngineConfig& config) noexcept
    : CompositeRisk(config.weights, config.behavioral, config.blend) {}

float CompositeRisk::physical(const model::index_set& indices) const noexcept {
  const float cai = core::sanitize01(indices.cai);
  const float cdi = core::sanitize01(indices.cdi);
  const float thi = core::sanitize01(indices.thi);
  const float ti = core::sanitize01(indices.ti);
  const float ei = core::sanitize01(indices.ei);
  return core::sanitize01((weights_.cai * cai) + (weights_.cdi * cdi) + (weights_.thi * thi) + (weights_.ti * ti) +
                          (weights_.ei * ei));
}

float CompositeRisk::behavioral_intention(const model::index_set& indices) const noexcept {
  const float ati = core::sanitize01(indices.ati);
  const float sni = core::sanitize01(indices.sni);
  const float pci = core::sanitize01(indices.pci);
  return core::sanitize01((behavioral_.ati * ati) + (behavioral_.sni * sni) + (behavioral_.pci * pci));
}

float CompositeRisk::extended(const float physical_risk, const float behavioral_intention) const noexcept {
  return core::sanitize01((blend_.physical * core::sanitize01(physical_risk)) +
                          (blend_.behavioral * core::sanitize01(behavioral_intention)));
}

risk_scores CompositeRisk::evaluate(const model::index_set& indices) const noexcept {
  const float physical_risk = physical(indices);
  const float bi = behavioral_intention(indices);
  return risk_scores{.physical = physical_risk, .behavioral_intention = bi, .extended = extended(physical_risk, bi)};
}

}  // namespace crowd_ews::risk
