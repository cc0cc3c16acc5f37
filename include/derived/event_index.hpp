#pragma once

#include <cstdint>
#include <optional>

#include "core/config.hpp"

namespace crowd_ews::derived {

// Ritual/procession surge intensity from the event calendar and, when the
// collector supplies one, a per-sample intensity. The larger wins; with
// neither the configured baseline applies.
class EventIndex {
 public:
  explicit EventIndex(core::EventConfig config = {});

  [[nodiscard]] float at(std::int64_t unix_ms, std::optional<float> sample_intensity = std::nullopt) const noexcept;

 private:
  core::EventConfig config_;
};

}  // namespace crowd_ews::derived
