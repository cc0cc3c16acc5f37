#pragma once

#include <cstdint>

#include "core/config.hpp"

namespace crowd_ews::derived {

// Temporal criticality from proximity of the local time of day to the
// configured peak windows.
class TimeIndex {
 public:
  explicit TimeIndex(core::TimeConfig config = {});

  [[nodiscard]] float at(std::int64_t unix_ms) const noexcept;
  [[nodiscard]] float at_minute(std::uint32_t minute_of_day) const noexcept;

 private:
  core::TimeConfig config_;
};

}  // namespace crowd_ews::derived
