#pragma once

#include <cstdint>

#include "core/timestamp.hpp"

namespace crowd_ews::core {

// Wall-clock source for the time-of-day index.
class Clock {
 public:
  virtual ~Clock() = default;

  [[nodiscard]] virtual std::int64_t now_ms() const noexcept = 0;
};

class SystemClock final : public Clock {
 public:
  [[nodiscard]] std::int64_t now_ms() const noexcept override { return unix_timestamp_now_ms(); }
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(const std::int64_t now_ms = 0) noexcept : now_ms_(now_ms) {}

  [[nodiscard]] std::int64_t now_ms() const noexcept override { return now_ms_; }

  void set(const std::int64_t now_ms) noexcept { now_ms_ = now_ms; }
  void advance(const std::int64_t delta_ms) noexcept { now_ms_ += delta_ms; }

 private:
  std::int64_t now_ms_{0};
};

}  // namespace crowd_ews::core
