#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/clock.hpp"
#include "core/config.hpp"
#include "derived/index_normalizer.hpp"
#include "history/ring_buffer.hpp"
#include "model/raw_sample.hpp"
#include "model/risk_snapshot.hpp"
#include "risk/alert_state.hpp"
#include "risk/composite_risk.hpp"

namespace crowd_ews::core {

enum class IngestStatus : std::uint8_t {
  ACCEPTED = 0,
  DEGRADED = 1,
  REJECTED = 2,
};

const char* to_string(IngestStatus status) noexcept;

struct IngestResult {
  IngestStatus status{IngestStatus::REJECTED};
  model::snapshot_ptr snapshot{};
  model::alert_level previous_level{model::alert_level::GREEN};
  std::string reason{};

  [[nodiscard]] bool accepted() const noexcept { return status != IngestStatus::REJECTED; }
  [[nodiscard]] bool level_changed() const noexcept {
    return snapshot != nullptr && snapshot->level != previous_level;
  }
};

struct EngineStats {
  std::size_t accepted{0};
  std::size_t degraded{0};
  std::size_t rejected{0};
  std::size_t transitions{0};
};

// Single-writer pipeline: normalize -> composite risk -> alert state ->
// history + latest. Readers never observe a snapshot without its level, nor
// a history that disagrees with latest().
class Engine {
 public:
  // Throws std::runtime_error on an inconsistent configuration. A null clock
  // means the system wall clock.
  explicit Engine(EngineConfig config, std::shared_ptr<const Clock> clock = nullptr);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Samples must arrive with strictly increasing timestamps; anything else is
  // rejected and leaves the engine untouched.
  IngestResult ingest(const model::raw_sample& sample);

  // Null until the first accepted sample.
  [[nodiscard]] model::snapshot_ptr latest() const;

  // At most min(k, capacity) snapshots, oldest first.
  [[nodiscard]] std::vector<model::snapshot_ptr> history(std::size_t k) const;

  [[nodiscard]] EngineStats stats() const;

  [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

 private:
  IngestResult reject(model::alert_level current, std::string reason);

  EngineConfig config_;
  std::shared_ptr<const Clock> clock_;

  // Writer-side state, guarded by ingest_mutex_.
  std::mutex ingest_mutex_;
  derived::IndexNormalizer normalizer_;
  risk::CompositeRisk composite_;
  risk::AlertStateMachine alert_state_;
  std::optional<std::int64_t> last_timestamp_ms_{};
  std::uint64_t next_sequence_{1};

  // Reader-visible state, guarded by publish_mutex_.
  mutable std::mutex publish_mutex_;
  history::RingBuffer<model::snapshot_ptr> history_;
  model::snapshot_ptr latest_{};
  EngineStats stats_{};
};

}  // namespace crowd_ews::core
