#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/engine.hpp"
#include "model/risk_snapshot.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace crowd_ews::core {

struct AgentStats {
  std::size_t lines_read{0};
  std::size_t decode_failures{0};
  std::size_t accepted{0};
  std::size_t degraded{0};
  std::size_t rejected{0};
  std::size_t transitions{0};
  std::size_t sink_cycles{0};
  std::size_t redis_errors{0};
  float max_redis_latency_ms{0.0F};
};

// Feeds JSON-lines samples into one engine and fans each snapshot out to the
// configured sinks.
class Agent {
 public:
  explicit Agent(EngineConfig config, std::shared_ptr<const Clock> clock = nullptr);

  // Runs until end of feed or until should_stop returns true.
  AgentStats run(std::istream& feed, const std::function<bool()>& should_stop = {});

  // Returns false when the line could not be decoded or was rejected.
  bool process_line(const std::string& line, AgentStats& stats);

  [[nodiscard]] const Engine& engine() const noexcept { return engine_; }

 private:
  void publish_sinks(const model::risk_snapshot& snapshot, AgentStats& stats);

  Engine engine_;
  std::chrono::milliseconds replay_interval_{};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_sample_{true};
  bool publish_stdout_{true};

  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};
};

}  // namespace crowd_ews::core
