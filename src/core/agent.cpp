#include "core/agent.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/timestamp.hpp"
#include "io/sample_json.hpp"
#include "io/snapshot_json.hpp"

namespace crowd_ews::core {
namespace {

std::string join(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += item;
  }
  return out;
}

bool blank(const std::string& line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

Agent::Agent(EngineConfig config, std::shared_ptr<const Clock> clock)
    : engine_(config, std::move(clock)),
      replay_interval_(config.replay_interval),
      publish_stdout_(config.stdout_debug) {
  if (config.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.password = config.redis.password;
    options.db = config.redis.db;
    options.connect_timeout_ms = config.redis.connect_timeout_ms;
    options.key_prefix = config.redis.key_prefix;
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

    if (redis_sink_->check_connectivity()) {
      if (!options.unix_socket.empty()) {
        std::cerr << "[agent] redis connectivity confirmed at unix://" << options.unix_socket << '\n';
      } else {
        std::cerr << "[agent] redis connectivity confirmed at " << options.host << ':' << options.port << '\n';
      }
    } else {
      if (!options.unix_socket.empty()) {
        std::cerr << "[agent] redis connectivity check failed at unix://" << options.unix_socket << '\n';
      } else {
        std::cerr << "[agent] redis connectivity check failed at " << options.host << ':' << options.port << '\n';
      }
    }
  }

  std::cerr << "[agent] history capacity " << engine_.config().history_capacity << " snapshots\n";
}

AgentStats Agent::run(std::istream& feed, const std::function<bool()>& should_stop) {
  AgentStats stats{};

  std::string line;
  while ((!should_stop || !should_stop()) && std::getline(feed, line)) {
    if (blank(line)) {
      continue;
    }

    if (replay_interval_.count() > 0) {
      if (first_sample_) {
        next_wakeup_ = std::chrono::steady_clock::now();
        first_sample_ = false;
      }
      std::this_thread::sleep_until(next_wakeup_);
      next_wakeup_ += replay_interval_;
    }

    process_line(line, stats);
  }

  return stats;
}

bool Agent::process_line(const std::string& line, AgentStats& stats) {
  ++stats.lines_read;

  model::raw_sample sample{};
  try {
    sample = io::parse_raw_sample_line(line);
  } catch (const std::invalid_argument& ex) {
    ++stats.decode_failures;
    std::cerr << "[agent] skipping line " << stats.lines_read << ": " << ex.what() << '\n';
    return false;
  }

  const IngestResult result = engine_.ingest(sample);
  if (!result.accepted()) {
    ++stats.rejected;
    std::cerr << "[agent] rejected sample at " << format_iso8601_ms(sample.timestamp_ms) << ": " << result.reason
              << '\n';
    return false;
  }

  ++stats.accepted;
  const model::risk_snapshot& snapshot = *result.snapshot;
  if (result.status == IngestStatus::DEGRADED) {
    ++stats.degraded;
    std::cerr << "[agent] degraded sample seq=" << snapshot.sequence
              << " fields=" << join(io::degraded_field_names(snapshot.degraded_fields)) << '\n';
  }
  if (result.level_changed()) {
    ++stats.transitions;
    std::cerr << "[agent] alert " << model::to_string(result.previous_level) << " -> "
              << model::to_string(snapshot.level) << " at " << format_iso8601_ms(snapshot.timestamp_ms)
              << " extended_risk=" << snapshot.extended_risk << '\n';
  }

  publish_sinks(snapshot, stats);
  return true;
}

void Agent::publish_sinks(const model::risk_snapshot& snapshot, AgentStats& stats) {
  ++stats.sink_cycles;

  if (publish_stdout_) {
    stdout_sink_.publish(snapshot);
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(snapshot);
    stats.max_redis_latency_ms = std::max(stats.max_redis_latency_ms, redis_sink_->last_latency_ms());
    if (!ok) {
      ++stats.redis_errors;
      if (redis_was_ok_) {
        std::cerr << "[redis] publish failed\n";
        redis_was_ok_ = false;
      }
    } else if (!redis_was_ok_) {
      std::cerr << "[redis] publish recovered\n";
      redis_was_ok_ = true;
    }
  }
}

}  // namespace crowd_ews::core
