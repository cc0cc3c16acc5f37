#include "core/engine.hpp"

#include <utility>

#include "core/timestamp.hpp"

namespace crowd_ews::core {
namespace {

const EngineConfig& validated(const EngineConfig& config) {
  validate_engine_config(config);
  return config;
}

}  // namespace

const char* to_string(const IngestStatus status) noexcept {
  switch (status) {
    case IngestStatus::ACCEPTED:
      return "accepted";
    case IngestStatus::DEGRADED:
      return "degraded";
    case IngestStatus::REJECTED:
      return "rejected";
  }
  return "rejected";
}

Engine::Engine(EngineConfig config, std::shared_ptr<const Clock> clock)
    : config_(validated(config)),
      clock_(clock != nullptr ? std::move(clock) : std::make_shared<SystemClock>()),
      normalizer_(config_),
      composite_(config_),
      alert_state_(config_.alert),
      history_(config_.history_capacity) {}

IngestResult Engine::ingest(const model::raw_sample& sample) {
  std::lock_guard<std::mutex> writer(ingest_mutex_);

  const model::alert_level previous = alert_state_.level();
  if (!timestamp_in_range(sample.timestamp_ms)) {
    return reject(previous, "timestamp out of range");
  }
  if (last_timestamp_ms_.has_value() && sample.timestamp_ms <= *last_timestamp_ms_) {
    return reject(previous, sample.timestamp_ms == *last_timestamp_ms_ ? "duplicate timestamp" : "out-of-order timestamp");
  }

  const std::int64_t evaluation_ms =
      config_.time.source == TimeSource::SAMPLE ? sample.timestamp_ms : clock_->now_ms();
  const derived::normalized_sample normalized = normalizer_.normalize(sample, evaluation_ms);
  const risk::risk_scores scores = composite_.evaluate(normalized.indices);
  const risk::alert_transition transition = alert_state_.step(scores.extended, sample.timestamp_ms);

  auto snapshot = std::make_shared<model::risk_snapshot>();
  snapshot->sequence = next_sequence_++;
  snapshot->timestamp_ms = sample.timestamp_ms;
  snapshot->phase = sample.phase;
  snapshot->indices = normalized.indices;
  snapshot->behavioral_intention = scores.behavioral_intention;
  snapshot->physical_risk = scores.physical;
  snapshot->extended_risk = scores.extended;
  snapshot->level = transition.current;
  snapshot->degraded = normalized.degraded();
  snapshot->degraded_fields = normalized.degraded_fields;
  last_timestamp_ms_ = sample.timestamp_ms;

  IngestResult result{};
  result.status = snapshot->degraded ? IngestStatus::DEGRADED : IngestStatus::ACCEPTED;
  result.previous_level = transition.previous;
  if (result.status == IngestStatus::DEGRADED) {
    result.reason = "substituted or clamped input fields";
  }
  result.snapshot = std::move(snapshot);

  {
    std::lock_guard<std::mutex> publish(publish_mutex_);
    history_.push(result.snapshot);
    latest_ = result.snapshot;
    ++stats_.accepted;
    if (result.status == IngestStatus::DEGRADED) {
      ++stats_.degraded;
    }
    if (transition.changed) {
      ++stats_.transitions;
    }
  }

  return result;
}

IngestResult Engine::reject(const model::alert_level current, std::string reason) {
  {
    std::lock_guard<std::mutex> publish(publish_mutex_);
    ++stats_.rejected;
  }

  IngestResult result{};
  result.status = IngestStatus::REJECTED;
  result.previous_level = current;
  result.reason = std::move(reason);
  return result;
}

model::snapshot_ptr Engine::latest() const {
  std::lock_guard<std::mutex> guard(publish_mutex_);
  return latest_;
}

std::vector<model::snapshot_ptr> Engine::history(const std::size_t k) const {
  std::lock_guard<std::mutex> guard(publish_mutex_);
  return history_.last(k);
}

EngineStats Engine::stats() const {
  std::lock_guard<std::mutex> guard(publish_mutex_);
  return stats_;
}

}  // namespace crowd_ews::core
