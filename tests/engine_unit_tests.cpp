#include <atomic>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/engine.hpp"
#include "core/timestamp.hpp"
#include "history/ring_buffer.hpp"
#include "io/sample_json.hpp"
#include "io/snapshot_json.hpp"
#include "model/raw_sample.hpp"
#include "model/risk_snapshot.hpp"

using crowd_ews::core::EngineConfig;
using crowd_ews::core::Engine;
using crowd_ews::core::IngestStatus;
using crowd_ews::core::ManualClock;
using crowd_ews::core::TimeSource;
using crowd_ews::core::format_iso8601_ms;
using crowd_ews::core::kMaxTimestampMs;
using crowd_ews::core::kMinTimestampMs;
using crowd_ews::core::minute_of_day;
using crowd_ews::core::parse_iso8601_ms;
using crowd_ews::history::RingBuffer;
using crowd_ews::model::alert_level;
using crowd_ews::model::raw_sample;
using crowd_ews::model::snapshot_ptr;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

raw_sample calm_sample(std::int64_t timestamp_ms) {
  raw_sample sample{};
  sample.timestamp_ms = timestamp_ms;
  sample.phase = "normal";
  sample.temperature_c = 26.0F;
  sample.humidity_pct = 55.0F;
  sample.density_p_m2 = 1.0F;
  sample.speed_mps = 1.1F;
  sample.attitude = 0.2F;
  sample.subjective_norm = 0.3F;
  sample.perceived_control = 0.8F;
  return sample;
}

raw_sample crush_sample(std::int64_t timestamp_ms) {
  raw_sample sample = calm_sample(timestamp_ms);
  sample.phase = "surge";
  sample.temperature_c = 38.0F;
  sample.humidity_pct = 80.0F;
  sample.density_p_m2 = 6.0F;
  sample.speed_mps = 0.05F;
  sample.attitude = 0.9F;
  sample.subjective_norm = 0.95F;
  sample.perceived_control = 0.9F;
  sample.event_intensity = 1.0F;
  sample.push_rate = 9.0F;
  sample.shout_rate = 18.0F;
  sample.near_falls = 8.0F;
  return sample;
}

EngineConfig sample_time_config() {
  EngineConfig config{};
  config.time.source = TimeSource::SAMPLE;
  return config;
}

int test_ring_buffer_eviction_and_order() {
  RingBuffer<int> buffer(3);
  if (!buffer.empty() || buffer.capacity() != 3) {
    return fail("test_ring_buffer_eviction_and_order", "new buffer should be empty");
  }

  for (int i = 1; i <= 5; ++i) {
    buffer.push(i);
  }
  if (buffer.size() != 3 || !buffer.full() || buffer.front() != 3 || buffer.back() != 5) {
    return fail("test_ring_buffer_eviction_and_order", "oldest elements should be evicted first");
  }

  const auto tail = buffer.last(2);
  if (tail.size() != 2 || tail[0] != 4 || tail[1] != 5) {
    return fail("test_ring_buffer_eviction_and_order", "last(k) should return the newest k oldest-first");
  }
  if (buffer.last(10).size() != 3) {
    return fail("test_ring_buffer_eviction_and_order", "last(k) should be bounded by size");
  }

  bool out_of_range = false;
  try {
    (void)buffer.at(3);
  } catch (const std::out_of_range&) {
    out_of_range = true;
  }
  if (!out_of_range) {
    return fail("test_ring_buffer_eviction_and_order", "at() past size should throw");
  }

  bool zero_capacity = false;
  try {
    RingBuffer<int> invalid(0);
  } catch (const std::invalid_argument&) {
    zero_capacity = true;
  }
  if (!zero_capacity) {
    return fail("test_ring_buffer_eviction_and_order", "zero capacity should throw");
  }

  RingBuffer<snapshot_ptr> snapshots(2);
  const auto oldest = std::make_shared<const crowd_ews::model::risk_snapshot>();
  snapshots.push(oldest);
  snapshots.push(std::make_shared<const crowd_ews::model::risk_snapshot>());
  snapshots.push(std::make_shared<const crowd_ews::model::risk_snapshot>());
  if (oldest.use_count() != 1 || snapshots.size() != 2) {
    return fail("test_ring_buffer_eviction_and_order", "evicted snapshots should be released");
  }

  return 0;
}

int test_engine_rejects_out_of_order_and_duplicates() {
  Engine engine(sample_time_config());

  if (engine.latest() != nullptr) {
    return fail("test_engine_rejects_out_of_order_and_duplicates", "latest should be null before any sample");
  }

  const auto first = engine.ingest(calm_sample(10'000));
  if (first.status != IngestStatus::ACCEPTED || first.snapshot == nullptr || first.snapshot->sequence != 1) {
    return fail("test_engine_rejects_out_of_order_and_duplicates", "first complete sample should be accepted");
  }

  const auto duplicate = engine.ingest(calm_sample(10'000));
  const auto stale = engine.ingest(calm_sample(5'000));
  if (duplicate.status != IngestStatus::REJECTED || stale.status != IngestStatus::REJECTED ||
      duplicate.snapshot != nullptr || stale.reason.empty()) {
    return fail("test_engine_rejects_out_of_order_and_duplicates", "non-increasing timestamps must be rejected");
  }

  if (engine.latest() != first.snapshot || engine.history(10).size() != 1) {
    return fail("test_engine_rejects_out_of_order_and_duplicates", "rejection must leave state untouched");
  }

  const auto next = engine.ingest(calm_sample(20'000));
  if (!next.accepted() || next.snapshot->sequence != 2) {
    return fail("test_engine_rejects_out_of_order_and_duplicates", "sequence should continue after a rejection");
  }

  const auto stats = engine.stats();
  if (stats.accepted != 2 || stats.rejected != 2 || stats.degraded != 0) {
    return fail("test_engine_rejects_out_of_order_and_duplicates", "stats counters mismatch");
  }

  return 0;
}

int test_engine_history_bounded_and_increasing() {
  EngineConfig config = sample_time_config();
  config.history_capacity = 4;
  Engine engine(config);

  for (std::int64_t i = 1; i <= 10; ++i) {
    (void)engine.ingest(calm_sample(i * 300'000));
  }

  const auto history = engine.history(100);
  if (history.size() != 4) {
    return fail("test_engine_history_bounded_and_increasing", "history must not exceed capacity");
  }
  for (std::size_t i = 1; i < history.size(); ++i) {
    if (history[i]->timestamp_ms <= history[i - 1]->timestamp_ms) {
      return fail("test_engine_history_bounded_and_increasing", "history must be strictly increasing");
    }
  }
  if (history.front()->timestamp_ms != 7 * 300'000 || history.back() != engine.latest()) {
    return fail("test_engine_history_bounded_and_increasing", "oldest snapshots should be evicted first");
  }
  if (engine.history(2).size() != 2 || engine.history(0).size() != 0) {
    return fail("test_engine_history_bounded_and_increasing", "history(k) should return min(k, size)");
  }

  return 0;
}

int test_engine_latest_is_idempotent() {
  Engine engine(sample_time_config());
  (void)engine.ingest(calm_sample(1'000));

  const auto a = engine.latest();
  const auto b = engine.latest();
  if (a == nullptr || a != b || a->sequence != b->sequence || a->extended_risk != b->extended_risk) {
    return fail("test_engine_latest_is_idempotent", "latest without ingest must return the identical snapshot");
  }

  return 0;
}

int test_engine_alert_transitions_and_degraded_samples() {
  Engine engine(sample_time_config());

  (void)engine.ingest(calm_sample(1'000));
  if (engine.latest()->level != alert_level::GREEN) {
    return fail("test_engine_alert_transitions_and_degraded_samples", "calm crowd should be green");
  }

  (void)engine.ingest(crush_sample(2'000));
  const auto surge = engine.ingest(crush_sample(3'000));
  if (surge.snapshot->level == alert_level::GREEN || surge.snapshot->extended_risk < 0.6F) {
    return fail("test_engine_alert_transitions_and_degraded_samples", "crush conditions should raise the alert");
  }
  if (engine.stats().transitions == 0) {
    return fail("test_engine_alert_transitions_and_degraded_samples", "transition counter should advance");
  }

  raw_sample partial = crush_sample(4'000);
  partial.density_p_m2.reset();
  partial.speed_mps = -3.0F;
  const auto degraded = engine.ingest(partial);
  if (degraded.status != IngestStatus::DEGRADED || !degraded.snapshot->degraded ||
      (degraded.snapshot->degraded_fields & crowd_ews::model::FIELD_DENSITY) == 0 ||
      (degraded.snapshot->degraded_fields & crowd_ews::model::FIELD_SPEED) == 0) {
    return fail("test_engine_alert_transitions_and_degraded_samples", "defective fields should degrade the snapshot");
  }
  if (engine.stats().degraded != 1) {
    return fail("test_engine_alert_transitions_and_degraded_samples", "degraded counter mismatch");
  }

  const auto& s = *degraded.snapshot;
  const float values[] = {s.indices.cai, s.indices.cdi, s.indices.thi, s.indices.ti, s.indices.ei, s.indices.ati,
                          s.indices.sni, s.indices.pci, s.behavioral_intention, s.physical_risk, s.extended_risk};
  for (const float value : values) {
    if (!(value >= 0.0F && value <= 1.0F)) {
      return fail("test_engine_alert_transitions_and_degraded_samples", "scores must stay within [0, 1]");
    }
  }

  return 0;
}

int test_engine_time_index_uses_injected_clock() {
  auto clock = std::make_shared<ManualClock>();
  Engine engine(EngineConfig{}, clock);

  // 04:00 local (UTC+05:30) is inside the default early-morning peak.
  clock->set(*parse_iso8601_ms("2026-10-18T22:30:00Z"));
  const auto peak = engine.ingest(calm_sample(1'000));
  // 12:00 local.
  clock->advance(8 * 3'600'000);
  const auto midday = engine.ingest(calm_sample(2'000));

  if (std::fabs(peak.snapshot->indices.ti - 0.9F) > 1e-4F || std::fabs(midday.snapshot->indices.ti - 0.1F) > 1e-4F) {
    return fail("test_engine_time_index_uses_injected_clock", "TI should follow the injected clock");
  }

  return 0;
}

int test_engine_rejects_invalid_config() {
  EngineConfig config{};
  config.history_capacity = 0;
  bool threw = false;
  try {
    Engine engine(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_engine_rejects_invalid_config", "zero capacity should be rejected");
  }
  return 0;
}

int test_engine_concurrent_readers_see_consistent_state() {
  EngineConfig config = sample_time_config();
  config.history_capacity = 16;
  Engine engine(config);

  std::atomic<bool> done{false};
  std::atomic<bool> inconsistent{false};

  std::thread reader([&] {
    std::uint64_t last_sequence = 0;
    while (!done.load()) {
      const snapshot_ptr latest = engine.latest();
      const auto history = engine.history(16);
      if (latest != nullptr) {
        if (latest->sequence < last_sequence) {
          inconsistent = true;
        }
        last_sequence = latest->sequence;
        if (history.empty() || history.back()->sequence < latest->sequence) {
          inconsistent = true;
        }
      }
      for (std::size_t i = 1; i < history.size(); ++i) {
        if (history[i]->timestamp_ms <= history[i - 1]->timestamp_ms ||
            history[i]->sequence != history[i - 1]->sequence + 1) {
          inconsistent = true;
        }
      }
    }
  });

  for (std::int64_t i = 1; i <= 2'000; ++i) {
    (void)engine.ingest(i % 7 < 3 ? crush_sample(i * 1'000) : calm_sample(i * 1'000));
  }
  done = true;
  reader.join();

  if (inconsistent.load()) {
    return fail("test_engine_concurrent_readers_see_consistent_state", "reader observed torn history/latest state");
  }
  if (engine.latest()->sequence != 2'000 || engine.history(100).size() != 16) {
    return fail("test_engine_concurrent_readers_see_consistent_state", "final state mismatch");
  }

  return 0;
}

int test_iso8601_parsing_and_formatting() {
  const auto utc = parse_iso8601_ms("2026-10-19T04:30:00Z");
  const auto offset = parse_iso8601_ms("2026-10-19T10:00:00+05:30");
  if (!utc.has_value() || !offset.has_value() || *utc != *offset) {
    return fail("test_iso8601_parsing_and_formatting", "offsets should normalize to UTC");
  }

  const auto fractional = parse_iso8601_ms("1970-01-01 00:00:01.25");
  if (!fractional.has_value() || *fractional != 1'250) {
    return fail("test_iso8601_parsing_and_formatting", "fractional seconds mismatch");
  }

  if (parse_iso8601_ms("2026-02-30T00:00:00Z").has_value() || parse_iso8601_ms("yesterday").has_value() ||
      parse_iso8601_ms("2026-10-19T25:00:00Z").has_value()) {
    return fail("test_iso8601_parsing_and_formatting", "invalid timestamps should not parse");
  }

  if (format_iso8601_ms(1'250) != "1970-01-01T00:00:01.250Z" ||
      format_iso8601_ms(*utc) != "2026-10-19T04:30:00.000Z") {
    return fail("test_iso8601_parsing_and_formatting", "formatting mismatch");
  }

  return 0;
}

int test_sample_json_decoding() {
  const auto sample = crowd_ews::io::parse_raw_sample_line(
      R"({"timestamp":"2026-10-19T10:00:00+05:30","scenario":"procession","temp_c":31.5,"rh":72,)"
      R"("density":3.1,"speed":"slow","ATI":0.4,"SNI":0.6,"PCI":0.5,"push_rate":2})");

  if (sample.timestamp_ms != *parse_iso8601_ms("2026-10-19T04:30:00Z") || sample.phase != "procession") {
    return fail("test_sample_json_decoding", "timestamp or phase alias not decoded");
  }
  if (!sample.temperature_c.has_value() || std::fabs(*sample.temperature_c - 31.5F) > 1e-4F ||
      !sample.humidity_pct.has_value() || !sample.density_p_m2.has_value() || !sample.attitude.has_value()) {
    return fail("test_sample_json_decoding", "aliased measurements not decoded");
  }
  if (sample.speed_mps.has_value()) {
    return fail("test_sample_json_decoding", "ill-typed field should decode as empty");
  }
  if (!sample.push_rate.has_value() || sample.near_falls.has_value()) {
    return fail("test_sample_json_decoding", "optional anxiety signals mismatch");
  }

  const auto epoch = crowd_ews::io::parse_raw_sample(nlohmann::json{{"ts", 1'700'000'000'000LL}});
  if (epoch.timestamp_ms != 1'700'000'000'000LL) {
    return fail("test_sample_json_decoding", "epoch millisecond timestamp not decoded");
  }

  const char* bad_lines[] = {R"({"density":2.0})", R"({"timestamp":"not-a-time"})", "[1,2,3]", "{broken"};
  for (const char* line : bad_lines) {
    bool threw = false;
    try {
      (void)crowd_ews::io::parse_raw_sample_line(line);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    if (!threw) {
      return fail("test_sample_json_decoding", "malformed sample line should throw invalid_argument");
    }
  }

  return 0;
}

bool decode_throws(const nlohmann::json& timestamp) {
  try {
    (void)crowd_ews::io::parse_raw_sample(nlohmann::json{{"timestamp", timestamp}});
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

int test_timestamp_range_limits() {
  if (!decode_throws(std::numeric_limits<std::uint64_t>::max()) ||
      !decode_throws(static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1U) ||
      !decode_throws(std::numeric_limits<std::int64_t>::max()) || !decode_throws(kMaxTimestampMs + 1) ||
      !decode_throws(kMinTimestampMs - 1) || !decode_throws(std::numeric_limits<std::int64_t>::min())) {
    return fail("test_timestamp_range_limits", "timestamps outside years 0001-9999 should be rejected");
  }
  if (decode_throws(kMaxTimestampMs) || decode_throws(kMinTimestampMs) ||
      decode_throws(static_cast<std::uint64_t>(kMaxTimestampMs))) {
    return fail("test_timestamp_range_limits", "boundary timestamps should decode");
  }
  if (format_iso8601_ms(kMaxTimestampMs) != "9999-12-31T23:59:59.999Z" ||
      format_iso8601_ms(kMinTimestampMs) != "0001-01-01T00:00:00.000Z") {
    return fail("test_timestamp_range_limits", "boundary timestamps should format as calendar dates");
  }
  if (parse_iso8601_ms("0000-12-31T23:59:59Z").has_value() ||
      parse_iso8601_ms("9999-12-31T23:59:59-01:00").has_value() ||
      parse_iso8601_ms("0001-01-01T00:00:00+01:00").has_value()) {
    return fail("test_timestamp_range_limits", "ISO-8601 text resolving outside the range should not parse");
  }

  // INT64_MAX is 07:12 UTC into its day; +05:30 gives 12:42.
  if (minute_of_day(std::numeric_limits<std::int64_t>::max(), 330) != 762 ||
      minute_of_day(kMinTimestampMs, -330) != 1110) {
    return fail("test_timestamp_range_limits", "minute of day should stay exact at the int64 limits");
  }

  Engine engine(sample_time_config());
  const auto overflow = engine.ingest(calm_sample(std::numeric_limits<std::int64_t>::max()));
  if (overflow.status != IngestStatus::REJECTED || overflow.reason != "timestamp out of range") {
    return fail("test_timestamp_range_limits", "engine should reject out-of-range sample timestamps");
  }
  const auto last_day = engine.ingest(calm_sample(kMaxTimestampMs));
  if (!last_day.accepted() || engine.stats().rejected != 1) {
    return fail("test_timestamp_range_limits", "last representable millisecond should be accepted");
  }

  return 0;
}

int test_snapshot_json_encoding() {
  Engine engine(sample_time_config());
  raw_sample partial = calm_sample(*parse_iso8601_ms("2026-10-19T04:30:00Z"));
  partial.humidity_pct.reset();
  const auto result = engine.ingest(partial);

  const auto encoded = crowd_ews::io::to_json(*result.snapshot);
  for (const char* field : {"CAI", "CDI", "THI", "TI", "EI", "ATI", "SNI", "PCI", "BI", "Risk", "RiskExtended", "Alert"}) {
    if (!encoded.contains(field)) {
      return fail("test_snapshot_json_encoding", "snapshot field missing");
    }
  }
  if (encoded.at("timestamp") != "2026-10-19T04:30:00.000Z" || encoded.at("Alert") != "green" ||
      encoded.at("degraded") != true || encoded.at("degraded_fields") != nlohmann::json::array({"humidity_pct"})) {
    return fail("test_snapshot_json_encoding", "snapshot values mismatch");
  }

  const auto rejected = crowd_ews::io::to_json(engine.ingest(calm_sample(0)));
  if (rejected.at("status") != "rejected" || !rejected.at("snapshot").is_null() || !rejected.contains("reason")) {
    return fail("test_snapshot_json_encoding", "rejected result encoding mismatch");
  }

  const auto listed = crowd_ews::io::to_json(engine.history(5));
  if (!listed.is_array() || listed.size() != 1) {
    return fail("test_snapshot_json_encoding", "history encoding mismatch");
  }

  const auto stats = crowd_ews::io::to_json(engine.stats());
  if (stats.at("accepted") != 1 || stats.at("degraded") != 1 || stats.at("rejected") != 1) {
    return fail("test_snapshot_json_encoding", "stats encoding mismatch");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_ring_buffer_eviction_and_order(); rc != 0) return rc;
  if (int rc = test_engine_rejects_out_of_order_and_duplicates(); rc != 0) return rc;
  if (int rc = test_engine_history_bounded_and_increasing(); rc != 0) return rc;
  if (int rc = test_engine_latest_is_idempotent(); rc != 0) return rc;
  if (int rc = test_engine_alert_transitions_and_degraded_samples(); rc != 0) return rc;
  if (int rc = test_engine_time_index_uses_injected_clock(); rc != 0) return rc;
  if (int rc = test_engine_rejects_invalid_config(); rc != 0) return rc;
  if (int rc = test_engine_concurrent_readers_see_consistent_state(); rc != 0) return rc;
  if (int rc = test_iso8601_parsing_and_formatting(); rc != 0) return rc;
  if (int rc = test_sample_json_decoding(); rc != 0) return rc;
  if (int rc = test_timestamp_range_limits(); rc != 0) return rc;
  if (int rc = test_snapshot_json_encoding(); rc != 0) return rc;

  std::cout << "[PASS] engine unit tests\n";
  return 0;
}
