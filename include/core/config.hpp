#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crowd_ews::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::uint32_t connect_timeout_ms{1000};
  std::string key_prefix{"ews:zone"};
  bool enabled{false};
};

// DANP limit weights over the physical indices.
struct PhysicalWeights {
  float cai{0.18841F};
  float cdi{0.22613F};
  float thi{0.12954F};
  float ti{0.21530F};
  float ei{0.24063F};
};

struct BehavioralWeights {
  float ati{0.3F};
  float sni{0.5F};
  float pci{0.2F};
};

struct BlendWeights {
  float physical{0.6F};
  float behavioral{0.4F};
};

enum class AlertPolicy : std::uint8_t {
  HYSTERESIS = 0,
  DWELL = 1,
};

struct AlertConfig {
  AlertPolicy policy{AlertPolicy::HYSTERESIS};
  // Indexed YELLOW, ORANGE, RED.
  std::array<float, 3> rising{0.40F, 0.60F, 0.75F};
  std::array<float, 3> falling{0.35F, 0.55F, 0.70F};
  std::chrono::milliseconds min_hold{std::chrono::minutes(10)};
  std::uint32_t downgrade_confirm_samples{1};
};

struct NormalizerConfig {
  float thi_comfort{22.0F};
  float thi_danger{32.0F};
  float free_flow_speed_mps{1.2F};
  float critical_density_p_m2{3.5F};
  float speed_variance_band{0.5F};
  float density_volatility_band{0.5F};
  float speed_volatility_band{0.2F};
  std::size_t volatility_window{6};
};

// [start_minute, end_minute) of the local day; start > end wraps past midnight.
struct PeakWindow {
  std::uint32_t start_minute{0};
  std::uint32_t end_minute{0};
};

enum class TimeSource : std::uint8_t {
  WALL_CLOCK = 0,
  SAMPLE = 1,
};

struct TimeConfig {
  TimeSource source{TimeSource::WALL_CLOCK};
  std::int32_t utc_offset_minutes{330};
  float base{0.1F};
  float peak_gain{0.8F};
  std::uint32_t shoulder_minutes{60};
  std::vector<PeakWindow> peak_windows{{180, 360}, {360, 600}, {1020, 1200}};
};

struct EventWindow {
  std::string name{};
  std::int64_t start_ms{0};
  std::int64_t end_ms{0};
  float intensity{0.0F};
};

struct EventConfig {
  float baseline{0.2F};
  std::vector<EventWindow> calendar{};
};

struct EngineConfig {
  std::chrono::seconds ingest_cadence{300};
  std::size_t history_capacity{288};
  PhysicalWeights weights{};
  BehavioralWeights behavioral{};
  BlendWeights blend{};
  AlertConfig alert{};
  NormalizerConfig normalizer{};
  TimeConfig time{};
  EventConfig events{};
  std::chrono::milliseconds replay_interval{0};
  bool stdout_debug{true};
  RedisConfig redis{};
};

inline constexpr float kWeightSumTolerance = 1e-3F;

// 24 hours of snapshots at the given cadence.
std::size_t default_history_capacity(std::chrono::seconds cadence);

EngineConfig load_engine_config(const std::string& path);

// Throws std::runtime_error describing the first inconsistency found.
void validate_engine_config(const EngineConfig& config);
void validate_alert_config(const AlertConfig& config);

}  // namespace crowd_ews::core
