#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "model/risk_snapshot.hpp"

struct redisContext;

namespace crowd_ews::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"ews:zone"};
  std::uint32_t connect_timeout_ms{1000};
  std::vector<std::string> enabled_metrics{};
};

// Write-only export of snapshots to RedisTimeSeries, one series per metric,
// stamped with the sample timestamp.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  bool publish(const model::risk_snapshot& snapshot);

  [[nodiscard]] float last_latency_ms() const noexcept { return last_latency_ms_; }

  static const std::vector<std::string>& default_metric_suffixes();

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_schema();
  bool publish_impl(const model::risk_snapshot& snapshot);
  void reserve_command_buffers();

  RedisTsOptions options_;
  std::vector<std::string> enabled_metrics_;
  std::unordered_set<std::string> enabled_metric_set_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
  float last_latency_ms_{0.0F};
};

}  // namespace crowd_ews::sinks
