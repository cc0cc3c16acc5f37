#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "core/agent.hpp"
#include "core/config.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const crowd_ews::core::EngineConfig& config, const std::string& config_path) {
  const auto& alert = config.alert;
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | cadence_s=" << config.ingest_cadence.count()
         << " | history_capacity=" << config.history_capacity
         << " | weights(cai,cdi,thi,ti,ei)=" << config.weights.cai << ',' << config.weights.cdi << ','
         << config.weights.thi << ',' << config.weights.ti << ',' << config.weights.ei
         << " | behavioral(ati,sni,pci)=" << config.behavioral.ati << ',' << config.behavioral.sni << ','
         << config.behavioral.pci
         << " | blend=" << config.blend.physical << '/' << config.blend.behavioral
         << " | alert_policy="
         << (alert.policy == crowd_ews::core::AlertPolicy::HYSTERESIS ? "hysteresis" : "dwell")
         << " | rising=" << alert.rising[0] << '/' << alert.rising[1] << '/' << alert.rising[2];
  if (alert.policy == crowd_ews::core::AlertPolicy::HYSTERESIS) {
    output << " | falling=" << alert.falling[0] << '/' << alert.falling[1] << '/' << alert.falling[2];
  } else {
    output << " | min_hold_ms=" << alert.min_hold.count();
  }
  output << " | time_source=" << (config.time.source == crowd_ews::core::TimeSource::SAMPLE ? "sample" : "wall")
         << " | events=" << config.events.calendar.size()
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/engine.default.yaml";
  const std::string feed_path = argc > 2 ? argv[2] : "-";

  crowd_ews::core::EngineConfig config{};
  try {
    config = crowd_ews::core::load_engine_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::ifstream feed_file;
  if (feed_path != "-") {
    feed_file.open(feed_path);
    if (!feed_file.is_open()) {
      std::cerr << "[agent] unable to open sample feed: " << feed_path << '\n';
      return 1;
    }
  }
  std::istream& feed = feed_path == "-" ? std::cin : feed_file;

  crowd_ews::core::Agent agent{config};
  const auto stats = agent.run(feed, [] { return g_shutdown_requested != 0; });

  if (g_shutdown_requested != 0) {
    std::cerr << "[agent] shutdown signal received; exiting cleanly\n";
  }
  std::cerr << "[agent] lines=" << stats.lines_read << " accepted=" << stats.accepted
            << " degraded=" << stats.degraded << " rejected=" << stats.rejected
            << " decode_failures=" << stats.decode_failures << " transitions=" << stats.transitions
            << " redis_errors=" << stats.redis_errors << " max_redis_latency_ms=" << stats.max_redis_latency_ms
            << '\n';

  return 0;
}
