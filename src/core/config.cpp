#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/timestamp.hpp"

namespace crowd_ews::core {
namespace {

constexpr std::array<const char*, 3> kLevelKeys = {"yellow", "orange", "red"};

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

float parse_float(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  float parsed = 0.0F;
  try {
    parsed = std::stof(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be a number, got '" + value + "'");
  }
  if (consumed != value.size() || !std::isfinite(parsed)) {
    throw std::runtime_error(key + " must be a finite number, got '" + value + "'");
  }
  return parsed;
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  return parsed;
}

std::uint32_t parse_clock_minute(const std::string& key, const std::string& text) {
  const auto colon = text.find(':');
  if (colon == std::string::npos) {
    throw std::runtime_error(key + " expects HH:MM, got '" + text + "'");
  }
  const auto hours = parse_integer(key, trim(text.substr(0, colon)));
  const auto minutes = parse_integer(key, trim(text.substr(colon + 1)));
  if (hours < 0 || hours > 24 || minutes < 0 || minutes > 59 || (hours == 24 && minutes != 0)) {
    throw std::runtime_error(key + " has an out of range time '" + text + "'");
  }
  return static_cast<std::uint32_t>(((hours * 60) + minutes) % 1440);
}

std::vector<PeakWindow> parse_peak_windows(const std::string& key, const std::string& value) {
  std::vector<PeakWindow> windows;
  std::stringstream input(value);
  std::string item;
  while (std::getline(input, item, ',')) {
    item = trim(item);
    if (item.empty()) {
      continue;
    }
    const auto dash = item.find('-');
    if (dash == std::string::npos) {
      throw std::runtime_error(key + " expects HH:MM-HH:MM entries, got '" + item + "'");
    }
    windows.push_back(PeakWindow{.start_minute = parse_clock_minute(key, trim(item.substr(0, dash))),
                                 .end_minute = parse_clock_minute(key, trim(item.substr(dash + 1)))});
  }
  return windows;
}

// "<start>/<end> @ <intensity>" with ISO-8601 bounds.
EventWindow parse_event_window(const std::string& key, const std::string& name, const std::string& value) {
  const auto at = value.find('@');
  const auto slash = value.find('/');
  if (at == std::string::npos || slash == std::string::npos || slash > at) {
    throw std::runtime_error(key + " expects '<start>/<end> @ <intensity>', got '" + value + "'");
  }

  const auto start = parse_iso8601_ms(trim(value.substr(0, slash)));
  const auto end = parse_iso8601_ms(trim(value.substr(slash + 1, at - slash - 1)));
  if (!start.has_value() || !end.has_value()) {
    throw std::runtime_error(key + " has an invalid ISO-8601 bound in '" + value + "'");
  }

  return EventWindow{.name = name,
                     .start_ms = *start,
                     .end_ms = *end,
                     .intensity = parse_float(key, trim(value.substr(at + 1)))};
}

void apply_level_key(std::array<float, 3>& ladder, const std::string& key, const std::string& level,
                     const std::string& value) {
  for (std::size_t i = 0; i < kLevelKeys.size(); ++i) {
    if (level == kLevelKeys[i]) {
      ladder[i] = parse_float(key, value);
      return;
    }
  }
  throw std::runtime_error("unknown alert level in " + key);
}

struct ParseState {
  bool capacity_set{false};
};

void apply_key_value(EngineConfig& config, ParseState& state, const std::string& key, const std::string& value) {
  if (key == "ingest.cadence_s") {
    const auto seconds = parse_integer(key, value);
    if (seconds <= 0) {
      throw std::runtime_error("ingest.cadence_s must be greater than 0");
    }
    config.ingest_cadence = std::chrono::seconds(seconds);
    return;
  }

  if (key == "ingest.replay_interval_ms") {
    const auto interval = parse_integer(key, value);
    if (interval < 0) {
      throw std::runtime_error("ingest.replay_interval_ms must be greater than or equal to 0");
    }
    config.replay_interval = std::chrono::milliseconds(interval);
    return;
  }

  if (key == "history.capacity") {
    const auto capacity = parse_integer(key, value);
    if (capacity <= 0) {
      throw std::runtime_error("history.capacity must be greater than 0");
    }
    config.history_capacity = static_cast<std::size_t>(capacity);
    state.capacity_set = true;
    return;
  }

  if (key == "weights.cai") {
    config.weights.cai = parse_float(key, value);
    return;
  }
  if (key == "weights.cdi") {
    config.weights.cdi = parse_float(key, value);
    return;
  }
  if (key == "weights.thi") {
    config.weights.thi = parse_float(key, value);
    return;
  }
  if (key == "weights.ti") {
    config.weights.ti = parse_float(key, value);
    return;
  }
  if (key == "weights.ei") {
    config.weights.ei = parse_float(key, value);
    return;
  }

  if (key == "behavioral_weights.ati") {
    config.behavioral.ati = parse_float(key, value);
    return;
  }
  if (key == "behavioral_weights.sni") {
    config.behavioral.sni = parse_float(key, value);
    return;
  }
  if (key == "behavioral_weights.pci") {
    config.behavioral.pci = parse_float(key, value);
    return;
  }

  if (key == "blend.physical") {
    config.blend.physical = parse_float(key, value);
    return;
  }
  if (key == "blend.behavioral") {
    config.blend.behavioral = parse_float(key, value);
    return;
  }

  if (key == "alert.policy") {
    const std::string policy = to_lower(value);
    if (policy == "hysteresis") {
      config.alert.policy = AlertPolicy::HYSTERESIS;
    } else if (policy == "dwell") {
      config.alert.policy = AlertPolicy::DWELL;
    } else {
      throw std::runtime_error("alert.policy must be 'hysteresis' or 'dwell'");
    }
    return;
  }
  if (key.rfind("alert.rising.", 0) == 0) {
    apply_level_key(config.alert.rising, key, key.substr(std::string("alert.rising.").size()), value);
    return;
  }
  if (key.rfind("alert.falling.", 0) == 0) {
    apply_level_key(config.alert.falling, key, key.substr(std::string("alert.falling.").size()), value);
    return;
  }
  if (key == "alert.min_hold_s") {
    const auto seconds = parse_integer(key, value);
    if (seconds < 0) {
      throw std::runtime_error("alert.min_hold_s must be greater than or equal to 0");
    }
    config.alert.min_hold = std::chrono::seconds(seconds);
    return;
  }
  if (key == "alert.downgrade_confirm_samples") {
    const auto samples = parse_integer(key, value);
    if (samples < 1) {
      throw std::runtime_error("alert.downgrade_confirm_samples must be at least 1");
    }
    config.alert.downgrade_confirm_samples = static_cast<std::uint32_t>(samples);
    return;
  }

  if (key == "normalizer.thi_comfort") {
    config.normalizer.thi_comfort = parse_float(key, value);
    return;
  }
  if (key == "normalizer.thi_danger") {
    config.normalizer.thi_danger = parse_float(key, value);
    return;
  }
  if (key == "normalizer.free_flow_speed_mps") {
    config.normalizer.free_flow_speed_mps = parse_float(key, value);
    return;
  }
  if (key == "normalizer.critical_density_p_m2") {
    config.normalizer.critical_density_p_m2 = parse_float(key, value);
    return;
  }
  if (key == "normalizer.speed_variance_band") {
    config.normalizer.speed_variance_band = parse_float(key, value);
    return;
  }
  if (key == "normalizer.density_volatility_band") {
    config.normalizer.density_volatility_band = parse_float(key, value);
    return;
  }
  if (key == "normalizer.speed_volatility_band") {
    config.normalizer.speed_volatility_band = parse_float(key, value);
    return;
  }
  if (key == "normalizer.volatility_window") {
    const auto window = parse_integer(key, value);
    if (window < 2) {
      throw std::runtime_error("normalizer.volatility_window must be at least 2");
    }
    config.normalizer.volatility_window = static_cast<std::size_t>(window);
    return;
  }

  if (key == "time.source") {
    const std::string source = to_lower(value);
    if (source == "wall" || source == "wall_clock") {
      config.time.source = TimeSource::WALL_CLOCK;
    } else if (source == "sample") {
      config.time.source = TimeSource::SAMPLE;
    } else {
      throw std::runtime_error("time.source must be 'wall' or 'sample'");
    }
    return;
  }
  if (key == "time.utc_offset_minutes") {
    const auto offset = parse_integer(key, value);
    if (offset < -14 * 60 || offset > 14 * 60) {
      throw std::runtime_error("time.utc_offset_minutes must be within +/-840");
    }
    config.time.utc_offset_minutes = static_cast<std::int32_t>(offset);
    return;
  }
  if (key == "time.base") {
    config.time.base = parse_float(key, value);
    return;
  }
  if (key == "time.peak_gain") {
    config.time.peak_gain = parse_float(key, value);
    return;
  }
  if (key == "time.shoulder_minutes") {
    const auto minutes = parse_integer(key, value);
    if (minutes < 0 || minutes > 720) {
      throw std::runtime_error("time.shoulder_minutes must be in range 0..720");
    }
    config.time.shoulder_minutes = static_cast<std::uint32_t>(minutes);
    return;
  }
  if (key == "time.peak_windows") {
    config.time.peak_windows = parse_peak_windows(key, value);
    return;
  }

  if (key == "events.baseline") {
    config.events.baseline = parse_float(key, value);
    return;
  }
  if (key.rfind("events.", 0) == 0) {
    const std::string name = key.substr(std::string("events.").size());
    config.events.calendar.push_back(parse_event_window(key, name, value));
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto db = parse_integer(key, value);
    if (db < 0 || db > 15) {
      throw std::runtime_error("redis.db must be in range 0..15");
    }
    config.redis.db = static_cast<int>(db);
    return;
  }

  if (key == "redis.connect_timeout_ms") {
    const auto timeout = parse_integer(key, value);
    if (timeout <= 0 || timeout > 60000) {
      throw std::runtime_error("redis.connect_timeout_ms must be in range 1..60000");
    }
    config.redis.connect_timeout_ms = static_cast<std::uint32_t>(timeout);
    return;
  }

  if (key == "redis.address") {
    config.redis.enabled = !value.empty();
    if (value.rfind("unix://", 0) == 0) {
      config.redis.unix_socket = value.substr(std::string("unix://").size());
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    if (!value.empty() && value.front() == '/') {
      config.redis.unix_socket = value;
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    config.redis.unix_socket.clear();
    const auto split = value.find(':');
    if (split == std::string::npos) {
      config.redis.host = value;
      return;
    }

    config.redis.host = value.substr(0, split);
    const auto parsed_port = parse_integer(key, value.substr(split + 1));
    if (parsed_port <= 0 || parsed_port > 65535) {
      throw std::runtime_error("redis.address port must be in range 1..65535");
    }

    config.redis.port = static_cast<std::uint16_t>(parsed_port);
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

void require_weight(const char* name, const float weight) {
  if (!std::isfinite(weight) || weight < 0.0F) {
    throw std::runtime_error(std::string(name) + " must be a non-negative finite weight");
  }
}

void require_unit_sum(const char* group, const float sum) {
  if (std::fabs(sum - 1.0F) > kWeightSumTolerance) {
    std::ostringstream message;
    message << group << " must sum to 1 (got " << sum << ")";
    throw std::runtime_error(message.str());
  }
}

void require_positive(const char* name, const float value) {
  if (!std::isfinite(value) || value <= 0.0F) {
    throw std::runtime_error(std::string(name) + " must be greater than 0");
  }
}

void require_unit(const char* name, const float value) {
  if (!std::isfinite(value) || value < 0.0F || value > 1.0F) {
    throw std::runtime_error(std::string(name) + " must be in range [0, 1]");
  }
}

}  // namespace

std::size_t default_history_capacity(const std::chrono::seconds cadence) {
  if (cadence.count() <= 0) {
    throw std::runtime_error("ingest cadence must be greater than 0");
  }
  const auto per_day = std::chrono::seconds(std::chrono::hours(24)).count() / cadence.count();
  return static_cast<std::size_t>(per_day > 0 ? per_day : 1);
}

void validate_alert_config(const AlertConfig& config) {
  for (std::size_t i = 0; i < config.rising.size(); ++i) {
    const std::string level = kLevelKeys[i];
    if (!std::isfinite(config.rising[i]) || config.rising[i] <= 0.0F || config.rising[i] > 1.0F) {
      throw std::runtime_error("alert.rising." + level + " must be in range (0, 1]");
    }
    if (i > 0 && config.rising[i] <= config.rising[i - 1]) {
      throw std::runtime_error("alert.rising thresholds must be strictly increasing (yellow < orange < red)");
    }
  }

  if (config.policy == AlertPolicy::HYSTERESIS) {
    for (std::size_t i = 0; i < config.falling.size(); ++i) {
      const std::string level = kLevelKeys[i];
      if (!std::isfinite(config.falling[i]) || config.falling[i] < 0.0F) {
        throw std::runtime_error("alert.falling." + level + " must be greater than or equal to 0");
      }
      if (config.falling[i] >= config.rising[i]) {
        throw std::runtime_error("alert.falling." + level + " must be strictly below alert.rising." + level);
      }
      if (i > 0 && config.falling[i] <= config.falling[i - 1]) {
        throw std::runtime_error("alert.falling thresholds must be strictly increasing (yellow < orange < red)");
      }
    }
  } else if (config.min_hold.count() <= 0) {
    throw std::runtime_error("alert.min_hold_s must be greater than 0 for the dwell policy");
  }

  if (config.downgrade_confirm_samples < 1) {
    throw std::runtime_error("alert.downgrade_confirm_samples must be at least 1");
  }
}

void validate_engine_config(const EngineConfig& config) {
  if (config.history_capacity == 0) {
    throw std::runtime_error("history.capacity must be greater than 0");
  }

  require_weight("weights.cai", config.weights.cai);
  require_weight("weights.cdi", config.weights.cdi);
  require_weight("weights.thi", config.weights.thi);
  require_weight("weights.ti", config.weights.ti);
  require_weight("weights.ei", config.weights.ei);
  require_unit_sum("weights", config.weights.cai + config.weights.cdi + config.weights.thi + config.weights.ti +
                                  config.weights.ei);

  require_weight("behavioral_weights.ati", config.behavioral.ati);
  require_weight("behavioral_weights.sni", config.behavioral.sni);
  require_weight("behavioral_weights.pci", config.behavioral.pci);
  require_unit_sum("behavioral_weights", config.behavioral.ati + config.behavioral.sni + config.behavioral.pci);

  require_weight("blend.physical", config.blend.physical);
  require_weight("blend.behavioral", config.blend.behavioral);
  require_unit_sum("blend", config.blend.physical + config.blend.behavioral);

  validate_alert_config(config.alert);

  const auto& normalizer = config.normalizer;
  if (!std::isfinite(normalizer.thi_comfort) || !std::isfinite(normalizer.thi_danger) ||
      normalizer.thi_danger <= normalizer.thi_comfort) {
    throw std::runtime_error("normalizer.thi_danger must be greater than normalizer.thi_comfort");
  }
  require_positive("normalizer.free_flow_speed_mps", normalizer.free_flow_speed_mps);
  require_positive("normalizer.critical_density_p_m2", normalizer.critical_density_p_m2);
  require_positive("normalizer.speed_variance_band", normalizer.speed_variance_band);
  require_positive("normalizer.density_volatility_band", normalizer.density_volatility_band);
  require_positive("normalizer.speed_volatility_band", normalizer.speed_volatility_band);
  if (normalizer.volatility_window < 2) {
    throw std::runtime_error("normalizer.volatility_window must be at least 2");
  }

  require_unit("time.base", config.time.base);
  require_unit("time.peak_gain", config.time.peak_gain);
  for (const auto& window : config.time.peak_windows) {
    if (window.start_minute >= 1440 || window.end_minute >= 1440) {
      throw std::runtime_error("time.peak_windows entries must fall within the day");
    }
    if (window.start_minute == window.end_minute) {
      throw std::runtime_error("time.peak_windows entries must not be empty");
    }
  }

  require_unit("events.baseline", config.events.baseline);
  for (const auto& event : config.events.calendar) {
    if (event.end_ms <= event.start_ms) {
      throw std::runtime_error("events." + event.name + " must end after it starts");
    }
    if (!std::isfinite(event.intensity) || event.intensity < 0.0F || event.intensity > 1.0F) {
      throw std::runtime_error("events." + event.name + " intensity must be in range [0, 1]");
    }
  }
}

EngineConfig load_engine_config(const std::string& path) {
  EngineConfig config{};
  ParseState state{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, state, full_key.str(), value);
  }

  if (!state.capacity_set) {
    config.history_capacity = default_history_capacity(config.ingest_cadence);
  }

  validate_engine_config(config);
  return config;
}

}  // namespace crowd_ews::core
