#include "io/sample_json.hpp"

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/timestamp.hpp"

namespace crowd_ews::io {
namespace {

const nlohmann::json* find_first(const nlohmann::json& document, std::initializer_list<const char*> names) {
  for (const char* name : names) {
    const auto it = document.find(name);
    if (it != document.end()) {
      return &*it;
    }
  }
  return nullptr;
}

std::optional<float> optional_number(const nlohmann::json& document, std::initializer_list<const char*> names) {
  const nlohmann::json* value = find_first(document, names);
  if (value == nullptr || !value->is_number()) {
    return std::nullopt;
  }
  const auto number = value->get<double>();
  if (!std::isfinite(number)) {
    return std::nullopt;
  }
  return static_cast<float>(number);
}

std::int64_t required_timestamp(const nlohmann::json& document) {
  const nlohmann::json* value = find_first(document, {"timestamp", "ts"});
  if (value == nullptr) {
    throw std::invalid_argument("sample is missing timestamp");
  }

  if (value->is_number_unsigned()) {
    const auto raw = value->get<std::uint64_t>();
    if (raw > static_cast<std::uint64_t>(core::kMaxTimestampMs)) {
      throw std::invalid_argument("sample timestamp out of range: " + std::to_string(raw));
    }
    return static_cast<std::int64_t>(raw);
  }
  if (value->is_number_integer()) {
    const auto raw = value->get<std::int64_t>();
    if (!core::timestamp_in_range(raw)) {
      throw std::invalid_argument("sample timestamp out of range: " + std::to_string(raw));
    }
    return raw;
  }
  if (value->is_string()) {
    const auto parsed = core::parse_iso8601_ms(value->get_ref<const std::string&>());
    if (!parsed.has_value()) {
      throw std::invalid_argument("sample timestamp is not ISO-8601: " + value->get<std::string>());
    }
    return *parsed;
  }

  throw std::invalid_argument("sample timestamp must be an ISO-8601 string or epoch milliseconds");
}

}  // namespace

model::raw_sample parse_raw_sample(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw std::invalid_argument("sample must be a JSON object");
  }

  model::raw_sample sample{};
  sample.timestamp_ms = required_timestamp(document);

  if (const nlohmann::json* phase = find_first(document, {"phase", "scenario"}); phase != nullptr && phase->is_string()) {
    sample.phase = phase->get<std::string>();
  }

  sample.temperature_c = optional_number(document, {"temperature_c", "temp_c"});
  sample.humidity_pct = optional_number(document, {"humidity_pct", "rh"});
  sample.density_p_m2 = optional_number(document, {"density_p_m2", "density"});
  sample.speed_mps = optional_number(document, {"speed_mps", "speed"});

  sample.attitude = optional_number(document, {"attitude", "ATI"});
  sample.subjective_norm = optional_number(document, {"subjective_norm", "SNI"});
  sample.perceived_control = optional_number(document, {"perceived_control", "PCI"});

  sample.speed_variance = optional_number(document, {"speed_variance", "speed_var"});
  sample.push_rate = optional_number(document, {"push_rate"});
  sample.shout_rate = optional_number(document, {"shout_rate"});
  sample.near_falls = optional_number(document, {"near_falls"});
  sample.event_intensity = optional_number(document, {"event_intensity"});

  return sample;
}

model::raw_sample parse_raw_sample_line(const std::string& line) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::invalid_argument(std::string("malformed sample JSON: ") + ex.what());
  }
  return parse_raw_sample(document);
}

}  // namespace crowd_ews::io
