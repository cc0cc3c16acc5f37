#include "io/snapshot_json.hpp"

#include <array>
#include <utility>

#include "core/timestamp.hpp"
#include "model/raw_sample.hpp"

namespace crowd_ews::io {
namespace {

constexpr std::array<std::pair<std::uint32_t, const char*>, 7> kFieldNames = {{
    {model::FIELD_TEMPERATURE, "temperature_c"},
    {model::FIELD_HUMIDITY, "humidity_pct"},
    {model::FIELD_DENSITY, "density_p_m2"},
    {model::FIELD_SPEED, "speed_mps"},
    {model::FIELD_ATTITUDE, "attitude"},
    {model::FIELD_SUBJECTIVE_NORM, "subjective_norm"},
    {model::FIELD_PERCEIVED_CONTROL, "perceived_control"},
}};

}  // namespace

std::vector<std::string> degraded_field_names(const std::uint32_t degraded_fields) {
  std::vector<std::string> names;
  for (const auto& [bit, name] : kFieldNames) {
    if ((degraded_fields & bit) != 0U) {
      names.emplace_back(name);
    }
  }
  return names;
}

nlohmann::json to_json(const model::risk_snapshot& snapshot) {
  return nlohmann::json{{"sequence", snapshot.sequence},
                        {"timestamp", core::format_iso8601_ms(snapshot.timestamp_ms)},
                        {"timestamp_ms", snapshot.timestamp_ms},
                        {"phase", snapshot.phase},
                        {"CAI", snapshot.indices.cai},
                        {"CDI", snapshot.indices.cdi},
                        {"THI", snapshot.indices.thi},
                        {"TI", snapshot.indices.ti},
                        {"EI", snapshot.indices.ei},
                        {"ATI", snapshot.indices.ati},
                        {"SNI", snapshot.indices.sni},
                        {"PCI", snapshot.indices.pci},
                        {"BI", snapshot.behavioral_intention},
                        {"Risk", snapshot.physical_risk},
                        {"RiskExtended", snapshot.extended_risk},
                        {"Alert", model::to_string(snapshot.level)},
                        {"degraded", snapshot.degraded},
                        {"degraded_fields", degraded_field_names(snapshot.degraded_fields)}};
}

nlohmann::json to_json(const std::vector<model::snapshot_ptr>& snapshots) {
  nlohmann::json records = nlohmann::json::array();
  for (const auto& snapshot : snapshots) {
    if (snapshot != nullptr) {
      records.push_back(to_json(*snapshot));
    }
  }
  return records;
}

nlohmann::json to_json(const core::IngestResult& result) {
  nlohmann::json out{{"status", core::to_string(result.status)},
                     {"previous_alert", model::to_string(result.previous_level)}};
  if (!result.reason.empty()) {
    out["reason"] = result.reason;
  }
  out["snapshot"] = result.snapshot != nullptr ? to_json(*result.snapshot) : nlohmann::json(nullptr);
  return out;
}

nlohmann::json to_json(const core::EngineStats& stats) {
  return nlohmann::json{{"accepted", stats.accepted},
                        {"degraded", stats.degraded},
                        {"rejected", stats.rejected},
                        {"transitions", stats.transitions}};
}

}  // namespace crowd_ews::io
