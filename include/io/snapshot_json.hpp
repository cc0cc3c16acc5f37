#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/engine.hpp"
#include "model/risk_snapshot.hpp"

namespace crowd_ews::io {

std::vector<std::string> degraded_field_names(std::uint32_t degraded_fields);

// Field names follow the dashboard records: CAI..PCI, BI, Risk (physical),
// RiskExtended, Alert.
nlohmann::json to_json(const model::risk_snapshot& snapshot);
nlohmann::json to_json(const std::vector<model::snapshot_ptr>& snapshots);
nlohmann::json to_json(const core::IngestResult& result);
nlohmann::json to_json(const core::EngineStats& stats);

}  // namespace crowd_ews::io
