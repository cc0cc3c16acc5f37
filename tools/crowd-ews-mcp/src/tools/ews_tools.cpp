#include "mcp/tools.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/config.hpp"
#include "io/sample_json.hpp"
#include "io/snapshot_json.hpp"

namespace crowd_ews::mcp {

namespace {

constexpr std::int64_t kDefaultHistoryCount = 288;

nlohmann::json handle_ingest(core::Engine& engine, const nlohmann::json& params) {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  const auto sample_it = params.find("sample");
  if (sample_it == params.end() || !sample_it->is_object()) {
    throw std::invalid_argument("sample must be an object");
  }

  const auto result = engine.ingest(io::parse_raw_sample(*sample_it));
  return nlohmann::json{{"tool", "ews.ingest"}, {"result", io::to_json(result)}};
}

nlohmann::json handle_status(const core::Engine& engine, const nlohmann::json& params) {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  const auto latest = engine.latest();
  return nlohmann::json{{"tool", "ews.status"},
                        {"latest", latest != nullptr ? io::to_json(*latest) : nlohmann::json(nullptr)},
                        {"stats", io::to_json(engine.stats())}};
}

nlohmann::json handle_history(const core::Engine& engine, const nlohmann::json& params) {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  std::int64_t count = kDefaultHistoryCount;
  const auto n_it = params.find("n");
  if (n_it != params.end()) {
    if (!n_it->is_number_integer()) {
      throw std::invalid_argument("n must be an integer");
    }
    count = n_it->get<std::int64_t>();
    if (count < 0) {
      throw std::invalid_argument("n must not be negative");
    }
  }

  const auto snapshots = engine.history(static_cast<std::size_t>(count));
  return nlohmann::json{{"tool", "ews.history"}, {"count", snapshots.size()}, {"snapshots", io::to_json(snapshots)}};
}

const char* policy_name(const core::AlertPolicy policy) {
  return policy == core::AlertPolicy::HYSTERESIS ? "hysteresis" : "dwell";
}

nlohmann::json read_thresholds(const core::Engine& engine) {
  const auto& alert = engine.config().alert;
  nlohmann::json thresholds{{"policy", policy_name(alert.policy)},
                            {"rising", {{"yellow", alert.rising[0]}, {"orange", alert.rising[1]}, {"red", alert.rising[2]}}},
                            {"downgrade_confirm_samples", alert.downgrade_confirm_samples}};
  if (alert.policy == core::AlertPolicy::HYSTERESIS) {
    thresholds["falling"] = {{"yellow", alert.falling[0]}, {"orange", alert.falling[1]}, {"red", alert.falling[2]}};
  } else {
    thresholds["min_hold_ms"] = alert.min_hold.count();
  }
  return thresholds;
}

nlohmann::json read_snapshot_schema() {
  return nlohmann::json{
      {"fields",
       {"sequence", "timestamp", "timestamp_ms", "phase", "CAI", "CDI", "THI", "TI", "EI", "ATI", "SNI", "PCI", "BI",
        "Risk", "RiskExtended", "Alert", "degraded", "degraded_fields"}},
      {"alert_levels", {"green", "yellow", "orange", "red"}}};
}

}  // namespace

ToolRegistry build_tool_registry(std::shared_ptr<core::Engine> engine) {
  if (engine == nullptr) {
    throw std::invalid_argument("engine must not be null");
  }

  ToolRegistry registry;

  Tool ingest{.name = "ews.ingest",
              .description = "Ingest one crowd sensor sample and return the resulting risk snapshot.",
              .input_schema = nlohmann::json{{"type", "object"},
                                             {"properties", {{"sample", {{"type", "object"}}}}},
                                             {"required", {"sample"}},
                                             {"additionalProperties", false}},
              .handler = [engine](const nlohmann::json& params) { return handle_ingest(*engine, params); }};

  Tool status{.name = "ews.status",
              .description = "Latest risk snapshot with alert level and ingest counters.",
              .input_schema = nlohmann::json{{"type", "object"},
                                             {"properties", nlohmann::json::object()},
                                             {"additionalProperties", false}},
              .handler = [engine](const nlohmann::json& params) { return handle_status(*engine, params); }};

  Tool history{.name = "ews.history",
               .description = "Most recent risk snapshots, oldest first.",
               .input_schema = nlohmann::json{{"type", "object"},
                                              {"properties", {{"n", {{"type", "integer"}, {"minimum", 0}}}}},
                                              {"additionalProperties", false}},
               .handler = [engine](const nlohmann::json& params) { return handle_history(*engine, params); }};

  registry.emplace(ingest.name, std::move(ingest));
  registry.emplace(status.name, std::move(status));
  registry.emplace(history.name, std::move(history));
  return registry;
}

ResourceRegistry build_resource_registry(std::shared_ptr<const core::Engine> engine) {
  if (engine == nullptr) {
    throw std::invalid_argument("engine must not be null");
  }

  ResourceRegistry registry;

  Resource thresholds{.uri = "ews://config/thresholds",
                      .name = "Alert Thresholds",
                      .description = "Alert policy and band thresholds in effect",
                      .reader = [engine] { return read_thresholds(*engine); }};
  Resource schema{.uri = "ews://schema/snapshot",
                  .name = "Snapshot Schema",
                  .description = "Fields of a published risk snapshot",
                  .reader = [] { return read_snapshot_schema(); }};

  registry.emplace(thresholds.uri, std::move(thresholds));
  registry.emplace(schema.uri, std::move(schema));
  return registry;
}

}  // namespace crowd_ews::mcp
