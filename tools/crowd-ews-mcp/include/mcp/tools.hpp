#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "core/engine.hpp"

namespace crowd_ews::mcp {

struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  std::function<nlohmann::json(const nlohmann::json&)> handler;
};

using ToolRegistry = std::unordered_map<std::string, Tool>;

struct Resource {
  std::string uri;
  std::string name;
  std::string description;
  std::function<nlohmann::json()> reader;
};

using ResourceRegistry = std::unordered_map<std::string, Resource>;

// ews.ingest, ews.status and ews.history, all bound to the same engine.
ToolRegistry build_tool_registry(std::shared_ptr<core::Engine> engine);

// ews://config/thresholds and ews://schema/snapshot.
ResourceRegistry build_resource_registry(std::shared_ptr<const core::Engine> engine);

}  // namespace crowd_ews::mcp
