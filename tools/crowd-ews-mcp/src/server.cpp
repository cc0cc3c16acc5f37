#include "mcp/server.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "mcp/jsonrpc.hpp"

namespace crowd_ews::mcp {

Server::Server(ToolRegistry tools, ResourceRegistry resources)
    : tools_(std::move(tools)), resources_(std::move(resources)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    bool should_respond = true;
    try {
      const auto request = nlohmann::json::parse(line);
      const auto response = handle_request(request, should_respond);
      if (should_respond) {
        out << response.dump() << '\n';
        out.flush();
      }
    } catch (const nlohmann::json::parse_error& ex) {
      err << "crowd-ews-mcp: unparseable request: " << ex.what() << '\n';
      out << make_error_response(nullptr, JsonRpcError{.code = ErrorCode::PARSE_ERROR, .message = "parse error"}).dump()
          << '\n';
      out.flush();
    } catch (const std::exception& ex) {
      err << "crowd-ews-mcp: failed to process request: " << ex.what() << '\n';
      if (should_respond) {
        out << make_error_response(nullptr,
                                   JsonRpcError{.code = ErrorCode::INTERNAL_ERROR, .message = "internal error"})
                   .dump()
            << '\n';
        out.flush();
      }
    }
  }

  return 0;
}

nlohmann::json Server::handle_request(const nlohmann::json& request, bool& should_respond) const {
  nlohmann::json id = nullptr;
  try {
    const auto parsed = parse_request(request);
    should_respond = !parsed.is_notification();
    if (parsed.id.has_value()) {
      id = *parsed.id;
    }

    if (parsed.method == "initialize") {
      return make_result_response(id, handle_initialize(parsed.params));
    }
    if (parsed.method == "tools/list") {
      return make_result_response(id, handle_tools_list());
    }
    if (parsed.method == "tools/call") {
      return make_result_response(id, handle_tools_call(parsed.params));
    }
    if (parsed.method == "resources/list") {
      return make_result_response(id, handle_resources_list());
    }
    if (parsed.method == "resources/read") {
      return make_result_response(id, handle_resources_read(parsed.params));
    }

    return make_error_response(
        id, JsonRpcError{.code = ErrorCode::METHOD_NOT_FOUND, .message = "method not found", .data = parsed.method});
  } catch (const RequestError& ex) {
    if (!should_respond) {
      return {};
    }
    return make_error_response(id, JsonRpcError{.code = ex.code(), .message = ex.what()});
  } catch (const std::invalid_argument& ex) {
    if (!should_respond) {
      return {};
    }
    return make_error_response(id, JsonRpcError{.code = ErrorCode::INVALID_PARAMS, .message = ex.what()});
  }
}

nlohmann::json Server::handle_initialize(const nlohmann::json& params) const {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  return nlohmann::json{{"serverInfo", {{"name", "crowd-ews-mcp"}, {"version", "0.1.0"}}},
                        {"capabilities",
                         {{"tools", nlohmann::json::object()}, {"resources", nlohmann::json::object()}}}};
}

nlohmann::json Server::handle_tools_list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& [_, tool] : tools_) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return nlohmann::json{{"tools", tools}};
}

nlohmann::json Server::handle_tools_call(const nlohmann::json& params) const {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw std::invalid_argument("name must be a string");
  }

  nlohmann::json arguments = nlohmann::json::object();
  const auto args_it = params.find("arguments");
  if (args_it != params.end()) {
    if (!args_it->is_object()) {
      throw std::invalid_argument("arguments must be an object");
    }
    arguments = *args_it;
  }

  const auto tool_it = tools_.find(name_it->get<std::string>());
  if (tool_it == tools_.end()) {
    throw std::invalid_argument("unknown tool");
  }

  return nlohmann::json{{"content", tool_it->second.handler(arguments)}};
}

nlohmann::json Server::handle_resources_list() const {
  nlohmann::json resources = nlohmann::json::array();
  for (const auto& [_, resource] : resources_) {
    resources.push_back(
        {{"uri", resource.uri}, {"name", resource.name}, {"description", resource.description}});
  }
  return nlohmann::json{{"resources", resources}};
}

nlohmann::json Server::handle_resources_read(const nlohmann::json& params) const {
  if (!params.is_object()) {
    throw std::invalid_argument("params must be an object");
  }

  const auto uri_it = params.find("uri");
  if (uri_it == params.end() || !uri_it->is_string()) {
    throw std::invalid_argument("uri must be a string");
  }

  const auto resource_it = resources_.find(uri_it->get<std::string>());
  if (resource_it == resources_.end()) {
    throw std::invalid_argument("unknown resource uri");
  }

  return nlohmann::json{{"uri", resource_it->second.uri}, {"contents", resource_it->second.reader()}};
}

}  // namespace crowd_ews::mcp
