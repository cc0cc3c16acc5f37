#include "mcp/jsonrpc.hpp"

#include <stdexcept>

namespace crowd_ews::mcp {

namespace {

bool valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw RequestError(ErrorCode::INVALID_REQUEST, "request must be a JSON object");
  }

  const auto version_it = request.find("jsonrpc");
  if (version_it == request.end() || !version_it->is_string() || *version_it != kJsonRpcVersion) {
    throw RequestError(ErrorCode::INVALID_REQUEST, "jsonrpc must be \"2.0\"");
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    throw RequestError(ErrorCode::INVALID_REQUEST, "method must be a string");
  }

  JsonRpcRequest parsed{.method = method_it->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  const auto id_it = request.find("id");
  if (id_it != request.end()) {
    if (!valid_id(*id_it)) {
      throw RequestError(ErrorCode::INVALID_REQUEST, "id must be a string, an integer or null");
    }
    parsed.id = *id_it;
  }

  const auto params_it = request.find("params");
  if (params_it != request.end() && !params_it->is_null()) {
    if (!params_it->is_object()) {
      throw RequestError(ErrorCode::INVALID_PARAMS, "params must be an object");
    }
    parsed.params = *params_it;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  nlohmann::json body{{"code", static_cast<int>(error.code)}, {"message", error.message}};
  if (error.data.has_value()) {
    body["data"] = *error.data;
  }
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"error", body}};
}

}  // namespace crowd_ews::mcp
