#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace crowd_ews::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

enum class ErrorCode : int {
  PARSE_ERROR = -32700,
  INVALID_REQUEST = -32600,
  METHOD_NOT_FOUND = -32601,
  INVALID_PARAMS = -32602,
  INTERNAL_ERROR = -32603,
};

struct JsonRpcError {
  ErrorCode code;
  std::string message;
  std::optional<nlohmann::json> data{};
};

// Raised while validating the envelope; carries the code to answer with.
class RequestError : public std::invalid_argument {
 public:
  RequestError(ErrorCode code, const std::string& message) : std::invalid_argument(message), code_(code) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  [[nodiscard]] bool is_notification() const noexcept { return !id.has_value(); }
};

// Params are always by-name here; positional arrays are rejected.
JsonRpcRequest parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace crowd_ews::mcp
