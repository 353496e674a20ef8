#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace fleet_hub::api {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kAuthenticationFailed = -32001;
constexpr int kInsufficientPermission = -32003;
constexpr int kNotFound = -32004;
constexpr int kTimeout = -32008;
constexpr int kConflict = -32009;
constexpr int kStorageFailure = -32010;

class UnknownMethodError : public std::runtime_error {
 public:
  explicit UnknownMethodError(const std::string& method) : std::runtime_error("method not found: " + method) {}
};

struct JsonRpcError {
  int code;
  std::string message;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;
};

// Throws core::ValidationError on a malformed request.
JsonRpcRequest parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);
nlohmann::json make_notification(const std::string& method, const nlohmann::json& params);

// Stable external code for an exception thrown below the API boundary.
JsonRpcError error_from_exception(const std::exception& ex);

}  // namespace fleet_hub::api
