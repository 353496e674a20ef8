#include "api/jsonrpc.hpp"

#include <stdexcept>

#include "core/errors.hpp"

namespace fleet_hub::api {

namespace {

void validate_id(const nlohmann::json& id) {
  if (id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned()) {
    return;
  }
  throw core::ValidationError("JSON-RPC id must be string, integer, or null");
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw core::ValidationError("Request must be a JSON object");
  }

  const auto jsonrpc_it = request.find("jsonrpc");
  if (jsonrpc_it == request.end() || !jsonrpc_it->is_string() || *jsonrpc_it != kJsonRpcVersion) {
    throw core::ValidationError("jsonrpc must be \"2.0\"");
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    throw core::ValidationError("method must be a string");
  }

  JsonRpcRequest parsed{.method = method_it->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  const auto params_it = request.find("params");
  if (params_it != request.end() && !params_it->is_null()) {
    if (!params_it->is_object() && !params_it->is_array()) {
      throw core::ValidationError("params must be an object or an array");
    }
    parsed.params = *params_it;
  }

  const auto id_it = request.find("id");
  if (id_it != request.end()) {
    validate_id(*id_it);
    parsed.id = *id_it;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                        {"id", id},
                        {"error", {{"code", error.code}, {"message", error.message}}}};
}

nlohmann::json make_notification(const std::string& method, const nlohmann::json& params) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"method", method}, {"params", params}};
}

JsonRpcError error_from_exception(const std::exception& ex) {
  if (dynamic_cast<const UnknownMethodError*>(&ex) != nullptr) {
    return JsonRpcError{.code = kMethodNotFound, .message = ex.what()};
  }
  const auto* hub_error = dynamic_cast<const core::HubError*>(&ex);
  if (hub_error == nullptr) {
    if (dynamic_cast<const std::invalid_argument*>(&ex) != nullptr) {
      return JsonRpcError{.code = kInvalidParams, .message = ex.what()};
    }
    return JsonRpcError{.code = kInternalError, .message = "internal error"};
  }

  switch (hub_error->kind()) {
    case core::ErrorKind::AUTHENTICATION:
      return JsonRpcError{.code = kAuthenticationFailed, .message = ex.what()};
    case core::ErrorKind::AUTHORIZATION: {
      const auto& denied = static_cast<const core::AuthorizationError&>(*hub_error);
      if (denied.reason() == core::AuthorizationReason::NO_ACCESS) {
        return JsonRpcError{.code = kNotFound, .message = ex.what()};
      }
      return JsonRpcError{.code = kInsufficientPermission, .message = ex.what()};
    }
    case core::ErrorKind::NOT_FOUND:
      return JsonRpcError{.code = kNotFound, .message = ex.what()};
    case core::ErrorKind::VALIDATION:
      return JsonRpcError{.code = kInvalidParams, .message = ex.what()};
    case core::ErrorKind::STORAGE:
      return JsonRpcError{.code = kStorageFailure, .message = ex.what()};
    case core::ErrorKind::TIMEOUT:
      return JsonRpcError{.code = kTimeout, .message = ex.what()};
    case core::ErrorKind::CONFLICT:
      return JsonRpcError{.code = kConflict, .message = ex.what()};
  }
  return JsonRpcError{.code = kInternalError, .message = "internal error"};
}

}  // namespace fleet_hub::api
