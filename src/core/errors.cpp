#include "core/errors.hpp"

namespace fleet_hub::core {

const char* error_kind_name(const ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::AUTHENTICATION:
      return "authentication";
    case ErrorKind::AUTHORIZATION:
      return "authorization";
    case ErrorKind::NOT_FOUND:
      return "not_found";
    case ErrorKind::VALIDATION:
      return "validation";
    case ErrorKind::STORAGE:
      return "storage";
    case ErrorKind::TIMEOUT:
      return "timeout";
    case ErrorKind::CONFLICT:
      return "conflict";
  }
  return "unknown";
}

}  // namespace fleet_hub::core
