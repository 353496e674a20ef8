#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fleet_hub::core {

enum class ErrorKind : std::uint8_t {
  AUTHENTICATION = 0,
  AUTHORIZATION = 1,
  NOT_FOUND = 2,
  VALIDATION = 3,
  STORAGE = 4,
  TIMEOUT = 5,
  CONFLICT = 6,
};

const char* error_kind_name(ErrorKind kind) noexcept;

class HubError : public std::runtime_error {
 public:
  HubError(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

class AuthenticationError : public HubError {
 public:
  explicit AuthenticationError(const std::string& message) : HubError(ErrorKind::AUTHENTICATION, message) {}
};

// NO_ACCESS is reported to clients exactly like a missing agent.
enum class AuthorizationReason : std::uint8_t {
  NO_ACCESS = 0,
  INSUFFICIENT_LEVEL = 1,
};

class AuthorizationError : public HubError {
 public:
  AuthorizationError(AuthorizationReason reason, const std::string& message)
      : HubError(ErrorKind::AUTHORIZATION, message), reason_(reason) {}

  [[nodiscard]] AuthorizationReason reason() const noexcept { return reason_; }

 private:
  AuthorizationReason reason_;
};

class NotFoundError : public HubError {
 public:
  explicit NotFoundError(const std::string& message) : HubError(ErrorKind::NOT_FOUND, message) {}
};

class ValidationError : public HubError {
 public:
  explicit ValidationError(const std::string& message) : HubError(ErrorKind::VALIDATION, message) {}
};

class StorageError : public HubError {
 public:
  explicit StorageError(const std::string& message) : HubError(ErrorKind::STORAGE, message) {}
};

// Columnar writes go out family by family; the families that did land stay written.
class PartialWriteError : public StorageError {
 public:
  PartialWriteError(const std::string& message, std::vector<std::string> failed_families)
      : StorageError(message), failed_families_(std::move(failed_families)) {}

  [[nodiscard]] const std::vector<std::string>& failed_families() const noexcept { return failed_families_; }

 private:
  std::vector<std::string> failed_families_;
};

class TimeoutError : public HubError {
 public:
  explicit TimeoutError(const std::string& message) : HubError(ErrorKind::TIMEOUT, message) {}
};

class ConflictError : public HubError {
 public:
  explicit ConflictError(const std::string& message) : HubError(ErrorKind::CONFLICT, message) {}
};

}  // namespace fleet_hub::core
