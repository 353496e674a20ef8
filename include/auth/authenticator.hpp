#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "auth/auth_store.hpp"
#include "core/config.hpp"

namespace fleet_hub::auth {

struct Principal {
  std::int64_t user_id{0};
  std::string username{};
  bool superadmin{false};
};

struct ElevatedCredential {
  std::string token{};
  std::int64_t expires_at_ms{0};
};

class Authenticator {
 public:
  Authenticator(core::AuthConfig config, AuthStore& store);

  // Ensures the configured superadmin account exists; no-op without a token.
  void bootstrap();

  Principal authenticate_user(const std::string& bearer_token);
  [[nodiscard]] bool authenticate_agent(const std::string& token) const;

  ElevatedCredential elevate(const Principal& principal, const std::string& secret, std::int64_t now_ms);
  [[nodiscard]] bool verify_elevated(const Principal& principal, const std::string& credential, std::int64_t now_ms);

 private:
  struct Grant {
    std::int64_t user_id{0};
    std::int64_t expires_at_ms{0};
  };

  void purge_expired_locked(std::int64_t now_ms);

  core::AuthConfig config_;
  AuthStore& store_;
  std::mutex grants_mutex_;
  std::unordered_map<std::string, Grant> grants_{};
};

}  // namespace fleet_hub::auth
