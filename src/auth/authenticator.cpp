#include "auth/authenticator.hpp"

#include <iostream>
#include <utility>

#include "core/errors.hpp"
#include "core/ids.hpp"

namespace fleet_hub::auth {

Authenticator::Authenticator(core::AuthConfig config, AuthStore& store) : config_(std::move(config)), store_(store) {}

void Authenticator::bootstrap() {
  if (config_.superadmin_token.empty()) {
    std::cerr << "[auth] no superadmin token configured; management methods are unreachable\n";
    return;
  }
  const User admin = store_.ensure_superadmin("admin", config_.superadmin_token);
  std::cerr << "[auth] superadmin account ready (user_id=" << admin.id << ")\n";
}

Principal Authenticator::authenticate_user(const std::string& bearer_token) {
  const auto user = store_.find_user_by_token(bearer_token);
  if (!user.has_value()) {
    throw core::AuthenticationError("invalid or missing token");
  }
  return Principal{.user_id = user->id, .username = user->username, .superadmin = user->superadmin};
}

bool Authenticator::authenticate_agent(const std::string& token) const {
  if (!config_.enabled) {
    return true;
  }
  bool matched = false;
  for (const auto& expected : config_.agent_tokens) {
    matched = core::constant_time_equal(expected, token) || matched;
  }
  return matched;
}

ElevatedCredential Authenticator::elevate(const Principal& principal, const std::string& secret,
                                          const std::int64_t now_ms) {
  if (config_.elevation_secret.empty()) {
    throw core::AuthenticationError("elevation is not configured");
  }
  if (!core::constant_time_equal(config_.elevation_secret, secret)) {
    throw core::AuthenticationError("elevation secret rejected");
  }

  const std::int64_t ttl_ms = static_cast<std::int64_t>(config_.elevation_ttl.count()) * 1000;
  ElevatedCredential credential{.token = core::random_hex_id(24), .expires_at_ms = now_ms + ttl_ms};

  std::lock_guard<std::mutex> lock(grants_mutex_);
  purge_expired_locked(now_ms);
  grants_[credential.token] = Grant{.user_id = principal.user_id, .expires_at_ms = credential.expires_at_ms};
  return credential;
}

bool Authenticator::verify_elevated(const Principal& principal, const std::string& credential,
                                    const std::int64_t now_ms) {
  if (credential.empty()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(grants_mutex_);
  purge_expired_locked(now_ms);
  const auto it = grants_.find(credential);
  return it != grants_.end() && it->second.user_id == principal.user_id;
}

void Authenticator::purge_expired_locked(const std::int64_t now_ms) {
  for (auto it = grants_.begin(); it != grants_.end();) {
    if (it->second.expires_at_ms <= now_ms) {
      it = grants_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace fleet_hub::auth
