#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "auth/permission.hpp"

namespace fleet_hub::auth {

// Read side of the authorization graph. Implementations provide their own locking.
class PermissionSource {
 public:
  virtual ~PermissionSource() = default;

  [[nodiscard]] virtual bool is_superadmin(std::int64_t user_id) const = 0;
  // Levels of every live binding between a group the user belongs to and the agent.
  [[nodiscard]] virtual std::vector<long long> group_binding_levels(std::int64_t user_id,
                                                                    const std::string& agent_id) const = 0;
  [[nodiscard]] virtual std::optional<long long> user_override(std::int64_t user_id,
                                                               const std::string& agent_id) const = 0;
};

class PermissionResolver {
 public:
  explicit PermissionResolver(const PermissionSource& source);

  [[nodiscard]] ResolvedAccess resolve(std::int64_t user_id, const std::string& agent_id) const;

  // Throws AuthorizationError: NO_ACCESS when invisible, INSUFFICIENT_LEVEL when below `required`.
  ResolvedAccess require(std::int64_t user_id, const std::string& agent_id, PermissionLevel required) const;

 private:
  const PermissionSource& source_;
};

}  // namespace fleet_hub::auth
