#include "auth/resolver.hpp"

#include "core/errors.hpp"

namespace fleet_hub::auth {

PermissionResolver::PermissionResolver(const PermissionSource& source) : source_(source) {}

ResolvedAccess PermissionResolver::resolve(const std::int64_t user_id, const std::string& agent_id) const {
  if (source_.is_superadmin(user_id)) {
    return ResolvedAccess{.visible = true, .level = PermissionLevel::SYSTEM_ADMIN};
  }

  // An explicit override replaces the group ceiling in both directions.
  if (const auto override_level = source_.user_override(user_id, agent_id); override_level.has_value()) {
    if (const auto level = permission_level_from_int(*override_level); level.has_value()) {
      return ResolvedAccess{.visible = true, .level = *level};
    }
  }

  std::optional<PermissionLevel> ceiling;
  for (const long long raw : source_.group_binding_levels(user_id, agent_id)) {
    const auto level = permission_level_from_int(raw);
    if (!level.has_value()) {
      continue;
    }
    if (!ceiling.has_value() || static_cast<int>(*level) > static_cast<int>(*ceiling)) {
      ceiling = level;
    }
  }

  if (!ceiling.has_value()) {
    return ResolvedAccess{};
  }
  return ResolvedAccess{.visible = true, .level = *ceiling};
}

ResolvedAccess PermissionResolver::require(const std::int64_t user_id, const std::string& agent_id,
                                           const PermissionLevel required) const {
  const ResolvedAccess access = resolve(user_id, agent_id);
  if (!access.visible) {
    throw core::AuthorizationError(core::AuthorizationReason::NO_ACCESS, "agent not found: " + agent_id);
  }
  if (!access.allows(required)) {
    throw core::AuthorizationError(core::AuthorizationReason::INSUFFICIENT_LEVEL,
                                   std::string("requires ") + permission_level_name(required) +
                                       ", effective level is " + permission_level_name(access.level));
  }
  return access;
}

}  // namespace fleet_hub::auth
