#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "auth/permission.hpp"
#include "auth/resolver.hpp"
#include "core/sqlite.hpp"

namespace fleet_hub::auth {

struct User {
  std::int64_t id{0};
  std::string username{};
  std::string api_token{};
  bool superadmin{false};
  std::int64_t created_at_ms{0};
};

struct Group {
  std::int64_t id{0};
  std::string name{};
  std::string description{};
  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};
};

struct AgentGroupBinding {
  std::string agent_id{};
  std::int64_t group_id{0};
  PermissionLevel level{PermissionLevel::READ_ONLY};
};

struct UserAgentPermission {
  std::int64_t user_id{0};
  std::string agent_id{};
  PermissionLevel level{PermissionLevel::READ_ONLY};
  std::int64_t granted_by{0};
};

// Users, groups, bindings and overrides. Deletes are tombstones (deleted_at); every
// read ignores tombstoned rows.
class AuthStore final : public PermissionSource {
 public:
  explicit AuthStore(core::SqliteDatabase& db);

  void ensure_schema();

  User create_user(const std::string& username, const std::string& api_token, bool superadmin);
  // Creates the user, or promotes and re-keys an existing one with the same name.
  User ensure_superadmin(const std::string& username, const std::string& api_token);
  [[nodiscard]] std::optional<User> find_user(std::int64_t user_id);
  [[nodiscard]] std::optional<User> find_user_by_token(const std::string& api_token);
  [[nodiscard]] std::vector<User> list_users();
  void delete_user(std::int64_t user_id);

  Group create_group(const std::string& name, const std::string& description);
  [[nodiscard]] std::optional<Group> get_group(std::int64_t group_id);
  [[nodiscard]] std::vector<Group> list_groups();
  Group update_group(std::int64_t group_id, const std::string& name, const std::string& description);
  void delete_group(std::int64_t group_id);

  void add_member(std::int64_t group_id, std::int64_t user_id);
  void remove_member(std::int64_t group_id, std::int64_t user_id);
  [[nodiscard]] std::vector<std::int64_t> group_members(std::int64_t group_id);

  void set_binding(const std::string& agent_id, std::int64_t group_id, PermissionLevel level);
  void remove_binding(const std::string& agent_id, std::int64_t group_id);
  [[nodiscard]] std::vector<AgentGroupBinding> group_bindings(std::int64_t group_id);

  void grant_override(std::int64_t user_id, const std::string& agent_id, PermissionLevel level,
                      std::int64_t granted_by);
  void revoke_override(std::int64_t user_id, const std::string& agent_id);
  [[nodiscard]] std::vector<UserAgentPermission> user_overrides(std::int64_t user_id);

  // Agents named by any live binding or override that applies to the user.
  [[nodiscard]] std::vector<std::string> agents_referenced_by(std::int64_t user_id);

  [[nodiscard]] bool is_superadmin(std::int64_t user_id) const override;
  [[nodiscard]] std::vector<long long> group_binding_levels(std::int64_t user_id,
                                                            const std::string& agent_id) const override;
  [[nodiscard]] std::optional<long long> user_override(std::int64_t user_id,
                                                       const std::string& agent_id) const override;

 private:
  void require_user(std::int64_t user_id);
  void require_group(std::int64_t group_id);

  core::SqliteDatabase& db_;
};

}  // namespace fleet_hub::auth
