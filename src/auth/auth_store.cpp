#include "auth/auth_store.hpp"

#include <set>

#include "core/errors.hpp"
#include "core/timestamp.hpp"

namespace fleet_hub::auth {
namespace {

constexpr const char* kCreateUsersTable =
    "CREATE TABLE IF NOT EXISTS users ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    username TEXT NOT NULL,"
    "    api_token TEXT NOT NULL,"
    "    is_superadmin INTEGER NOT NULL DEFAULT 0,"
    "    created_at INTEGER NOT NULL,"
    "    deleted_at INTEGER"
    ");";

constexpr const char* kCreateGroupsTable =
    "CREATE TABLE IF NOT EXISTS groups ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    name TEXT NOT NULL,"
    "    description TEXT NOT NULL DEFAULT '',"
    "    created_at INTEGER NOT NULL,"
    "    updated_at INTEGER NOT NULL,"
    "    deleted_at INTEGER"
    ");";

constexpr const char* kCreateUserGroupsTable =
    "CREATE TABLE IF NOT EXISTS user_groups ("
    "    user_id INTEGER NOT NULL,"
    "    group_id INTEGER NOT NULL,"
    "    created_at INTEGER NOT NULL,"
    "    deleted_at INTEGER"
    ");";

constexpr const char* kCreateAgentGroupsTable =
    "CREATE TABLE IF NOT EXISTS agent_groups ("
    "    agent_id TEXT NOT NULL,"
    "    group_id INTEGER NOT NULL,"
    "    permission_level INTEGER NOT NULL,"
    "    created_at INTEGER NOT NULL,"
    "    deleted_at INTEGER"
    ");";

constexpr const char* kCreateUserAgentPermissionsTable =
    "CREATE TABLE IF NOT EXISTS user_agent_permissions ("
    "    user_id INTEGER NOT NULL,"
    "    agent_id TEXT NOT NULL,"
    "    permission_level INTEGER NOT NULL,"
    "    granted_by INTEGER NOT NULL,"
    "    created_at INTEGER NOT NULL,"
    "    deleted_at INTEGER"
    ");";

constexpr const char* kCreateIndexes =
    "CREATE INDEX IF NOT EXISTS idx_user_groups_user ON user_groups(user_id, deleted_at);"
    "CREATE INDEX IF NOT EXISTS idx_agent_groups_agent ON agent_groups(agent_id, deleted_at);"
    "CREATE INDEX IF NOT EXISTS idx_user_agent_permissions ON user_agent_permissions(user_id, agent_id, deleted_at);";

User read_user(const core::Statement& stmt) {
  return User{.id = stmt.column_int64(0),
              .username = stmt.column_text(1),
              .api_token = stmt.column_text(2),
              .superadmin = stmt.column_int64(3) != 0,
              .created_at_ms = stmt.column_int64(4)};
}

Group read_group(const core::Statement& stmt) {
  return Group{.id = stmt.column_int64(0),
               .name = stmt.column_text(1),
               .description = stmt.column_text(2),
               .created_at_ms = stmt.column_int64(3),
               .updated_at_ms = stmt.column_int64(4)};
}

void validate_name(const std::string& field, const std::string& value) {
  if (value.empty()) {
    throw core::ValidationError(field + " must not be empty");
  }
  if (value.size() > 128) {
    throw core::ValidationError(field + " must be at most 128 characters");
  }
}

}  // namespace

AuthStore::AuthStore(core::SqliteDatabase& db) : db_(db) {}

void AuthStore::ensure_schema() {
  std::lock_guard<std::mutex> lock(db_.mutex());
  db_.exec(kCreateUsersTable);
  db_.exec(kCreateGroupsTable);
  db_.exec(kCreateUserGroupsTable);
  db_.exec(kCreateAgentGroupsTable);
  db_.exec(kCreateUserAgentPermissionsTable);
  db_.exec(kCreateIndexes);
}

User AuthStore::create_user(const std::string& username, const std::string& api_token, const bool superadmin) {
  validate_name("username", username);
  if (api_token.size() < 16) {
    throw core::ValidationError("api token must be at least 16 characters");
  }

  std::lock_guard<std::mutex> lock(db_.mutex());
  {
    core::Statement stmt(db_,
                         "SELECT 1 FROM users WHERE deleted_at IS NULL AND (username = ? OR api_token = ?)");
    stmt.bind(1, username).bind(2, api_token);
    if (stmt.step()) {
      throw core::ConflictError("user already exists or token already in use: " + username);
    }
  }

  const std::int64_t now = core::unix_timestamp_now_ms();
  core::Statement insert(db_, "INSERT INTO users (username, api_token, is_superadmin, created_at) VALUES (?, ?, ?, ?)");
  insert.bind(1, username).bind(2, api_token).bind(3, static_cast<std::int64_t>(superadmin ? 1 : 0)).bind(4, now);
  insert.step();
  return User{.id = db_.last_insert_rowid(),
              .username = username,
              .api_token = api_token,
              .superadmin = superadmin,
              .created_at_ms = now};
}

User AuthStore::ensure_superadmin(const std::string& username, const std::string& api_token) {
  std::optional<std::int64_t> existing_id;
  {
    std::lock_guard<std::mutex> lock(db_.mutex());
    core::Statement stmt(db_, "SELECT id FROM users WHERE deleted_at IS NULL AND username = ?");
    stmt.bind(1, username);
    if (stmt.step()) {
      existing_id = stmt.column_int64(0);
    }
    if (existing_id.has_value()) {
      core::Statement update(db_, "UPDATE users SET api_token = ?, is_superadmin = 1 WHERE id = ?");
      update.bind(1, api_token).bind(2, *existing_id);
      update.step();
    }
  }

  if (!existing_id.has_value()) {
    return create_user(username, api_token, true);
  }
  const auto user = find_user(*existing_id);
  if (!user.has_value()) {
    throw core::NotFoundError("user not found: " + username);
  }
  return *user;
}

std::optional<User> AuthStore::find_user(const std::int64_t user_id) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_,
                       "SELECT id, username, api_token, is_superadmin, created_at FROM users "
                       "WHERE id = ? AND deleted_at IS NULL");
  stmt.bind(1, user_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_user(stmt);
}

std::optional<User> AuthStore::find_user_by_token(const std::string& api_token) {
  if (api_token.empty()) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_,
                       "SELECT id, username, api_token, is_superadmin, created_at FROM users "
                       "WHERE api_token = ? AND deleted_at IS NULL");
  stmt.bind(1, api_token);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_user(stmt);
}

std::vector<User> AuthStore::list_users() {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_,
                       "SELECT id, username, api_token, is_superadmin, created_at FROM users "
                       "WHERE deleted_at IS NULL ORDER BY id");
  std::vector<User> users;
  while (stmt.step()) {
    users.push_back(read_user(stmt));
  }
  return users;
}

void AuthStore::delete_user(const std::int64_t user_id) {
  require_user(user_id);
  std::lock_guard<std::mutex> lock(db_.mutex());
  const std::int64_t now = core::unix_timestamp_now_ms();
  core::Transaction tx(db_);
  core::Statement users(db_, "UPDATE users SET deleted_at = ? WHERE id = ? AND deleted_at IS NULL");
  users.bind(1, now).bind(2, user_id);
  users.step();
  core::Statement memberships(db_, "UPDATE user_groups SET deleted_at = ? WHERE user_id = ? AND deleted_at IS NULL");
  memberships.bind(1, now).bind(2, user_id);
  memberships.step();
  core::Statement overrides(db_,
                            "UPDATE user_agent_permissions SET deleted_at = ? WHERE user_id = ? AND deleted_at IS NULL");
  overrides.bind(1, now).bind(2, user_id);
  overrides.step();
  tx.commit();
}

Group AuthStore::create_group(const std::string& name, const std::string& description) {
  validate_name("group name", name);

  std::lock_guard<std::mutex> lock(db_.mutex());
  {
    core::Statement stmt(db_, "SELECT 1 FROM groups WHERE deleted_at IS NULL AND name = ?");
    stmt.bind(1, name);
    if (stmt.step()) {
      throw core::ConflictError("group already exists: " + name);
    }
  }

  const std::int64_t now = core::unix_timestamp_now_ms();
  core::Statement insert(db_, "INSERT INTO groups (name, description, created_at, updated_at) VALUES (?, ?, ?, ?)");
  insert.bind(1, name).bind(2, description).bind(3, now).bind(4, now);
  insert.step();
  return Group{.id = db_.last_insert_rowid(),
               .name = name,
               .description = description,
               .created_at_ms = now,
               .updated_at_ms = now};
}

std::optional<Group> AuthStore::get_group(const std::int64_t group_id) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_,
                       "SELECT id, name, description, created_at, updated_at FROM groups "
                       "WHERE id = ? AND deleted_at IS NULL");
  stmt.bind(1, group_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_group(stmt);
}

std::vector<Group> AuthStore::list_groups() {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_,
                       "SELECT id, name, description, created_at, updated_at FROM groups "
                       "WHERE deleted_at IS NULL ORDER BY name");
  std::vector<Group> groups;
  while (stmt.step()) {
    groups.push_back(read_group(stmt));
  }
  return groups;
}

Group AuthStore::update_group(const std::int64_t group_id, const std::string& name, const std::string& description) {
  validate_name("group name", name);
  require_group(group_id);

  {
    std::lock_guard<std::mutex> lock(db_.mutex());
    core::Statement clash(db_, "SELECT 1 FROM groups WHERE deleted_at IS NULL AND name = ? AND id <> ?");
    clash.bind(1, name).bind(2, group_id);
    if (clash.step()) {
      throw core::ConflictError("group already exists: " + name);
    }

    core::Statement update(db_, "UPDATE groups SET name = ?, description = ?, updated_at = ? WHERE id = ?");
    update.bind(1, name).bind(2, description).bind(3, core::unix_timestamp_now_ms()).bind(4, group_id);
    update.step();
  }

  const auto group = get_group(group_id);
  if (!group.has_value()) {
    throw core::NotFoundError("group not found: " + std::to_string(group_id));
  }
  return *group;
}

void AuthStore::delete_group(const std::int64_t group_id) {
  require_group(group_id);
  std::lock_guard<std::mutex> lock(db_.mutex());
  const std::int64_t now = core::unix_timestamp_now_ms();
  core::Transaction tx(db_);
  core::Statement groups(db_, "UPDATE groups SET deleted_at = ? WHERE id = ? AND deleted_at IS NULL");
  groups.bind(1, now).bind(2, group_id);
  groups.step();
  core::Statement members(db_, "UPDATE user_groups SET deleted_at = ? WHERE group_id = ? AND deleted_at IS NULL");
  members.bind(1, now).bind(2, group_id);
  members.step();
  core::Statement bindings(db_, "UPDATE agent_groups SET deleted_at = ? WHERE group_id = ? AND deleted_at IS NULL");
  bindings.bind(1, now).bind(2, group_id);
  bindings.step();
  tx.commit();
}

void AuthStore::add_member(const std::int64_t group_id, const std::int64_t user_id) {
  require_group(group_id);
  require_user(user_id);

  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement existing(db_,
                           "SELECT 1 FROM user_groups WHERE group_id = ? AND user_id = ? AND deleted_at IS NULL");
  existing.bind(1, group_id).bind(2, user_id);
  if (existing.step()) {
    return;
  }
  core::Statement insert(db_, "INSERT INTO user_groups (user_id, group_id, created_at) VALUES (?, ?, ?)");
  insert.bind(1, user_id).bind(2, group_id).bind(3, core::unix_timestamp_now_ms());
  insert.step();
}

void AuthStore::remove_member(const std::int64_t group_id, const std::int64_t user_id) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement update(db_,
                         "UPDATE user_groups SET deleted_at = ? WHERE group_id = ? AND user_id = ? "
                         "AND deleted_at IS NULL");
  update.bind(1, core::unix_timestamp_now_ms()).bind(2, group_id).bind(3, user_id);
  update.step();
  if (db_.changes() == 0) {
    throw core::NotFoundError("membership not found");
  }
}

std::vector<std::int64_t> AuthStore::group_members(const std::int64_t group_id) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_,
                       "SELECT ug.user_id FROM user_groups ug JOIN users u ON u.id = ug.user_id "
                       "WHERE ug.group_id = ? AND ug.deleted_at IS NULL AND u.deleted_at IS NULL ORDER BY ug.user_id");
  stmt.bind(1, group_id);
  std::vector<std::int64_t> members;
  while (stmt.step()) {
    members.push_back(stmt.column_int64(0));
  }
  return members;
}

void AuthStore::set_binding(const std::string& agent_id, const std::int64_t group_id, const PermissionLevel level) {
  validate_name("agent id", agent_id);
  require_group(group_id);

  std::lock_guard<std::mutex> lock(db_.mutex());
  const std::int64_t now = core::unix_timestamp_now_ms();
  core::Transaction tx(db_);
  core::Statement retire(db_,
                         "UPDATE agent_groups SET deleted_at = ? WHERE agent_id = ? AND group_id = ? "
                         "AND deleted_at IS NULL");
  retire.bind(1, now).bind(2, agent_id).bind(3, group_id);
  retire.step();
  core::Statement insert(db_,
                         "INSERT INTO agent_groups (agent_id, group_id, permission_level, created_at) "
                         "VALUES (?, ?, ?, ?)");
  insert.bind(1, agent_id).bind(2, group_id).bind(3, static_cast<std::int64_t>(level)).bind(4, now);
  insert.step();
  tx.commit();
}

void AuthStore::remove_binding(const std::string& agent_id, const std::int64_t group_id) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement update(db_,
                         "UPDATE agent_groups SET deleted_at = ? WHERE agent_id = ? AND group_id = ? "
                         "AND deleted_at IS NULL");
  update.bind(1, core::unix_timestamp_now_ms()).bind(2, agent_id).bind(3, group_id);
  update.step();
  if (db_.changes() == 0) {
    throw core::NotFoundError("binding not found");
  }
}

std::vector<AgentGroupBinding> AuthStore::group_bindings(const std::int64_t group_id) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_,
                       "SELECT agent_id, permission_level FROM agent_groups "
                       "WHERE group_id = ? AND deleted_at IS NULL ORDER BY agent_id");
  stmt.bind(1, group_id);
  std::vector<AgentGroupBinding> bindings;
  while (stmt.step()) {
    const auto level = permission_level_from_int(stmt.column_int64(1));
    if (!level.has_value()) {
      continue;
    }
    bindings.push_back(AgentGroupBinding{.agent_id = stmt.column_text(0), .group_id = group_id, .level = *level});
  }
  return bindings;
}

void AuthStore::grant_override(const std::int64_t user_id, const std::string& agent_id, const PermissionLevel level,
                               const std::int64_t granted_by) {
  validate_name("agent id", agent_id);
  require_user(user_id);

  std::lock_guard<std::mutex> lock(db_.mutex());
  const std::int64_t now = core::unix_timestamp_now_ms();
  core::Transaction tx(db_);
  core::Statement retire(db_,
                         "UPDATE user_agent_permissions SET deleted_at = ? WHERE user_id = ? AND agent_id = ? "
                         "AND deleted_at IS NULL");
  retire.bind(1, now).bind(2, user_id).bind(3, agent_id);
  retire.step();
  core::Statement insert(db_,
                         "INSERT INTO user_agent_permissions (user_id, agent_id, permission_level, granted_by, "
                         "created_at) VALUES (?, ?, ?, ?, ?)");
  insert.bind(1, user_id).bind(2, agent_id).bind(3, static_cast<std::int64_t>(level)).bind(4, granted_by).bind(5, now);
  insert.step();
  tx.commit();
}

void AuthStore::revoke_override(const std::int64_t user_id, const std::string& agent_id) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement update(db_,
                         "UPDATE user_agent_permissions SET deleted_at = ? WHERE user_id = ? AND agent_id = ? "
                         "AND deleted_at IS NULL");
  update.bind(1, core::unix_timestamp_now_ms()).bind(2, user_id).bind(3, agent_id);
  update.step();
  if (db_.changes() == 0) {
    throw core::NotFoundError("permission override not found");
  }
}

std::vector<UserAgentPermission> AuthStore::user_overrides(const std::int64_t user_id) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_,
                       "SELECT agent_id, permission_level, granted_by FROM user_agent_permissions "
                       "WHERE user_id = ? AND deleted_at IS NULL ORDER BY agent_id");
  stmt.bind(1, user_id);
  std::vector<UserAgentPermission> overrides;
  while (stmt.step()) {
    const auto level = permission_level_from_int(stmt.column_int64(1));
    if (!level.has_value()) {
      continue;
    }
    overrides.push_back(UserAgentPermission{
        .user_id = user_id, .agent_id = stmt.column_text(0), .level = *level, .granted_by = stmt.column_int64(2)});
  }
  return overrides;
}

std::vector<std::string> AuthStore::agents_referenced_by(const std::int64_t user_id) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  std::set<std::string> agents;
  core::Statement bindings(db_,
                           "SELECT DISTINCT ag.agent_id FROM agent_groups ag "
                           "JOIN user_groups ug ON ug.group_id = ag.group_id "
                           "JOIN groups g ON g.id = ag.group_id "
                           "WHERE ug.user_id = ? AND ag.deleted_at IS NULL AND ug.deleted_at IS NULL "
                           "AND g.deleted_at IS NULL");
  bindings.bind(1, user_id);
  while (bindings.step()) {
    agents.insert(bindings.column_text(0));
  }
  core::Statement overrides(db_,
                            "SELECT DISTINCT agent_id FROM user_agent_permissions "
                            "WHERE user_id = ? AND deleted_at IS NULL");
  overrides.bind(1, user_id);
  while (overrides.step()) {
    agents.insert(overrides.column_text(0));
  }
  return {agents.begin(), agents.end()};
}

bool AuthStore::is_superadmin(const std::int64_t user_id) const {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_, "SELECT is_superadmin FROM users WHERE id = ? AND deleted_at IS NULL");
  stmt.bind(1, user_id);
  return stmt.step() && stmt.column_int64(0) != 0;
}

std::vector<long long> AuthStore::group_binding_levels(const std::int64_t user_id, const std::string& agent_id) const {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_,
                       "SELECT ag.permission_level FROM agent_groups ag "
                       "JOIN user_groups ug ON ug.group_id = ag.group_id "
                       "JOIN groups g ON g.id = ag.group_id "
                       "JOIN users u ON u.id = ug.user_id "
                       "WHERE ug.user_id = ? AND ag.agent_id = ? "
                       "AND ag.deleted_at IS NULL AND ug.deleted_at IS NULL AND g.deleted_at IS NULL "
                       "AND u.deleted_at IS NULL");
  stmt.bind(1, user_id).bind(2, agent_id);
  std::vector<long long> levels;
  while (stmt.step()) {
    levels.push_back(static_cast<long long>(stmt.column_int64(0)));
  }
  return levels;
}

std::optional<long long> AuthStore::user_override(const std::int64_t user_id, const std::string& agent_id) const {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_,
                       "SELECT p.permission_level FROM user_agent_permissions p "
                       "JOIN users u ON u.id = p.user_id "
                       "WHERE p.user_id = ? AND p.agent_id = ? AND p.deleted_at IS NULL AND u.deleted_at IS NULL "
                       "ORDER BY p.created_at DESC LIMIT 1");
  stmt.bind(1, user_id).bind(2, agent_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return static_cast<long long>(stmt.column_int64(0));
}

void AuthStore::require_user(const std::int64_t user_id) {
  if (!find_user(user_id).has_value()) {
    throw core::NotFoundError("user not found: " + std::to_string(user_id));
  }
}

void AuthStore::require_group(const std::int64_t group_id) {
  if (!get_group(group_id).has_value()) {
    throw core::NotFoundError("group not found: " + std::to_string(group_id));
  }
}

}  // namespace fleet_hub::auth
