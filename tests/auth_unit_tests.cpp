#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "auth/auth_store.hpp"
#include "auth/authenticator.hpp"
#include "auth/permission.hpp"
#include "auth/resolver.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/sqlite.hpp"

using fleet_hub::auth::AuthStore;
using fleet_hub::auth::Authenticator;
using fleet_hub::auth::PermissionLevel;
using fleet_hub::auth::PermissionResolver;
using fleet_hub::auth::PermissionSource;
using fleet_hub::auth::Principal;
using fleet_hub::auth::ResolvedAccess;
using fleet_hub::core::AuthConfig;
using fleet_hub::core::SqliteDatabase;

namespace {

// In-memory authorization graph for resolver tests.
class FakePermissionSource final : public PermissionSource {
 public:
  bool is_superadmin(const std::int64_t user_id) const override { return superadmins.count(user_id) != 0; }

  std::vector<long long> group_binding_levels(const std::int64_t user_id, const std::string& agent_id) const override {
    const auto it = bindings.find({user_id, agent_id});
    return it == bindings.end() ? std::vector<long long>{} : it->second;
  }

  std::optional<long long> user_override(const std::int64_t user_id, const std::string& agent_id) const override {
    const auto it = overrides.find({user_id, agent_id});
    if (it == overrides.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::map<std::int64_t, bool> superadmins{};
  std::map<std::pair<std::int64_t, std::string>, std::vector<long long>> bindings{};
  std::map<std::pair<std::int64_t, std::string>, long long> overrides{};
};

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

int test_resolver_group_ceiling_is_max_binding() {
  FakePermissionSource source;
  source.bindings[{7, "web-01"}] = {0, 2, 1};
  PermissionResolver resolver(source);

  const ResolvedAccess access = resolver.resolve(7, "web-01");
  if (!access.visible || access.level != PermissionLevel::SERVICE_CONTROL) {
    return fail("test_resolver_group_ceiling_is_max_binding", "ceiling should be the highest group binding");
  }
  if (!access.allows(PermissionLevel::BASIC_WRITE) || access.allows(PermissionLevel::SYSTEM_ADMIN)) {
    return fail("test_resolver_group_ceiling_is_max_binding", "allows() should compare against the ceiling");
  }
  return 0;
}

int test_resolver_override_wins_in_both_directions() {
  FakePermissionSource source;
  source.bindings[{7, "web-01"}] = {3};
  source.overrides[{7, "web-01"}] = 0;
  source.bindings[{7, "db-01"}] = {0};
  source.overrides[{7, "db-01"}] = 2;
  PermissionResolver resolver(source);

  const auto lowered = resolver.resolve(7, "web-01");
  if (!lowered.visible || lowered.level != PermissionLevel::READ_ONLY) {
    return fail("test_resolver_override_wins_in_both_directions", "override must be able to lower the group level");
  }
  const auto raised = resolver.resolve(7, "db-01");
  if (!raised.visible || raised.level != PermissionLevel::SERVICE_CONTROL) {
    return fail("test_resolver_override_wins_in_both_directions", "override must be able to raise the group level");
  }

  source.overrides[{7, "cache-01"}] = 1;
  const auto override_only = resolver.resolve(7, "cache-01");
  if (!override_only.visible || override_only.level != PermissionLevel::BASIC_WRITE) {
    return fail("test_resolver_override_wins_in_both_directions", "override alone should grant visibility");
  }
  return 0;
}

int test_resolver_superadmin_and_invisible() {
  FakePermissionSource source;
  source.superadmins[1] = true;
  PermissionResolver resolver(source);

  const auto admin = resolver.resolve(1, "anything");
  if (!admin.visible || admin.level != PermissionLevel::SYSTEM_ADMIN) {
    return fail("test_resolver_superadmin_and_invisible", "superadmin sees every agent at level 3");
  }

  const auto none = resolver.resolve(2, "web-01");
  if (none.visible || none.allows(PermissionLevel::READ_ONLY)) {
    return fail("test_resolver_superadmin_and_invisible", "no binding must mean invisible, not level 0");
  }

  try {
    resolver.require(2, "web-01", PermissionLevel::READ_ONLY);
    return fail("test_resolver_superadmin_and_invisible", "require on invisible agent should throw");
  } catch (const fleet_hub::core::AuthorizationError& ex) {
    if (ex.reason() != fleet_hub::core::AuthorizationReason::NO_ACCESS ||
        std::string(ex.what()) != "agent not found: web-01") {
      return fail("test_resolver_superadmin_and_invisible", "invisible agent must read like a missing agent");
    }
  }

  source.bindings[{2, "web-01"}] = {1};
  try {
    resolver.require(2, "web-01", PermissionLevel::SERVICE_CONTROL);
    return fail("test_resolver_superadmin_and_invisible", "require above ceiling should throw");
  } catch (const fleet_hub::core::AuthorizationError& ex) {
    if (ex.reason() != fleet_hub::core::AuthorizationReason::INSUFFICIENT_LEVEL) {
      return fail("test_resolver_superadmin_and_invisible", "expected INSUFFICIENT_LEVEL");
    }
  }
  return 0;
}

int test_resolver_ignores_out_of_range_levels() {
  FakePermissionSource source;
  source.bindings[{3, "web-01"}] = {9, -1};
  source.overrides[{3, "db-01"}] = 42;
  source.bindings[{3, "db-01"}] = {1};
  PermissionResolver resolver(source);

  if (resolver.resolve(3, "web-01").visible) {
    return fail("test_resolver_ignores_out_of_range_levels", "garbage bindings must not grant visibility");
  }
  const auto fallback = resolver.resolve(3, "db-01");
  if (!fallback.visible || fallback.level != PermissionLevel::BASIC_WRITE) {
    return fail("test_resolver_ignores_out_of_range_levels", "invalid override should fall back to the groups");
  }
  return 0;
}

int test_command_catalogue_levels() {
  const auto* restart = fleet_hub::auth::find_command_spec("service_restart");
  const auto* shell = fleet_hub::auth::find_command_spec("shell_execute");
  const auto* list = fleet_hub::auth::find_command_spec("process_list");
  if (restart == nullptr || shell == nullptr || list == nullptr) {
    return fail("test_command_catalogue_levels", "catalogue missing known commands");
  }
  if (restart->min_level != PermissionLevel::SERVICE_CONTROL || restart->requires_elevation) {
    return fail("test_command_catalogue_levels", "service_restart should need level 2 only");
  }
  if (shell->min_level != PermissionLevel::SYSTEM_ADMIN || !shell->requires_elevation) {
    return fail("test_command_catalogue_levels", "shell_execute should need level 3 and elevation");
  }
  if (list->min_level != PermissionLevel::READ_ONLY) {
    return fail("test_command_catalogue_levels", "process_list should be read-only");
  }
  if (fleet_hub::auth::find_command_spec("rm_rf") != nullptr) {
    return fail("test_command_catalogue_levels", "unknown command should not resolve");
  }
  return 0;
}

int test_auth_store_groups_and_overrides() {
  SqliteDatabase db(":memory:");
  AuthStore store(db);
  store.ensure_schema();
  PermissionResolver resolver(store);

  const auto alice = store.create_user("alice", "alice-token-0123456789", false);
  const auto ops = store.create_group("ops", "operators");
  const auto dev = store.create_group("dev", "developers");
  store.add_member(ops.id, alice.id);
  store.add_member(dev.id, alice.id);
  store.set_binding("web-01", ops.id, PermissionLevel::BASIC_WRITE);
  store.set_binding("web-01", dev.id, PermissionLevel::SERVICE_CONTROL);

  if (resolver.resolve(alice.id, "web-01").level != PermissionLevel::SERVICE_CONTROL) {
    return fail("test_auth_store_groups_and_overrides", "expected max over both groups");
  }

  store.grant_override(alice.id, "web-01", PermissionLevel::READ_ONLY, 1);
  if (resolver.resolve(alice.id, "web-01").level != PermissionLevel::READ_ONLY) {
    return fail("test_auth_store_groups_and_overrides", "override should replace the group ceiling");
  }

  store.revoke_override(alice.id, "web-01");
  store.delete_group(dev.id);
  if (resolver.resolve(alice.id, "web-01").level != PermissionLevel::BASIC_WRITE) {
    return fail("test_auth_store_groups_and_overrides", "deleted group must stop contributing");
  }

  store.remove_member(ops.id, alice.id);
  if (resolver.resolve(alice.id, "web-01").visible) {
    return fail("test_auth_store_groups_and_overrides", "removed membership should hide the agent");
  }

  const auto referenced = store.agents_referenced_by(alice.id);
  if (!referenced.empty()) {
    return fail("test_auth_store_groups_and_overrides", "no live grant should reference web-01");
  }
  return 0;
}

int test_auth_store_soft_delete_and_conflicts() {
  SqliteDatabase db(":memory:");
  AuthStore store(db);
  store.ensure_schema();

  const auto bob = store.create_user("bob", "bob-token-0123456789", false);
  try {
    store.create_user("bob", "other-token-0123456789", false);
    return fail("test_auth_store_soft_delete_and_conflicts", "duplicate username should conflict");
  } catch (const fleet_hub::core::ConflictError&) {
  }
  try {
    store.create_user("carol", "short", false);
    return fail("test_auth_store_soft_delete_and_conflicts", "short token should be rejected");
  } catch (const fleet_hub::core::ValidationError&) {
  }

  store.grant_override(bob.id, "web-01", PermissionLevel::SYSTEM_ADMIN, 1);
  store.delete_user(bob.id);

  if (store.find_user(bob.id).has_value() || store.find_user_by_token("bob-token-0123456789").has_value()) {
    return fail("test_auth_store_soft_delete_and_conflicts", "tombstoned user must be invisible to reads");
  }
  if (store.user_override(bob.id, "web-01").has_value()) {
    return fail("test_auth_store_soft_delete_and_conflicts", "overrides of a deleted user must be ignored");
  }

  // The tombstone frees the name for reuse.
  const auto reborn = store.create_user("bob", "bob-token-abcdefghij", false);
  if (reborn.id == bob.id) {
    return fail("test_auth_store_soft_delete_and_conflicts", "recreated user should get a new id");
  }

  try {
    store.add_member(999, reborn.id);
    return fail("test_auth_store_soft_delete_and_conflicts", "missing group should be NotFound");
  } catch (const fleet_hub::core::NotFoundError&) {
  }
  try {
    store.revoke_override(reborn.id, "web-01");
    return fail("test_auth_store_soft_delete_and_conflicts", "revoking nothing should be NotFound");
  } catch (const fleet_hub::core::NotFoundError&) {
  }
  return 0;
}

int test_authenticator_bootstrap_and_tokens() {
  SqliteDatabase db(":memory:");
  AuthStore store(db);
  store.ensure_schema();

  AuthConfig config{};
  config.superadmin_token = "root-token-0123456789";
  config.agent_tokens = {"agent-secret-1", "agent-secret-2"};
  Authenticator authenticator(config, store);
  authenticator.bootstrap();
  authenticator.bootstrap();

  const Principal admin = authenticator.authenticate_user("root-token-0123456789");
  if (!admin.superadmin || admin.username != "admin") {
    return fail("test_authenticator_bootstrap_and_tokens", "bootstrap should provision the superadmin");
  }
  if (store.list_users().size() != 1) {
    return fail("test_authenticator_bootstrap_and_tokens", "bootstrap must be idempotent");
  }

  try {
    authenticator.authenticate_user("");
    return fail("test_authenticator_bootstrap_and_tokens", "empty token should not authenticate");
  } catch (const fleet_hub::core::AuthenticationError&) {
  }

  if (!authenticator.authenticate_agent("agent-secret-2") || authenticator.authenticate_agent("agent-secret-3")) {
    return fail("test_authenticator_bootstrap_and_tokens", "agent token check mismatch");
  }

  AuthConfig open_config{};
  open_config.enabled = false;
  Authenticator open(open_config, store);
  if (!open.authenticate_agent("whatever")) {
    return fail("test_authenticator_bootstrap_and_tokens", "disabled auth should admit any agent");
  }
  return 0;
}

int test_elevation_grants_expire() {
  SqliteDatabase db(":memory:");
  AuthStore store(db);
  store.ensure_schema();

  AuthConfig config{};
  config.elevation_secret = "second-factor";
  config.elevation_ttl = std::chrono::seconds(60);
  Authenticator authenticator(config, store);

  const Principal alice{.user_id = 5, .username = "alice", .superadmin = false};
  const Principal bob{.user_id = 6, .username = "bob", .superadmin = false};

  try {
    authenticator.elevate(alice, "wrong", 1000);
    return fail("test_elevation_grants_expire", "wrong secret should be rejected");
  } catch (const fleet_hub::core::AuthenticationError&) {
  }

  const auto credential = authenticator.elevate(alice, "second-factor", 1000);
  if (credential.expires_at_ms != 61000) {
    return fail("test_elevation_grants_expire", "expiry should be now + ttl");
  }
  if (!authenticator.verify_elevated(alice, credential.token, 2000)) {
    return fail("test_elevation_grants_expire", "fresh credential should verify");
  }
  if (authenticator.verify_elevated(bob, credential.token, 2000)) {
    return fail("test_elevation_grants_expire", "credential is bound to the user that elevated");
  }
  if (authenticator.verify_elevated(alice, credential.token, 61000)) {
    return fail("test_elevation_grants_expire", "credential must expire at its deadline");
  }
  if (authenticator.verify_elevated(alice, "", 2000)) {
    return fail("test_elevation_grants_expire", "empty credential must never verify");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_resolver_group_ceiling_is_max_binding(); rc != 0) return rc;
  if (int rc = test_resolver_override_wins_in_both_directions(); rc != 0) return rc;
  if (int rc = test_resolver_superadmin_and_invisible(); rc != 0) return rc;
  if (int rc = test_resolver_ignores_out_of_range_levels(); rc != 0) return rc;
  if (int rc = test_command_catalogue_levels(); rc != 0) return rc;
  if (int rc = test_auth_store_groups_and_overrides(); rc != 0) return rc;
  if (int rc = test_auth_store_soft_delete_and_conflicts(); rc != 0) return rc;
  if (int rc = test_authenticator_bootstrap_and_tokens(); rc != 0) return rc;
  if (int rc = test_elevation_grants_expire(); rc != 0) return rc;

  std::cout << "[PASS] auth unit tests\n";
  return 0;
}
