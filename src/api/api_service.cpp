#include "api/api_service.hpp"

#include <set>

#include "api/jsonrpc.hpp"
#include "core/errors.hpp"
#include "core/ids.hpp"
#include "core/timestamp.hpp"
#include "model/json.hpp"

namespace fleet_hub::api {

namespace {

using nlohmann::json;

const json& object_params(const json& params) {
  if (!params.is_object()) {
    throw core::ValidationError("params must be an object");
  }
  return params;
}

std::optional<std::string> optional_string(const json& params, const char* key) {
  const auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw core::ValidationError(std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

std::string require_string(const json& params, const char* key) {
  auto value = optional_string(params, key);
  if (!value.has_value() || value->empty()) {
    throw core::ValidationError(std::string(key) + " is required");
  }
  return *value;
}

std::optional<std::int64_t> optional_integer(const json& params, const char* key) {
  const auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number_integer() && !it->is_number_unsigned()) {
    throw core::ValidationError(std::string(key) + " must be an integer");
  }
  return it->get<std::int64_t>();
}

std::optional<bool> optional_bool(const json& params, const char* key) {
  const auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_boolean()) {
    throw core::ValidationError(std::string(key) + " must be a boolean");
  }
  return it->get<bool>();
}

std::int64_t require_integer(const json& params, const char* key) {
  const auto value = optional_integer(params, key);
  if (!value.has_value()) {
    throw core::ValidationError(std::string(key) + " is required");
  }
  return *value;
}

auth::PermissionLevel require_level(const json& params) {
  const auto level = auth::permission_level_from_int(require_integer(params, "level"));
  if (!level.has_value()) {
    throw core::ValidationError("level must be between 0 and 3");
  }
  return *level;
}

void require_superadmin(const auth::Principal& principal) {
  if (!principal.superadmin) {
    throw core::AuthorizationError(core::AuthorizationReason::INSUFFICIENT_LEVEL, "superadmin required");
  }
}

std::string agent_not_found(const std::string& agent_id) { return "agent not found: " + agent_id; }

std::string ip_of(const std::string& peer) {
  const auto colon = peer.rfind(':');
  return colon == std::string::npos ? peer : peer.substr(0, colon);
}

json user_json(const auth::User& user) {
  return json{{"id", user.id},
              {"username", user.username},
              {"superadmin", user.superadmin},
              {"createdAt", user.created_at_ms}};
}

json group_json(const auth::Group& group) {
  return json{{"id", group.id},
              {"name", group.name},
              {"description", group.description},
              {"createdAt", group.created_at_ms},
              {"updatedAt", group.updated_at_ms}};
}

json history_point_json(const storage::HistoryPoint& point) {
  return json{{"agentId", point.agent_id},   {"timestamp", point.timestamp_ms},
              {"cpuPercent", point.cpu_percent}, {"memPercent", point.mem_percent},
              {"diskReadBps", point.disk_read_bps}, {"diskWriteBps", point.disk_write_bps},
              {"netRxBps", point.net_rx_bps},    {"netTxBps", point.net_tx_bps},
              {"gpuPercent", point.gpu_percent}, {"loadAvg1", point.load_avg1}};
}

json result_json(const control::CommandResult& result) {
  return json{{"commandId", result.command_id},
              {"success", result.success},
              {"output", result.output},
              {"error", result.error},
              {"durationMs", result.duration_ms},
              {"auditId", result.audit_id}};
}

json audit_json(const control::AuditEntry& entry) {
  return json{{"id", entry.id},
              {"timestamp", entry.timestamp_ms},
              {"userId", entry.user_id},
              {"username", entry.username},
              {"agentId", entry.agent_id},
              {"agentHostname", entry.agent_hostname},
              {"commandType", entry.command_type},
              {"commandId", entry.command_id},
              {"target", entry.target},
              {"params", entry.params},
              {"status", control::audit_status_name(entry.status)},
              {"success", entry.success},
              {"error", entry.error},
              {"durationMs", entry.duration_ms},
              {"ipAddress", entry.ip_address}};
}

}  // namespace

ApiService::ApiService(ApiDependencies deps) : deps_(deps) {}

auth::Principal ApiService::authenticate(const json& params) {
  if (!params.is_object()) {
    throw core::AuthenticationError("missing token");
  }
  const auto it = params.find("token");
  if (it == params.end() || !it->is_string()) {
    throw core::AuthenticationError("missing token");
  }
  return deps_.authenticator.authenticate_user(it->get<std::string>());
}

json ApiService::call(const std::string& method, const json& params, const std::string& peer) {
  if (method == "health") {
    return health();
  }

  const auth::Principal principal = authenticate(params);
  const json& args = object_params(params);

  if (method == "auth.elevate") {
    return elevate(principal, args);
  }
  if (method == "agents.list") {
    return list_agents(principal);
  }
  if (method == "agents.get") {
    return get_agent(principal, args);
  }
  if (method == "metrics.latest") {
    return latest_metrics(principal, args);
  }
  if (method == "metrics.history") {
    return metrics_history(principal, args);
  }
  if (method == "metrics.summary") {
    return metrics_summary(principal);
  }
  if (method == "permissions.effective") {
    return effective_permissions(principal, args);
  }
  if (method == "commands.submit") {
    return submit_command(principal, args, peer);
  }

  // Everything below manages the authorization graph or reads the audit trail.
  if (method.rfind("users.", 0) == 0 || method.rfind("groups.", 0) == 0 || method.rfind("bindings.", 0) == 0 ||
      method == "permissions.grant" || method == "permissions.revoke" || method == "audit.query" ||
      method == "audit.stats") {
    require_superadmin(principal);
  } else {
    throw UnknownMethodError(method);
  }

  if (method == "users.create") {
    return create_user(args);
  }
  if (method == "users.list") {
    return list_users();
  }
  if (method == "users.delete") {
    deps_.auth_store.delete_user(require_integer(args, "userId"));
    return json{{"deleted", true}};
  }
  if (method == "groups.create") {
    return create_group(args);
  }
  if (method == "groups.list") {
    json groups = json::array();
    for (const auto& group : deps_.auth_store.list_groups()) {
      groups.push_back(group_json(group));
    }
    return json{{"groups", groups}};
  }
  if (method == "groups.get") {
    return get_group(args);
  }
  if (method == "groups.update") {
    return update_group(args);
  }
  if (method == "groups.delete") {
    deps_.auth_store.delete_group(require_integer(args, "groupId"));
    return json{{"deleted", true}};
  }
  if (method == "groups.addMember") {
    deps_.auth_store.add_member(require_integer(args, "groupId"), require_integer(args, "userId"));
    return json{{"added", true}};
  }
  if (method == "groups.removeMember") {
    deps_.auth_store.remove_member(require_integer(args, "groupId"), require_integer(args, "userId"));
    return json{{"removed", true}};
  }
  if (method == "bindings.set") {
    return set_binding(args);
  }
  if (method == "bindings.remove") {
    deps_.auth_store.remove_binding(require_string(args, "agentId"), require_integer(args, "groupId"));
    return json{{"removed", true}};
  }
  if (method == "bindings.list") {
    json bindings = json::array();
    for (const auto& binding : deps_.auth_store.group_bindings(require_integer(args, "groupId"))) {
      bindings.push_back({{"agentId", binding.agent_id},
                          {"groupId", binding.group_id},
                          {"level", static_cast<int>(binding.level)},
                          {"levelName", auth::permission_level_name(binding.level)}});
    }
    return json{{"bindings", bindings}};
  }
  if (method == "permissions.grant") {
    return grant_permission(principal, args);
  }
  if (method == "permissions.revoke") {
    deps_.auth_store.revoke_override(require_integer(args, "userId"), require_string(args, "agentId"));
    return json{{"revoked", true}};
  }
  if (method == "audit.query") {
    return query_audit(args);
  }
  if (method == "audit.stats") {
    return audit_stats(args);
  }
  throw UnknownMethodError(method);
}

std::map<std::string, auth::PermissionLevel> ApiService::visible_agents(const auth::Principal& principal) const {
  std::map<std::string, auth::PermissionLevel> visible;
  for (const auto& agent : deps_.registry.agents()) {
    if (principal.superadmin) {
      visible.emplace(agent.id, auth::PermissionLevel::SYSTEM_ADMIN);
      continue;
    }
    const auto access = deps_.resolver.resolve(principal.user_id, agent.id);
    if (access.visible) {
      visible.emplace(agent.id, access.level);
    }
  }
  return visible;
}

json ApiService::health() const {
  return json{{"status", "ok"},
              {"agents", deps_.registry.connected_count()},
              {"storage", deps_.storage.backend_name()},
              {"degraded", deps_.storage.degraded()},
              {"subscribers", deps_.events.subscriber_count()}};
}

json ApiService::elevate(const auth::Principal& principal, const json& params) {
  const auto credential =
      deps_.authenticator.elevate(principal, require_string(params, "secret"), core::unix_timestamp_now_ms());
  return json{{"credential", credential.token}, {"expiresAt", credential.expires_at_ms}};
}

json ApiService::list_agents(const auth::Principal& principal) const {
  const auto visible = visible_agents(principal);
  json agents = json::array();
  for (const auto& agent : deps_.registry.agents()) {
    const auto it = visible.find(agent.id);
    if (it == visible.end()) {
      continue;
    }
    json entry = agent;
    entry["permissionLevel"] = static_cast<int>(it->second);
    agents.push_back(std::move(entry));
  }
  return json{{"agents", agents}};
}

json ApiService::get_agent(const auth::Principal& principal, const json& params) const {
  const auto agent_id = require_string(params, "agentId");
  const auto access = deps_.resolver.require(principal.user_id, agent_id, auth::PermissionLevel::READ_ONLY);
  const auto agent = deps_.registry.agent(agent_id);
  if (!agent.has_value()) {
    throw core::NotFoundError(agent_not_found(agent_id));
  }

  json entry = *agent;
  entry["permissionLevel"] = static_cast<int>(access.level);
  const auto latest = deps_.registry.latest(agent_id);
  entry["latest"] = latest.has_value() ? json(*latest) : json(nullptr);
  return entry;
}

json ApiService::latest_metrics(const auth::Principal& principal, const json& params) const {
  const auto agent_id = optional_string(params, "agentId");
  if (agent_id.has_value()) {
    deps_.resolver.require(principal.user_id, *agent_id, auth::PermissionLevel::READ_ONLY);
    const auto latest = deps_.registry.latest(*agent_id);
    if (!latest.has_value()) {
      throw core::NotFoundError(agent_not_found(*agent_id));
    }
    return *latest;
  }

  const auto visible = visible_agents(principal);
  json metrics = json::object();
  for (const auto& [id, snapshot] : deps_.registry.all_latest()) {
    if (visible.count(id) != 0) {
      metrics[id] = snapshot;
    }
  }
  return json{{"metrics", metrics}};
}

json ApiService::metrics_history(const auth::Principal& principal, const json& params) {
  const auto agent_id = require_string(params, "agentId");
  deps_.resolver.require(principal.user_id, agent_id, auth::PermissionLevel::READ_ONLY);

  const std::int64_t now_ms = core::unix_timestamp_now_ms();
  const std::int64_t end_ms = optional_integer(params, "end").value_or(now_ms);
  const std::int64_t start_ms = optional_integer(params, "start").value_or(end_ms - core::kMillisPerHour);
  if (start_ms > end_ms) {
    throw core::ValidationError("start must not be after end");
  }
  const auto limit = optional_integer(params, "limit").value_or(0);
  if (limit < 0) {
    throw core::ValidationError("limit must not be negative");
  }

  const auto interval = optional_string(params, "interval");
  if (interval.has_value()) {
    if (deps_.history == nullptr) {
      throw core::ValidationError("history archive is disabled");
    }
    const auto bucket_ms = storage::bucket_width_ms(*interval, start_ms, end_ms);
    json points = json::array();
    for (const auto& point : deps_.history->query_bucketed(agent_id, start_ms, end_ms, bucket_ms)) {
      points.push_back(history_point_json(point));
    }
    return json{{"agentId", agent_id}, {"bucketMs", bucket_ms}, {"points", points}};
  }

  const auto result = deps_.storage.query(agent_id, start_ms, end_ms, static_cast<std::size_t>(limit));
  return json{{"agentId", agent_id}, {"points", result.points}, {"fromCache", result.from_cache}};
}

json ApiService::metrics_summary(const auth::Principal& principal) const {
  // Resolver calls hit the database, so visibility is settled before the registry locks are taken.
  const auto visible = visible_agents(principal);
  const auto summary = deps_.registry.summary([&visible](const std::string& agent_id) {
    return visible.count(agent_id) != 0;
  });
  return json{{"agentCount", summary.agent_count},
              {"reportingCount", summary.reporting_count},
              {"avgCpuUsage", summary.avg_cpu_percent},
              {"totalMemory", summary.total_memory},
              {"usedMemory", summary.used_memory},
              {"memoryPercent", summary.memory_percent}};
}

json ApiService::create_user(const json& params) {
  const auto username = require_string(params, "username");
  const auto token = optional_string(params, "apiToken").value_or(core::random_hex_id(24));
  const bool superadmin = optional_bool(params, "superadmin").value_or(false);

  const auto user = deps_.auth_store.create_user(username, token, superadmin);
  json out = user_json(user);
  out["apiToken"] = user.api_token;
  return out;
}

json ApiService::list_users() {
  json users = json::array();
  for (const auto& user : deps_.auth_store.list_users()) {
    users.push_back(user_json(user));
  }
  return json{{"users", users}};
}

json ApiService::create_group(const json& params) {
  const auto group = deps_.auth_store.create_group(require_string(params, "name"),
                                                   optional_string(params, "description").value_or(""));
  return group_json(group);
}

json ApiService::get_group(const json& params) {
  const auto group_id = require_integer(params, "groupId");
  const auto group = deps_.auth_store.get_group(group_id);
  if (!group.has_value()) {
    throw core::NotFoundError("group not found: " + std::to_string(group_id));
  }

  json out = group_json(*group);
  out["members"] = deps_.auth_store.group_members(group_id);
  json bindings = json::array();
  for (const auto& binding : deps_.auth_store.group_bindings(group_id)) {
    bindings.push_back({{"agentId", binding.agent_id}, {"level", static_cast<int>(binding.level)}});
  }
  out["bindings"] = bindings;
  return out;
}

json ApiService::update_group(const json& params) {
  const auto group_id = require_integer(params, "groupId");
  const auto current = deps_.auth_store.get_group(group_id);
  if (!current.has_value()) {
    throw core::NotFoundError("group not found: " + std::to_string(group_id));
  }
  const auto group = deps_.auth_store.update_group(group_id, optional_string(params, "name").value_or(current->name),
                                                   optional_string(params, "description").value_or(current->description));
  return group_json(group);
}

json ApiService::set_binding(const json& params) {
  const auto agent_id = require_string(params, "agentId");
  const auto group_id = require_integer(params, "groupId");
  const auto level = require_level(params);
  deps_.auth_store.set_binding(agent_id, group_id, level);
  return json{{"agentId", agent_id}, {"groupId", group_id}, {"level", static_cast<int>(level)}};
}

json ApiService::grant_permission(const auth::Principal& principal, const json& params) {
  const auto user_id = require_integer(params, "userId");
  const auto agent_id = require_string(params, "agentId");
  const auto level = require_level(params);
  deps_.auth_store.grant_override(user_id, agent_id, level, principal.user_id);
  return json{{"userId", user_id}, {"agentId", agent_id}, {"level", static_cast<int>(level)}};
}

json ApiService::effective_permissions(const auth::Principal& principal, const json& params) {
  const auto user_id = optional_integer(params, "userId").value_or(principal.user_id);
  if (user_id != principal.user_id) {
    require_superadmin(principal);
  }
  if (!deps_.auth_store.find_user(user_id).has_value()) {
    throw core::NotFoundError("user not found: " + std::to_string(user_id));
  }

  std::set<std::string> candidates;
  for (const auto& agent : deps_.registry.agents()) {
    candidates.insert(agent.id);
  }
  for (const auto& agent_id : deps_.auth_store.agents_referenced_by(user_id)) {
    candidates.insert(agent_id);
  }

  json permissions = json::array();
  for (const auto& agent_id : candidates) {
    const auto access = deps_.resolver.resolve(user_id, agent_id);
    if (!access.visible) {
      continue;
    }
    permissions.push_back({{"agentId", agent_id},
                           {"level", static_cast<int>(access.level)},
                           {"levelName", auth::permission_level_name(access.level)},
                           {"connected", deps_.registry.contains(agent_id)}});
  }
  return json{{"userId", user_id}, {"permissions", permissions}};
}

json ApiService::query_audit(const json& params) {
  control::AuditFilter filter{};
  filter.user_id = optional_integer(params, "userId");
  filter.agent_id = optional_string(params, "agentId");
  filter.command_type = optional_string(params, "commandType");
  if (const auto status = optional_string(params, "status"); status.has_value()) {
    filter.status = control::audit_status_from_name(*status);
    if (!filter.status.has_value()) {
      throw core::ValidationError("unknown audit status: " + *status);
    }
  }
  filter.start_ms = optional_integer(params, "start");
  filter.end_ms = optional_integer(params, "end");
  const auto limit = optional_integer(params, "limit").value_or(50);
  const auto offset = optional_integer(params, "offset").value_or(0);
  if (limit <= 0 || limit > 1000 || offset < 0) {
    throw core::ValidationError("limit must be 1..1000 and offset non-negative");
  }
  filter.limit = static_cast<std::size_t>(limit);
  filter.offset = static_cast<std::size_t>(offset);

  json entries = json::array();
  for (const auto& entry : deps_.audit.query(filter)) {
    entries.push_back(audit_json(entry));
  }
  return json{{"entries", entries}, {"total", deps_.audit.count(filter)}};
}

json ApiService::audit_stats(const json& params) {
  const auto end_ms = optional_integer(params, "end");
  const std::int64_t start_ms =
      optional_integer(params, "start").value_or(end_ms.value_or(core::unix_timestamp_now_ms()) - core::kMillisPerDay);
  if (end_ms.has_value() && *end_ms < start_ms) {
    throw core::ValidationError("end must not precede start");
  }

  const auto stats = deps_.audit.stats(start_ms, end_ms);
  json by_type = json::object();
  for (const auto& [type, count] : stats.by_command_type) {
    by_type[type] = count;
  }
  json by_status = json::object();
  for (const auto& [status, count] : stats.by_status) {
    by_status[status] = count;
  }
  return json{{"start", start_ms},
              {"end", end_ms.has_value() ? json(*end_ms) : json(nullptr)},
              {"totalCommands", stats.total},
              {"successfulCommands", stats.successful},
              {"failedCommands", stats.failed},
              {"uniqueUsers", stats.unique_users},
              {"uniqueAgents", stats.unique_agents},
              {"byCommandType", by_type},
              {"byStatus", by_status}};
}

json ApiService::submit_command(const auth::Principal& principal, const json& params, const std::string& peer) {
  control::CommandRequest request{};
  request.agent_id = require_string(params, "agentId");
  request.type = require_string(params, "type");
  request.target = optional_string(params, "target").value_or("");
  const auto params_it = params.find("params");
  if (params_it != params.end() && !params_it->is_null()) {
    request.params = *params_it;
  }
  request.elevated_credential = optional_string(params, "elevatedCredential").value_or("");
  request.ip_address = ip_of(peer);
  return result_json(deps_.dispatcher.dispatch(principal, request));
}

json ApiService::state_notification(const auth::Principal& principal) const {
  const auto visible = visible_agents(principal);
  json agents = json::array();
  for (const auto& agent : deps_.registry.agents()) {
    const auto it = visible.find(agent.id);
    if (it == visible.end()) {
      continue;
    }
    json entry = agent;
    entry["permissionLevel"] = static_cast<int>(it->second);
    const auto latest = deps_.registry.latest(agent.id);
    entry["latest"] = latest.has_value() ? json(*latest) : json(nullptr);
    agents.push_back(std::move(entry));
  }
  return make_notification("state", json{{"agents", agents}});
}

std::optional<json> ApiService::event_notification(const auth::Principal& principal,
                                                   const gateway::HubEvent& event) const {
  if (!principal.superadmin && !deps_.resolver.resolve(principal.user_id, event.agent_id).visible) {
    return std::nullopt;
  }

  json params{{"agentId", event.agent_id}, {"timestamp", event.timestamp_ms}};
  if (event.agent.has_value()) {
    params["agent"] = *event.agent;
  }
  if (event.snapshot.has_value()) {
    params["metrics"] = *event.snapshot;
  }
  return make_notification(gateway::event_kind_name(event.kind), params);
}

}  // namespace fleet_hub::api
