#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "auth/auth_store.hpp"
#include "auth/authenticator.hpp"
#include "auth/resolver.hpp"
#include "control/audit_log.hpp"
#include "control/dispatcher.hpp"
#include "gateway/event_bus.hpp"
#include "registry/agent_registry.hpp"
#include "storage/history_archive.hpp"
#include "storage/storage_engine.hpp"

namespace fleet_hub::api {

struct ApiDependencies {
  registry::AgentRegistry& registry;
  storage::StorageEngine& storage;
  storage::HistoryArchive* history;
  auth::AuthStore& auth_store;
  auth::Authenticator& authenticator;
  const auth::PermissionResolver& resolver;
  control::CommandDispatcher& dispatcher;
  control::AuditLog& audit;
  gateway::EventBus& events;
};

// Method table behind the JSON-RPC API. Every method but `health` takes the
// caller's bearer token in params.token. Agents the caller cannot see are
// reported exactly like agents that do not exist.
class ApiService {
 public:
  explicit ApiService(ApiDependencies deps);

  // Throws the core error hierarchy; ApiServer maps it to JSON-RPC codes.
  nlohmann::json call(const std::string& method, const nlohmann::json& params, const std::string& peer);

  auth::Principal authenticate(const nlohmann::json& params);

  // Agent id -> effective level, for every registered agent the caller can see.
  [[nodiscard]] std::map<std::string, auth::PermissionLevel> visible_agents(const auth::Principal& principal) const;

  // Initial push for a new subscriber.
  nlohmann::json state_notification(const auth::Principal& principal) const;
  // nullopt when the event concerns an agent the subscriber cannot see.
  std::optional<nlohmann::json> event_notification(const auth::Principal& principal,
                                                   const gateway::HubEvent& event) const;

 private:
  nlohmann::json health() const;
  nlohmann::json elevate(const auth::Principal& principal, const nlohmann::json& params);

  nlohmann::json list_agents(const auth::Principal& principal) const;
  nlohmann::json get_agent(const auth::Principal& principal, const nlohmann::json& params) const;
  nlohmann::json latest_metrics(const auth::Principal& principal, const nlohmann::json& params) const;
  nlohmann::json metrics_history(const auth::Principal& principal, const nlohmann::json& params);
  nlohmann::json metrics_summary(const auth::Principal& principal) const;

  nlohmann::json create_user(const nlohmann::json& params);
  nlohmann::json list_users();
  nlohmann::json create_group(const nlohmann::json& params);
  nlohmann::json get_group(const nlohmann::json& params);
  nlohmann::json update_group(const nlohmann::json& params);
  nlohmann::json set_binding(const nlohmann::json& params);
  nlohmann::json grant_permission(const auth::Principal& principal, const nlohmann::json& params);
  nlohmann::json effective_permissions(const auth::Principal& principal, const nlohmann::json& params);
  nlohmann::json query_audit(const nlohmann::json& params);
  nlohmann::json audit_stats(const nlohmann::json& params);
  nlohmann::json submit_command(const auth::Principal& principal, const nlohmann::json& params,
                                const std::string& peer);

  ApiDependencies deps_;
};

}  // namespace fleet_hub::api
