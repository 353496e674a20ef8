#pragma once

#include <memory>

#include "api/api_server.hpp"
#include "api/api_service.hpp"
#include "auth/auth_store.hpp"
#include "auth/authenticator.hpp"
#include "auth/resolver.hpp"
#include "control/audit_log.hpp"
#include "control/dispatcher.hpp"
#include "core/config.hpp"
#include "core/maintenance.hpp"
#include "core/sqlite.hpp"
#include "gateway/event_bus.hpp"
#include "gateway/gateway.hpp"
#include "registry/agent_registry.hpp"
#include "storage/history_archive.hpp"
#include "storage/storage_engine.hpp"

namespace fleet_hub::core {

// Owns every long-lived component. Construction wires them together and
// prepares schemas; start() opens the listeners; stop() (or destruction)
// tears down in reverse dependency order.
class Hub {
 public:
  explicit Hub(HubConfig config);
  ~Hub();

  Hub(const Hub&) = delete;
  Hub& operator=(const Hub&) = delete;

  void start();
  void stop();

  [[nodiscard]] const HubConfig& config() const noexcept { return config_; }
  registry::AgentRegistry& registry() noexcept { return registry_; }
  storage::StorageEngine& storage() noexcept { return *storage_; }
  gateway::Gateway& gateway() noexcept { return *gateway_; }
  api::ApiService& api() noexcept { return *api_service_; }
  MaintenanceWorker& maintenance() noexcept { return maintenance_; }

 private:
  void register_maintenance_tasks();

  HubConfig config_;
  std::unique_ptr<SqliteDatabase> database_;
  std::unique_ptr<auth::AuthStore> auth_store_;
  std::unique_ptr<auth::Authenticator> authenticator_;
  std::unique_ptr<auth::PermissionResolver> resolver_;
  std::unique_ptr<control::AuditLog> audit_;
  std::unique_ptr<storage::HistoryArchive> history_;
  std::unique_ptr<storage::StorageEngine> storage_;
  registry::AgentRegistry registry_{};
  gateway::EventBus events_;
  std::unique_ptr<gateway::Gateway> gateway_;
  std::unique_ptr<control::CommandDispatcher> dispatcher_;
  std::unique_ptr<api::ApiService> api_service_;
  std::unique_ptr<api::ApiServer> api_server_;
  MaintenanceWorker maintenance_{};
  // Hours before this have been checked for missing rollups.
  std::int64_t rollup_watermark_ms_{0};
  bool started_{false};
};

}  // namespace fleet_hub::core
