#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/sqlite.hpp"

namespace fleet_hub::control {

enum class AuditStatus : std::uint8_t {
  PENDING = 0,
  SUCCESS = 1,
  FAILED = 2,
  TIMEOUT = 3,
  DISCONNECTED = 4,
};

const char* audit_status_name(AuditStatus status) noexcept;
std::optional<AuditStatus> audit_status_from_name(const std::string& name) noexcept;

struct AuditEntry {
  std::int64_t id{0};
  std::int64_t timestamp_ms{0};
  std::int64_t user_id{0};
  std::string username{};
  std::string agent_id{};
  std::string agent_hostname{};
  std::string command_type{};
  std::string command_id{};
  std::string target{};
  nlohmann::json params = nlohmann::json::object();
  AuditStatus status{AuditStatus::PENDING};
  bool success{false};
  std::string error{};
  std::int64_t duration_ms{0};
  std::string ip_address{};
};

struct AuditFilter {
  std::optional<std::int64_t> user_id{};
  std::optional<std::string> agent_id{};
  std::optional<std::string> command_type{};
  std::optional<AuditStatus> status{};
  std::optional<std::int64_t> start_ms{};
  std::optional<std::int64_t> end_ms{};
  std::size_t limit{50};
  std::size_t offset{0};
};

struct AuditStats {
  std::int64_t total{0};
  std::int64_t successful{0};
  // Settled without success: failed, timeout or disconnected.
  std::int64_t failed{0};
  std::int64_t unique_users{0};
  std::int64_t unique_agents{0};
  std::map<std::string, std::int64_t> by_command_type{};
  std::map<std::string, std::int64_t> by_status{};
};

// One row per command attempt. A row is inserted as PENDING and settled
// exactly once; settled rows are only ever removed by prune().
class AuditLog {
 public:
  explicit AuditLog(core::SqliteDatabase& db);

  void ensure_schema();

  std::int64_t record_pending(const AuditEntry& entry);
  // Throws core::ConflictError when the row is missing or already settled.
  void complete(std::int64_t id, AuditStatus status, const std::string& error, std::int64_t duration_ms);

  [[nodiscard]] std::vector<AuditEntry> query(const AuditFilter& filter);
  [[nodiscard]] std::size_t count(const AuditFilter& filter);
  [[nodiscard]] std::optional<AuditEntry> find(std::int64_t id);
  // Aggregates rows with start_ms <= timestamp <= end_ms; either bound may be open.
  [[nodiscard]] AuditStats stats(std::optional<std::int64_t> start_ms, std::optional<std::int64_t> end_ms);
  std::size_t prune(std::int64_t before_ms);

 private:
  core::SqliteDatabase& db_;
};

}  // namespace fleet_hub::control
