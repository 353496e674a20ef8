#include "control/audit_log.hpp"

#include "core/errors.hpp"

namespace fleet_hub::control {
namespace {

constexpr const char* kCreateAuditTable =
    "CREATE TABLE IF NOT EXISTS audit_logs ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    timestamp INTEGER NOT NULL,"
    "    user_id INTEGER NOT NULL,"
    "    username TEXT NOT NULL,"
    "    agent_id TEXT NOT NULL,"
    "    agent_hostname TEXT NOT NULL DEFAULT '',"
    "    command_type TEXT NOT NULL,"
    "    command_id TEXT NOT NULL,"
    "    target TEXT NOT NULL DEFAULT '',"
    "    params TEXT NOT NULL DEFAULT '{}',"
    "    status TEXT NOT NULL,"
    "    success INTEGER NOT NULL DEFAULT 0,"
    "    error TEXT NOT NULL DEFAULT '',"
    "    duration_ms INTEGER NOT NULL DEFAULT 0,"
    "    ip_address TEXT NOT NULL DEFAULT ''"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_audit_logs_timestamp ON audit_logs(timestamp);"
    "CREATE INDEX IF NOT EXISTS idx_audit_logs_agent ON audit_logs(agent_id, timestamp);"
    "CREATE INDEX IF NOT EXISTS idx_audit_logs_user ON audit_logs(user_id, timestamp);";

constexpr const char* kSelectColumns =
    "SELECT id, timestamp, user_id, username, agent_id, agent_hostname, command_type, command_id, target, params,"
    " status, success, error, duration_ms, ip_address FROM audit_logs";

// Builds the WHERE clause and binds it in one place so query() and count() agree.
class FilterBinder {
 public:
  explicit FilterBinder(const AuditFilter& filter) : filter_(filter) {
    add(filter.user_id.has_value(), "user_id = ?");
    add(filter.agent_id.has_value(), "agent_id = ?");
    add(filter.command_type.has_value(), "command_type = ?");
    add(filter.status.has_value(), "status = ?");
    add(filter.start_ms.has_value(), "timestamp >= ?");
    add(filter.end_ms.has_value(), "timestamp <= ?");
  }

  [[nodiscard]] const std::string& where() const { return where_; }

  int bind(core::Statement& stmt) const {
    int index = 1;
    if (filter_.user_id.has_value()) {
      stmt.bind(index++, *filter_.user_id);
    }
    if (filter_.agent_id.has_value()) {
      stmt.bind(index++, *filter_.agent_id);
    }
    if (filter_.command_type.has_value()) {
      stmt.bind(index++, *filter_.command_type);
    }
    if (filter_.status.has_value()) {
      stmt.bind(index++, std::string(audit_status_name(*filter_.status)));
    }
    if (filter_.start_ms.has_value()) {
      stmt.bind(index++, *filter_.start_ms);
    }
    if (filter_.end_ms.has_value()) {
      stmt.bind(index++, *filter_.end_ms);
    }
    return index;
  }

 private:
  void add(const bool present, const char* condition) {
    if (!present) {
      return;
    }
    where_ += where_.empty() ? " WHERE " : " AND ";
    where_ += condition;
  }

  const AuditFilter& filter_;
  std::string where_{};
};

AuditEntry read_entry(const core::Statement& stmt) {
  AuditEntry entry{};
  entry.id = stmt.column_int64(0);
  entry.timestamp_ms = stmt.column_int64(1);
  entry.user_id = stmt.column_int64(2);
  entry.username = stmt.column_text(3);
  entry.agent_id = stmt.column_text(4);
  entry.agent_hostname = stmt.column_text(5);
  entry.command_type = stmt.column_text(6);
  entry.command_id = stmt.column_text(7);
  entry.target = stmt.column_text(8);
  entry.params = nlohmann::json::parse(stmt.column_text(9), nullptr, false);
  if (entry.params.is_discarded()) {
    entry.params = nlohmann::json::object();
  }
  entry.status = audit_status_from_name(stmt.column_text(10)).value_or(AuditStatus::PENDING);
  entry.success = stmt.column_int64(11) != 0;
  entry.error = stmt.column_text(12);
  entry.duration_ms = stmt.column_int64(13);
  entry.ip_address = stmt.column_text(14);
  return entry;
}

}  // namespace

const char* audit_status_name(const AuditStatus status) noexcept {
  switch (status) {
    case AuditStatus::PENDING:
      return "pending";
    case AuditStatus::SUCCESS:
      return "success";
    case AuditStatus::FAILED:
      return "failed";
    case AuditStatus::TIMEOUT:
      return "timeout";
    case AuditStatus::DISCONNECTED:
      return "disconnected";
  }
  return "pending";
}

std::optional<AuditStatus> audit_status_from_name(const std::string& name) noexcept {
  for (const auto status : {AuditStatus::PENDING, AuditStatus::SUCCESS, AuditStatus::FAILED, AuditStatus::TIMEOUT,
                            AuditStatus::DISCONNECTED}) {
    if (name == audit_status_name(status)) {
      return status;
    }
  }
  return std::nullopt;
}

AuditLog::AuditLog(core::SqliteDatabase& db) : db_(db) {}

void AuditLog::ensure_schema() {
  std::lock_guard<std::mutex> lock(db_.mutex());
  db_.exec(kCreateAuditTable);
}

std::int64_t AuditLog::record_pending(const AuditEntry& entry) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement insert(db_,
                         "INSERT INTO audit_logs (timestamp, user_id, username, agent_id, agent_hostname,"
                         " command_type, command_id, target, params, status, ip_address)"
                         " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
  insert.bind(1, entry.timestamp_ms)
      .bind(2, entry.user_id)
      .bind(3, entry.username)
      .bind(4, entry.agent_id)
      .bind(5, entry.agent_hostname)
      .bind(6, entry.command_type)
      .bind(7, entry.command_id)
      .bind(8, entry.target)
      .bind(9, entry.params.dump())
      .bind(10, std::string(audit_status_name(AuditStatus::PENDING)))
      .bind(11, entry.ip_address);
  insert.step();
  return db_.last_insert_rowid();
}

void AuditLog::complete(const std::int64_t id, const AuditStatus status, const std::string& error,
                        const std::int64_t duration_ms) {
  if (status == AuditStatus::PENDING) {
    throw core::ValidationError("audit rows cannot return to pending");
  }

  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement update(db_,
                         "UPDATE audit_logs SET status = ?, success = ?, error = ?, duration_ms = ?"
                         " WHERE id = ? AND status = 'pending'");
  update.bind(1, std::string(audit_status_name(status)))
      .bind(2, static_cast<std::int64_t>(status == AuditStatus::SUCCESS ? 1 : 0))
      .bind(3, error)
      .bind(4, duration_ms)
      .bind(5, id);
  update.step();
  if (db_.changes() == 0) {
    throw core::ConflictError("audit entry " + std::to_string(id) + " is not pending");
  }
}

std::vector<AuditEntry> AuditLog::query(const AuditFilter& filter) {
  const FilterBinder binder(filter);
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_,
                       std::string(kSelectColumns) + binder.where() + " ORDER BY timestamp DESC, id DESC LIMIT ? OFFSET ?");
  const int next = binder.bind(stmt);
  stmt.bind(next, static_cast<std::int64_t>(filter.limit == 0 ? 50 : filter.limit))
      .bind(next + 1, static_cast<std::int64_t>(filter.offset));

  std::vector<AuditEntry> entries;
  while (stmt.step()) {
    entries.push_back(read_entry(stmt));
  }
  return entries;
}

std::size_t AuditLog::count(const AuditFilter& filter) {
  const FilterBinder binder(filter);
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_, "SELECT COUNT(*) FROM audit_logs" + binder.where());
  binder.bind(stmt);
  return stmt.step() ? static_cast<std::size_t>(stmt.column_int64(0)) : 0;
}

std::optional<AuditEntry> AuditLog::find(const std::int64_t id) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_, std::string(kSelectColumns) + " WHERE id = ?");
  stmt.bind(1, id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_entry(stmt);
}

AuditStats AuditLog::stats(const std::optional<std::int64_t> start_ms, const std::optional<std::int64_t> end_ms) {
  AuditFilter window{};
  window.start_ms = start_ms;
  window.end_ms = end_ms;
  const FilterBinder binder(window);

  std::lock_guard<std::mutex> lock(db_.mutex());
  AuditStats stats{};
  core::Statement totals(db_,
                         "SELECT COUNT(*), COALESCE(SUM(success), 0), COUNT(DISTINCT user_id),"
                         " COUNT(DISTINCT agent_id) FROM audit_logs" +
                             binder.where());
  binder.bind(totals);
  if (totals.step()) {
    stats.total = totals.column_int64(0);
    stats.successful = totals.column_int64(1);
    stats.unique_users = totals.column_int64(2);
    stats.unique_agents = totals.column_int64(3);
  }

  core::Statement by_type(db_, "SELECT command_type, COUNT(*) FROM audit_logs" + binder.where() +
                                   " GROUP BY command_type");
  binder.bind(by_type);
  while (by_type.step()) {
    stats.by_command_type[by_type.column_text(0)] = by_type.column_int64(1);
  }

  core::Statement by_status(db_, "SELECT status, COUNT(*) FROM audit_logs" + binder.where() + " GROUP BY status");
  binder.bind(by_status);
  while (by_status.step()) {
    const std::string status = by_status.column_text(0);
    const std::int64_t count = by_status.column_int64(1);
    stats.by_status[status] = count;
    if (status != audit_status_name(AuditStatus::PENDING) && status != audit_status_name(AuditStatus::SUCCESS)) {
      stats.failed += count;
    }
  }
  return stats;
}

std::size_t AuditLog::prune(const std::int64_t before_ms) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_, "DELETE FROM audit_logs WHERE timestamp < ? AND status != 'pending'");
  stmt.bind(1, before_ms);
  stmt.step();
  return static_cast<std::size_t>(db_.changes());
}

}  // namespace fleet_hub::control
