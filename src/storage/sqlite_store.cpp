#include "storage/sqlite_store.hpp"

#include <algorithm>
#include <map>
#include <mutex>

#include "core/errors.hpp"

namespace fleet_hub::storage {
namespace {

constexpr const char* kCreateMetricsTable =
    "CREATE TABLE IF NOT EXISTS metrics ("
    "    time INTEGER NOT NULL,"
    "    agent_id TEXT NOT NULL,"
    "    cpu_percent REAL NOT NULL,"
    "    mem_total INTEGER NOT NULL,"
    "    mem_used INTEGER NOT NULL,"
    "    mem_available INTEGER NOT NULL,"
    "    PRIMARY KEY (time, agent_id)"
    ");";

constexpr const char* kCreateDiskMetricsTable =
    "CREATE TABLE IF NOT EXISTS disk_metrics ("
    "    time INTEGER NOT NULL,"
    "    agent_id TEXT NOT NULL,"
    "    mount_point TEXT NOT NULL,"
    "    total INTEGER NOT NULL,"
    "    used INTEGER NOT NULL,"
    "    read_bps REAL NOT NULL,"
    "    write_bps REAL NOT NULL,"
    "    PRIMARY KEY (time, agent_id, mount_point)"
    ");";

constexpr const char* kCreateNetworkMetricsTable =
    "CREATE TABLE IF NOT EXISTS network_metrics ("
    "    time INTEGER NOT NULL,"
    "    agent_id TEXT NOT NULL,"
    "    interface TEXT NOT NULL,"
    "    rx_bps REAL NOT NULL,"
    "    tx_bps REAL NOT NULL,"
    "    is_up INTEGER NOT NULL,"
    "    PRIMARY KEY (time, agent_id, interface)"
    ");";

constexpr const char* kCreateIndexes =
    "CREATE INDEX IF NOT EXISTS idx_metrics_agent_time ON metrics(agent_id, time DESC);";

constexpr const char* kUpsertMetric =
    "INSERT INTO metrics (time, agent_id, cpu_percent, mem_total, mem_used, mem_available) "
    "VALUES (?, ?, ?, ?, ?, ?) "
    "ON CONFLICT(time, agent_id) DO UPDATE SET cpu_percent = excluded.cpu_percent, "
    "mem_total = excluded.mem_total, mem_used = excluded.mem_used, mem_available = excluded.mem_available";

constexpr const char* kUpsertDisk =
    "INSERT INTO disk_metrics (time, agent_id, mount_point, total, used, read_bps, write_bps) "
    "VALUES (?, ?, ?, ?, ?, ?, ?) "
    "ON CONFLICT(time, agent_id, mount_point) DO UPDATE SET total = excluded.total, used = excluded.used, "
    "read_bps = excluded.read_bps, write_bps = excluded.write_bps";

constexpr const char* kDeleteDisks = "DELETE FROM disk_metrics WHERE time = ? AND agent_id = ?";
constexpr const char* kDeleteNetworks = "DELETE FROM network_metrics WHERE time = ? AND agent_id = ?";

constexpr const char* kUpsertNetwork =
    "INSERT INTO network_metrics (time, agent_id, interface, rx_bps, tx_bps, is_up) "
    "VALUES (?, ?, ?, ?, ?, ?) "
    "ON CONFLICT(time, agent_id, interface) DO UPDATE SET rx_bps = excluded.rx_bps, tx_bps = excluded.tx_bps, "
    "is_up = excluded.is_up";

}  // namespace

SqliteStore::SqliteStore(const std::string& path, const std::size_t default_limit)
    : db_(std::make_unique<core::SqliteDatabase>(path)), default_limit_(default_limit == 0 ? 600 : default_limit) {
  ensure_schema();
}

core::SqliteDatabase& SqliteStore::db() {
  if (db_ == nullptr) {
    throw core::StorageError("sqlite store is closed");
  }
  return *db_;
}

void SqliteStore::ensure_schema() {
  auto& database = db();
  std::lock_guard<std::mutex> lock(database.mutex());
  database.exec(kCreateMetricsTable);
  database.exec(kCreateDiskMetricsTable);
  database.exec(kCreateNetworkMetricsTable);
  database.exec(kCreateIndexes);
}

void SqliteStore::write(const model::MetricSnapshot& point) {
  auto& database = db();
  std::lock_guard<std::mutex> lock(database.mutex());
  core::Transaction tx(database);

  core::Statement metric(database, kUpsertMetric);
  metric.bind(1, point.timestamp_ms)
      .bind(2, point.agent_id)
      .bind(3, point.cpu.usage_percent)
      .bind(4, static_cast<std::int64_t>(point.memory.total))
      .bind(5, static_cast<std::int64_t>(point.memory.used))
      .bind(6, static_cast<std::int64_t>(point.memory.available));
  metric.step();

  // A rewritten snapshot replaces its child rows wholesale.
  core::Statement clear_disks(database, kDeleteDisks);
  clear_disks.bind(1, point.timestamp_ms).bind(2, point.agent_id);
  clear_disks.step();
  core::Statement clear_networks(database, kDeleteNetworks);
  clear_networks.bind(1, point.timestamp_ms).bind(2, point.agent_id);
  clear_networks.step();

  core::Statement disk(database, kUpsertDisk);
  for (const auto& entry : point.disks) {
    disk.reset();
    disk.bind(1, point.timestamp_ms)
        .bind(2, point.agent_id)
        .bind(3, entry.mount_point)
        .bind(4, static_cast<std::int64_t>(entry.total))
        .bind(5, static_cast<std::int64_t>(entry.used))
        .bind(6, entry.read_bps)
        .bind(7, entry.write_bps);
    disk.step();
  }

  core::Statement network(database, kUpsertNetwork);
  for (const auto& entry : point.networks) {
    network.reset();
    network.bind(1, point.timestamp_ms)
        .bind(2, point.agent_id)
        .bind(3, entry.interface)
        .bind(4, entry.rx_bps)
        .bind(5, entry.tx_bps)
        .bind(6, static_cast<std::int64_t>(entry.is_up ? 1 : 0));
    network.step();
  }

  tx.commit();
}

std::vector<model::MetricSnapshot> SqliteStore::query(const std::string& agent_id, const std::int64_t start_ms,
                                                      const std::int64_t end_ms, const std::size_t limit) {
  auto& database = db();
  std::lock_guard<std::mutex> lock(database.mutex());
  return query_locked(agent_id, start_ms, end_ms, limit == 0 ? default_limit_ : limit);
}

std::vector<model::MetricSnapshot> SqliteStore::query_locked(const std::string& agent_id,
                                                             const std::int64_t start_ms,
                                                             const std::int64_t end_ms, const std::size_t limit) {
  auto& database = db();
  std::map<std::int64_t, model::MetricSnapshot> by_time;

  core::Statement metrics(database,
                          "SELECT time, cpu_percent, mem_total, mem_used, mem_available FROM metrics "
                          "WHERE agent_id = ? AND time >= ? AND time <= ? ORDER BY time DESC LIMIT ?");
  metrics.bind(1, agent_id).bind(2, start_ms).bind(3, end_ms).bind(4, static_cast<std::int64_t>(limit));
  while (metrics.step()) {
    model::MetricSnapshot snapshot{};
    snapshot.agent_id = agent_id;
    snapshot.timestamp_ms = metrics.column_int64(0);
    snapshot.cpu.usage_percent = metrics.column_double(1);
    snapshot.memory.total = static_cast<std::uint64_t>(metrics.column_int64(2));
    snapshot.memory.used = static_cast<std::uint64_t>(metrics.column_int64(3));
    snapshot.memory.available = static_cast<std::uint64_t>(metrics.column_int64(4));
    by_time.emplace(snapshot.timestamp_ms, std::move(snapshot));
  }
  if (by_time.empty()) {
    return {};
  }

  const std::int64_t first = by_time.begin()->first;
  const std::int64_t last = by_time.rbegin()->first;

  core::Statement disks(database,
                        "SELECT time, mount_point, total, used, read_bps, write_bps FROM disk_metrics "
                        "WHERE agent_id = ? AND time >= ? AND time <= ? ORDER BY time, mount_point");
  disks.bind(1, agent_id).bind(2, first).bind(3, last);
  while (disks.step()) {
    const auto it = by_time.find(disks.column_int64(0));
    if (it == by_time.end()) {
      continue;
    }
    it->second.disks.push_back(model::DiskMetrics{.mount_point = disks.column_text(1),
                                                  .total = static_cast<std::uint64_t>(disks.column_int64(2)),
                                                  .used = static_cast<std::uint64_t>(disks.column_int64(3)),
                                                  .read_bps = disks.column_double(4),
                                                  .write_bps = disks.column_double(5)});
  }

  core::Statement networks(database,
                           "SELECT time, interface, rx_bps, tx_bps, is_up FROM network_metrics "
                           "WHERE agent_id = ? AND time >= ? AND time <= ? ORDER BY time, interface");
  networks.bind(1, agent_id).bind(2, first).bind(3, last);
  while (networks.step()) {
    const auto it = by_time.find(networks.column_int64(0));
    if (it == by_time.end()) {
      continue;
    }
    it->second.networks.push_back(model::NetworkMetrics{.interface = networks.column_text(1),
                                                        .rx_bps = networks.column_double(2),
                                                        .tx_bps = networks.column_double(3),
                                                        .is_up = networks.column_int64(4) != 0});
  }

  std::vector<model::MetricSnapshot> points;
  points.reserve(by_time.size());
  for (auto& [time, snapshot] : by_time) {
    points.push_back(std::move(snapshot));
  }
  return points;
}

AgentSeries SqliteStore::query_all(const std::int64_t start_ms, const std::int64_t end_ms, const std::size_t limit) {
  auto& database = db();
  std::lock_guard<std::mutex> lock(database.mutex());

  std::vector<std::string> agents;
  {
    core::Statement stmt(database, "SELECT DISTINCT agent_id FROM metrics WHERE time >= ? AND time <= ?");
    stmt.bind(1, start_ms).bind(2, end_ms);
    while (stmt.step()) {
      agents.push_back(stmt.column_text(0));
    }
  }

  AgentSeries result;
  for (const auto& agent_id : agents) {
    auto points = query_locked(agent_id, start_ms, end_ms, limit == 0 ? default_limit_ : limit);
    if (!points.empty()) {
      result.emplace(agent_id, std::move(points));
    }
  }
  return result;
}

void SqliteStore::delete_before(const std::int64_t before_ms) {
  auto& database = db();
  std::lock_guard<std::mutex> lock(database.mutex());
  core::Transaction tx(database);
  for (const char* table : {"metrics", "disk_metrics", "network_metrics"}) {
    core::Statement stmt(database, std::string("DELETE FROM ") + table + " WHERE time < ?");
    stmt.bind(1, before_ms);
    stmt.step();
  }
  tx.commit();
}

void SqliteStore::close() {
  db_.reset();
}

std::size_t SqliteStore::row_count(const std::string& agent_id) {
  auto& database = db();
  std::lock_guard<std::mutex> lock(database.mutex());
  core::Statement stmt(database, "SELECT COUNT(*) FROM metrics WHERE agent_id = ?");
  stmt.bind(1, agent_id);
  stmt.step();
  return static_cast<std::size_t>(stmt.column_int64(0));
}

}  // namespace fleet_hub::storage
