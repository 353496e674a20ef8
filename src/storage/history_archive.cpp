#include "storage/history_archive.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <map>
#include <stdexcept>

#include "core/errors.hpp"
#include "core/timestamp.hpp"

namespace fleet_hub::storage {
namespace {

constexpr const char* kPartitionPrefix = "metrics_history_";

constexpr const char* kCreateHourlyTable =
    "CREATE TABLE IF NOT EXISTS metrics_hourly ("
    "    agent_id TEXT NOT NULL,"
    "    bucket INTEGER NOT NULL,"
    "    cpu_avg REAL NOT NULL,"
    "    cpu_max REAL NOT NULL,"
    "    mem_avg REAL NOT NULL,"
    "    mem_max REAL NOT NULL,"
    "    net_rx_total REAL NOT NULL,"
    "    net_tx_total REAL NOT NULL,"
    "    data_points INTEGER NOT NULL,"
    "    PRIMARY KEY (agent_id, bucket)"
    ");";

constexpr const char* kCreateDailyTable =
    "CREATE TABLE IF NOT EXISTS metrics_daily ("
    "    agent_id TEXT NOT NULL,"
    "    bucket INTEGER NOT NULL,"
    "    cpu_avg REAL NOT NULL,"
    "    cpu_max REAL NOT NULL,"
    "    mem_avg REAL NOT NULL,"
    "    mem_max REAL NOT NULL,"
    "    net_rx_total REAL NOT NULL,"
    "    net_tx_total REAL NOT NULL,"
    "    data_points INTEGER NOT NULL,"
    "    PRIMARY KEY (agent_id, bucket)"
    ");";

std::string create_partition_sql(const std::string& table) {
  return "CREATE TABLE IF NOT EXISTS " + table +
         " ("
         "    agent_id TEXT NOT NULL,"
         "    timestamp INTEGER NOT NULL,"
         "    cpu_percent REAL NOT NULL,"
         "    mem_percent REAL NOT NULL,"
         "    disk_read_bps REAL NOT NULL,"
         "    disk_write_bps REAL NOT NULL,"
         "    net_rx_bps REAL NOT NULL,"
         "    net_tx_bps REAL NOT NULL,"
         "    gpu_percent REAL NOT NULL,"
         "    load_avg1 REAL NOT NULL,"
         "    PRIMARY KEY (agent_id, timestamp)"
         ");";
}

RollupRow read_rollup(const core::Statement& stmt) {
  return RollupRow{.agent_id = stmt.column_text(0),
                   .bucket_ms = stmt.column_int64(1),
                   .cpu_avg = stmt.column_double(2),
                   .cpu_max = stmt.column_double(3),
                   .mem_avg = stmt.column_double(4),
                   .mem_max = stmt.column_double(5),
                   .net_rx_total = stmt.column_double(6),
                   .net_tx_total = stmt.column_double(7),
                   .data_points = stmt.column_int64(8)};
}

HistoryPoint read_point(const core::Statement& stmt) {
  return HistoryPoint{.agent_id = stmt.column_text(0),
                      .timestamp_ms = stmt.column_int64(1),
                      .cpu_percent = stmt.column_double(2),
                      .mem_percent = stmt.column_double(3),
                      .disk_read_bps = stmt.column_double(4),
                      .disk_write_bps = stmt.column_double(5),
                      .net_rx_bps = stmt.column_double(6),
                      .net_tx_bps = stmt.column_double(7),
                      .gpu_percent = stmt.column_double(8),
                      .load_avg1 = stmt.column_double(9)};
}

}  // namespace

std::string partition_name(const int year, const int month) {
  if (month < 1 || month > 12) {
    throw std::invalid_argument("month must be in range 1..12");
  }
  if (year < 1970 || year > 9999) {
    throw std::invalid_argument("year must be in range 1970..9999");
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%s%04d_%02d", kPartitionPrefix, year, month);
  return buffer;
}

YearMonth year_month_of(const std::int64_t timestamp_ms) {
  const std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  return YearMonth{.year = utc.tm_year + 1900, .month = utc.tm_mon + 1};
}

std::string partition_name_for(const std::int64_t timestamp_ms) {
  const YearMonth month = year_month_of(timestamp_ms);
  return partition_name(month.year, month.month);
}

std::optional<YearMonth> parse_partition_name(const std::string& name) {
  const std::string prefix = kPartitionPrefix;
  if (name.size() != prefix.size() + 7 || name.rfind(prefix, 0) != 0 || name[prefix.size() + 4] != '_') {
    return std::nullopt;
  }
  const std::string year_text = name.substr(prefix.size(), 4);
  const std::string month_text = name.substr(prefix.size() + 5, 2);
  const auto is_digit = [](const char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  if (!std::all_of(year_text.begin(), year_text.end(), is_digit) ||
      !std::all_of(month_text.begin(), month_text.end(), is_digit)) {
    return std::nullopt;
  }
  const YearMonth parsed{.year = std::stoi(year_text), .month = std::stoi(month_text)};
  if (parsed.month < 1 || parsed.month > 12) {
    return std::nullopt;
  }
  return parsed;
}

std::int64_t month_start_ms(const YearMonth& month) {
  std::tm utc{};
  utc.tm_year = month.year - 1900;
  utc.tm_mon = month.month - 1;
  utc.tm_mday = 1;
  return static_cast<std::int64_t>(timegm(&utc)) * 1000;
}

YearMonth next_month(const YearMonth& month) {
  if (month.month == 12) {
    return YearMonth{.year = month.year + 1, .month = 1};
  }
  return YearMonth{.year = month.year, .month = month.month + 1};
}

YearMonth retention_cutoff(const std::int64_t now_ms, const std::uint32_t retention_days) {
  return year_month_of(now_ms - static_cast<std::int64_t>(retention_days) * core::kMillisPerDay);
}

std::int64_t bucket_width_ms(const std::string& interval, const std::int64_t start_ms, const std::int64_t end_ms) {
  if (interval == "1m") {
    return core::kMillisPerMinute;
  }
  if (interval == "5m") {
    return 5 * core::kMillisPerMinute;
  }
  if (interval == "1h") {
    return core::kMillisPerHour;
  }
  if (interval == "1d") {
    return core::kMillisPerDay;
  }

  const std::int64_t range = end_ms - start_ms;
  if (range <= core::kMillisPerHour) {
    return core::kMillisPerMinute;
  }
  if (range <= 6 * core::kMillisPerHour) {
    return 5 * core::kMillisPerMinute;
  }
  if (range <= core::kMillisPerDay) {
    return 15 * core::kMillisPerMinute;
  }
  if (range <= 7 * core::kMillisPerDay) {
    return core::kMillisPerHour;
  }
  return core::kMillisPerDay;
}

HistoryPoint to_history_point(const model::MetricSnapshot& snapshot) {
  HistoryPoint point{};
  point.agent_id = snapshot.agent_id;
  point.timestamp_ms = snapshot.timestamp_ms;
  point.cpu_percent = snapshot.cpu.usage_percent;
  point.mem_percent = model::memory_percent(snapshot.memory);
  for (const auto& disk : snapshot.disks) {
    point.disk_read_bps += disk.read_bps;
    point.disk_write_bps += disk.write_bps;
  }
  for (const auto& network : snapshot.networks) {
    point.net_rx_bps += network.rx_bps;
    point.net_tx_bps += network.tx_bps;
  }
  if (!snapshot.gpus.empty()) {
    double total = 0.0;
    for (const auto& gpu : snapshot.gpus) {
      total += gpu.usage_percent;
    }
    point.gpu_percent = total / static_cast<double>(snapshot.gpus.size());
  }
  if (!snapshot.load_average.empty()) {
    point.load_avg1 = snapshot.load_average.front();
  }
  return point;
}

HistoryArchive::HistoryArchive(core::SqliteDatabase& db, HistoryOptions options) : db_(db), options_(options) {}

void HistoryArchive::ensure_schema(const std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  db_.exec(kCreateHourlyTable);
  db_.exec(kCreateDailyTable);
  for (const auto& name : partitions_locked()) {
    known_partitions_.insert(name);
  }
  ensure_partition_locked(year_month_of(now_ms));
}

std::string HistoryArchive::ensure_partition(const std::int64_t timestamp_ms) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  return ensure_partition_locked(year_month_of(timestamp_ms));
}

std::string HistoryArchive::ensure_partition_locked(const YearMonth& month) {
  const std::string table = partition_name(month.year, month.month);
  if (known_partitions_.count(table) != 0) {
    return table;
  }
  db_.exec(create_partition_sql(table));
  known_partitions_.insert(table);
  std::cerr << "[history] created partition " << table << '\n';
  return table;
}

void HistoryArchive::append(const model::MetricSnapshot& snapshot) {
  const HistoryPoint point = to_history_point(snapshot);

  std::lock_guard<std::mutex> lock(db_.mutex());
  const std::string table = ensure_partition_locked(year_month_of(point.timestamp_ms));
  core::Statement insert(db_, "INSERT OR REPLACE INTO " + table +
                                  " (agent_id, timestamp, cpu_percent, mem_percent, disk_read_bps, disk_write_bps,"
                                  " net_rx_bps, net_tx_bps, gpu_percent, load_avg1)"
                                  " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
  insert.bind(1, point.agent_id)
      .bind(2, point.timestamp_ms)
      .bind(3, point.cpu_percent)
      .bind(4, point.mem_percent)
      .bind(5, point.disk_read_bps)
      .bind(6, point.disk_write_bps)
      .bind(7, point.net_rx_bps)
      .bind(8, point.net_tx_bps)
      .bind(9, point.gpu_percent)
      .bind(10, point.load_avg1);
  insert.step();
}

std::vector<std::string> HistoryArchive::partitions() {
  std::lock_guard<std::mutex> lock(db_.mutex());
  return partitions_locked();
}

std::vector<std::string> HistoryArchive::partitions_locked() {
  core::Statement stmt(db_,
                       "SELECT name FROM sqlite_master WHERE type = 'table' AND name LIKE 'metrics_history_%' "
                       "ORDER BY name");
  std::vector<std::string> names;
  while (stmt.step()) {
    std::string name = stmt.column_text(0);
    if (parse_partition_name(name).has_value()) {
      names.push_back(std::move(name));
    }
  }
  return names;
}

std::vector<std::string> HistoryArchive::partitions_between_locked(const std::int64_t start_ms,
                                                                   const std::int64_t end_ms) {
  const YearMonth first = year_month_of(start_ms);
  const YearMonth last = year_month_of(end_ms);
  std::vector<std::string> names;
  for (const auto& name : partitions_locked()) {
    const auto month = parse_partition_name(name);
    if (month.has_value() && !(*month < first) && !(last < *month)) {
      names.push_back(name);
    }
  }
  return names;
}

std::vector<std::string> HistoryArchive::drop_expired_partitions(const std::int64_t now_ms) {
  const YearMonth cutoff = retention_cutoff(now_ms, options_.retention_days);

  std::lock_guard<std::mutex> lock(db_.mutex());
  std::vector<std::string> dropped;
  for (const auto& name : partitions_locked()) {
    const auto month = parse_partition_name(name);
    if (!month.has_value() || !(*month < cutoff)) {
      continue;
    }
    db_.exec("DROP TABLE IF EXISTS " + name + ";");
    known_partitions_.erase(name);
    dropped.push_back(name);
    std::cerr << "[history] dropped expired partition " << name << '\n';
  }
  return dropped;
}

std::size_t HistoryArchive::aggregate_hourly(const std::int64_t hour_start_ms) {
  const std::int64_t bucket = hour_start_ms - (hour_start_ms % core::kMillisPerHour);
  const std::string table = partition_name_for(bucket);

  std::lock_guard<std::mutex> lock(db_.mutex());
  if (known_partitions_.count(table) == 0 && !db_.table_exists(table)) {
    return 0;
  }
  core::Statement insert(db_, "INSERT OR IGNORE INTO metrics_hourly (agent_id, bucket, cpu_avg, cpu_max, mem_avg,"
                              " mem_max, net_rx_total, net_tx_total, data_points)"
                              " SELECT agent_id, ?, AVG(cpu_percent), MAX(cpu_percent), AVG(mem_percent),"
                              " MAX(mem_percent), SUM(net_rx_bps), SUM(net_tx_bps), COUNT(*) FROM " +
                                  table + " WHERE timestamp >= ? AND timestamp < ? GROUP BY agent_id");
  insert.bind(1, bucket).bind(2, bucket).bind(3, bucket + core::kMillisPerHour);
  insert.step();
  return static_cast<std::size_t>(db_.changes());
}

std::size_t HistoryArchive::aggregate_daily(const std::int64_t day_start_ms) {
  const std::int64_t bucket = day_start_ms - (day_start_ms % core::kMillisPerDay);

  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement insert(db_,
                         "INSERT OR IGNORE INTO metrics_daily (agent_id, bucket, cpu_avg, cpu_max, mem_avg, mem_max,"
                         " net_rx_total, net_tx_total, data_points)"
                         " SELECT agent_id, ?, SUM(cpu_avg * data_points) / SUM(data_points), MAX(cpu_max),"
                         " SUM(mem_avg * data_points) / SUM(data_points), MAX(mem_max), SUM(net_rx_total),"
                         " SUM(net_tx_total), SUM(data_points) FROM metrics_hourly"
                         " WHERE bucket >= ? AND bucket < ? GROUP BY agent_id HAVING SUM(data_points) > 0");
  insert.bind(1, bucket).bind(2, bucket).bind(3, bucket + core::kMillisPerDay);
  insert.step();
  return static_cast<std::size_t>(db_.changes());
}

std::size_t HistoryArchive::prune_rollups(const std::int64_t now_ms) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  std::size_t removed = 0;

  core::Statement hourly(db_, "DELETE FROM metrics_hourly WHERE bucket < ?");
  hourly.bind(1, now_ms - static_cast<std::int64_t>(options_.hourly_retention_days) * core::kMillisPerDay);
  hourly.step();
  removed += static_cast<std::size_t>(db_.changes());

  core::Statement daily(db_, "DELETE FROM metrics_daily WHERE bucket < ?");
  daily.bind(1, now_ms - static_cast<std::int64_t>(options_.daily_retention_days) * core::kMillisPerDay);
  daily.step();
  removed += static_cast<std::size_t>(db_.changes());
  return removed;
}

std::vector<RollupMismatch> HistoryArchive::reconcile_hourly(const std::int64_t hour_start_ms) {
  const std::int64_t bucket = hour_start_ms - (hour_start_ms % core::kMillisPerHour);
  const std::string table = partition_name_for(bucket);

  std::lock_guard<std::mutex> lock(db_.mutex());
  std::map<std::string, std::int64_t> source;
  if (db_.table_exists(table)) {
    core::Statement counts(db_, "SELECT agent_id, COUNT(*) FROM " + table +
                                    " WHERE timestamp >= ? AND timestamp < ? GROUP BY agent_id");
    counts.bind(1, bucket).bind(2, bucket + core::kMillisPerHour);
    while (counts.step()) {
      source[counts.column_text(0)] = counts.column_int64(1);
    }
  }

  std::map<std::string, std::int64_t> rollup;
  core::Statement rows(db_, "SELECT agent_id, data_points FROM metrics_hourly WHERE bucket = ?");
  rows.bind(1, bucket);
  while (rows.step()) {
    rollup[rows.column_text(0)] = rows.column_int64(1);
  }

  std::vector<RollupMismatch> mismatches;
  for (const auto& [agent_id, count] : source) {
    const auto it = rollup.find(agent_id);
    const std::int64_t stored = it == rollup.end() ? 0 : it->second;
    if (stored != count) {
      mismatches.push_back(RollupMismatch{
          .agent_id = agent_id, .bucket_ms = bucket, .rollup_points = stored, .source_points = count});
    }
  }
  for (const auto& [agent_id, stored] : rollup) {
    if (source.count(agent_id) == 0) {
      mismatches.push_back(
          RollupMismatch{.agent_id = agent_id, .bucket_ms = bucket, .rollup_points = stored, .source_points = 0});
    }
  }
  return mismatches;
}

std::size_t HistoryArchive::backfill_hourly(const std::int64_t from_ms, const std::int64_t to_ms) {
  std::size_t added = 0;
  for (std::int64_t hour = from_ms - (from_ms % core::kMillisPerHour); hour < to_ms; hour += core::kMillisPerHour) {
    const auto mismatches = reconcile_hourly(hour);
    const bool missing = std::any_of(mismatches.begin(), mismatches.end(), [](const RollupMismatch& m) {
      return m.rollup_points == 0 && m.source_points > 0;
    });
    if (!missing) {
      continue;
    }
    const std::size_t rows = aggregate_hourly(hour);
    if (rows > 0) {
      std::cerr << "[history] backfilled " << rows << " hourly rollup(s) for bucket " << hour << '\n';
    }
    added += rows;
  }
  return added;
}

std::vector<HistoryPoint> HistoryArchive::query_raw(const std::string& agent_id, const std::int64_t start_ms,
                                                    const std::int64_t end_ms, const std::size_t limit) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  std::vector<HistoryPoint> points;
  for (const auto& table : partitions_between_locked(start_ms, end_ms)) {
    core::Statement stmt(db_, "SELECT agent_id, timestamp, cpu_percent, mem_percent, disk_read_bps, disk_write_bps,"
                              " net_rx_bps, net_tx_bps, gpu_percent, load_avg1 FROM " +
                                  table + " WHERE agent_id = ? AND timestamp >= ? AND timestamp <= ? ORDER BY timestamp");
    stmt.bind(1, agent_id).bind(2, start_ms).bind(3, end_ms);
    while (stmt.step()) {
      points.push_back(read_point(stmt));
    }
  }
  if (limit != 0 && points.size() > limit) {
    points.erase(points.begin(), points.end() - static_cast<std::ptrdiff_t>(limit));
  }
  return points;
}

std::vector<HistoryPoint> HistoryArchive::query_bucketed(const std::string& agent_id, const std::int64_t start_ms,
                                                         const std::int64_t end_ms, const std::int64_t bucket_ms) {
  if (bucket_ms <= 0) {
    throw core::ValidationError("bucket width must be positive");
  }

  std::lock_guard<std::mutex> lock(db_.mutex());
  std::vector<HistoryPoint> points;
  for (const auto& table : partitions_between_locked(start_ms, end_ms)) {
    core::Statement stmt(db_, "SELECT agent_id, (timestamp / ?) * ? AS bucket, AVG(cpu_percent), AVG(mem_percent),"
                              " AVG(disk_read_bps), AVG(disk_write_bps), AVG(net_rx_bps), AVG(net_tx_bps),"
                              " AVG(gpu_percent), AVG(load_avg1) FROM " +
                                  table +
                                  " WHERE agent_id = ? AND timestamp >= ? AND timestamp <= ?"
                                  " GROUP BY bucket ORDER BY bucket");
    stmt.bind(1, bucket_ms).bind(2, bucket_ms).bind(3, agent_id).bind(4, start_ms).bind(5, end_ms);
    while (stmt.step()) {
      points.push_back(read_point(stmt));
    }
  }
  return points;
}

std::vector<RollupRow> HistoryArchive::query_hourly(const std::string& agent_id, const std::int64_t start_ms,
                                                    const std::int64_t end_ms) {
  return query_rollup("metrics_hourly", agent_id, start_ms, end_ms);
}

std::vector<RollupRow> HistoryArchive::query_daily(const std::string& agent_id, const std::int64_t start_ms,
                                                   const std::int64_t end_ms) {
  return query_rollup("metrics_daily", agent_id, start_ms, end_ms);
}

std::vector<RollupRow> HistoryArchive::query_rollup(const char* table, const std::string& agent_id,
                                                    const std::int64_t start_ms, const std::int64_t end_ms) {
  std::lock_guard<std::mutex> lock(db_.mutex());
  core::Statement stmt(db_, std::string("SELECT agent_id, bucket, cpu_avg, cpu_max, mem_avg, mem_max, net_rx_total,"
                                        " net_tx_total, data_points FROM ") +
                                table + " WHERE agent_id = ? AND bucket >= ? AND bucket <= ? ORDER BY bucket");
  stmt.bind(1, agent_id).bind(2, start_ms).bind(3, end_ms);
  std::vector<RollupRow> rows;
  while (stmt.step()) {
    rows.push_back(read_rollup(stmt));
  }
  return rows;
}

}  // namespace fleet_hub::storage
