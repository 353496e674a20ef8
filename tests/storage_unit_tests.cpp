#include <cmath>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/sqlite.hpp"
#include "core/timestamp.hpp"
#include "model/metrics.hpp"
#include "storage/history_archive.hpp"
#include "storage/memory_store.hpp"
#include "storage/sqlite_store.hpp"
#include "storage/storage_engine.hpp"
#include "storage/store_factory.hpp"

using fleet_hub::core::kMillisPerDay;
using fleet_hub::core::kMillisPerHour;
using fleet_hub::core::kMillisPerMinute;
using fleet_hub::core::SqliteDatabase;
using fleet_hub::model::MetricSnapshot;
using fleet_hub::storage::AgentSeries;
using fleet_hub::storage::HistoryArchive;
using fleet_hub::storage::HistoryOptions;
using fleet_hub::storage::MemoryStore;
using fleet_hub::storage::SqliteStore;
using fleet_hub::storage::StorageEngine;
using fleet_hub::storage::TimeSeriesStore;
using fleet_hub::storage::YearMonth;

namespace {

// 2024-03-15T10:00:00Z
constexpr std::int64_t kMarch15 = 1710496800000LL;
// 2024-01-01T00:00:00Z
constexpr std::int64_t kJanuary1 = 1704067200000LL;

// Backend that fails on demand and remembers what it was handed.
class FlakyStore final : public TimeSeriesStore {
 public:
  void write(const MetricSnapshot& point) override {
    if (failing) {
      throw fleet_hub::core::StorageError("backend offline");
    }
    written.push_back(point);
  }

  std::vector<MetricSnapshot> query(const std::string&, std::int64_t, std::int64_t, std::size_t) override {
    if (failing) {
      throw fleet_hub::core::StorageError("backend offline");
    }
    return written;
  }

  AgentSeries query_all(std::int64_t, std::int64_t, std::size_t) override {
    if (failing) {
      throw fleet_hub::core::StorageError("backend offline");
    }
    return {};
  }

  void delete_before(std::int64_t) override {}
  void close() override {}
  std::string name() const override { return "flaky"; }

  bool failing{false};
  std::vector<MetricSnapshot> written{};
};

bool almost_equal(double a, double b, double eps = 1e-6) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

MetricSnapshot make_point(const std::string& agent_id, std::int64_t ts, double cpu, std::uint64_t used = 50,
                          std::uint64_t total = 100) {
  MetricSnapshot point{};
  point.agent_id = agent_id;
  point.timestamp_ms = ts;
  point.cpu.usage_percent = cpu;
  point.memory.total = total;
  point.memory.used = used;
  point.memory.available = total - used;
  return point;
}

int test_memory_store_evicts_oldest() {
  MemoryStore store(3);
  for (int i = 0; i < 5; ++i) {
    store.write(make_point("web-01", 1000 + i, static_cast<double>(i)));
  }

  if (store.size("web-01") != 3) {
    return fail("test_memory_store_evicts_oldest", "ring should hold exactly max_entries points");
  }
  const auto points = store.query("web-01", 0, 10000, 0);
  if (points.size() != 3 || points.front().timestamp_ms != 1002 || points.back().timestamp_ms != 1004) {
    return fail("test_memory_store_evicts_oldest", "oldest points should have been evicted");
  }
  return 0;
}

int test_memory_store_query_bounds_and_limit() {
  MemoryStore store(100);
  store.write(make_point("web-01", 3000, 3.0));
  store.write(make_point("web-01", 1000, 1.0));
  store.write(make_point("web-01", 2000, 2.0));
  store.write(make_point("web-01", 2000, 22.0));
  store.write(make_point("db-01", 1500, 9.0));

  const auto all = store.query("web-01", 1000, 3000, 0);
  if (all.size() != 3 || all[0].timestamp_ms != 1000 || all[2].timestamp_ms != 3000) {
    return fail("test_memory_store_query_bounds_and_limit", "results must be chronological and inclusive");
  }
  if (!almost_equal(all[1].cpu.usage_percent, 22.0)) {
    return fail("test_memory_store_query_bounds_and_limit", "repeated timestamp should replace the stored point");
  }

  const auto limited = store.query("web-01", 0, 5000, 2);
  if (limited.size() != 2 || limited.front().timestamp_ms != 2000) {
    return fail("test_memory_store_query_bounds_and_limit", "limit should keep the most recent points");
  }

  if (!store.query("nobody", 0, 5000, 0).empty()) {
    return fail("test_memory_store_query_bounds_and_limit", "unknown agent should yield nothing");
  }

  const auto series = store.query_all(0, 5000, 0);
  if (series.size() != 2 || series.at("db-01").size() != 1) {
    return fail("test_memory_store_query_bounds_and_limit", "query_all should group by agent");
  }

  store.delete_before(2500);
  if (store.size("web-01") != 1 || store.size("db-01") != 0) {
    return fail("test_memory_store_query_bounds_and_limit", "delete_before should drop older points");
  }
  return 0;
}

int test_sqlite_store_upsert_is_idempotent() {
  SqliteStore store(":memory:");

  auto point = make_point("web-01", kMarch15, 10.0);
  point.disks.push_back(fleet_hub::model::DiskMetrics{.mount_point = "/", .total = 1000, .used = 400});
  point.networks.push_back(fleet_hub::model::NetworkMetrics{.interface = "eth0", .rx_bps = 10.0, .tx_bps = 20.0});
  store.write(point);

  point.cpu.usage_percent = 55.0;
  point.disks[0].used = 450;
  store.write(point);

  if (store.row_count("web-01") != 1) {
    return fail("test_sqlite_store_upsert_is_idempotent", "re-delivered timestamp must not duplicate the row");
  }

  const auto points = store.query("web-01", kMarch15 - 1, kMarch15 + 1, 0);
  if (points.size() != 1) {
    return fail("test_sqlite_store_upsert_is_idempotent", "expected one stored point");
  }
  if (!almost_equal(points[0].cpu.usage_percent, 55.0)) {
    return fail("test_sqlite_store_upsert_is_idempotent", "latest values should win");
  }
  if (points[0].disks.size() != 1 || points[0].disks[0].used != 450 || points[0].networks.size() != 1) {
    return fail("test_sqlite_store_upsert_is_idempotent", "child rows should be upserted and reassembled");
  }

  // Rewriting the same timestamp with fewer devices drops the ones no longer reported.
  point.disks.push_back(fleet_hub::model::DiskMetrics{.mount_point = "/data", .total = 2000, .used = 10});
  store.write(point);
  point.disks.erase(point.disks.begin() + 1);
  point.networks.clear();
  store.write(point);
  const auto rewritten = store.query("web-01", kMarch15, kMarch15, 0);
  if (rewritten.size() != 1 || rewritten[0].disks.size() != 1 || rewritten[0].disks[0].mount_point != "/" ||
      !rewritten[0].networks.empty()) {
    return fail("test_sqlite_store_upsert_is_idempotent", "rewrite should replace stale child rows");
  }

  store.write(make_point("web-01", kMarch15 + 1000, 60.0));
  store.write(make_point("web-01", kMarch15 + 2000, 70.0));
  const auto limited = store.query("web-01", 0, kMarch15 + 5000, 2);
  if (limited.size() != 2 || limited.front().timestamp_ms != kMarch15 + 1000) {
    return fail("test_sqlite_store_upsert_is_idempotent", "limit should keep the newest points in order");
  }

  store.delete_before(kMarch15 + 1500);
  if (store.row_count("web-01") != 1) {
    return fail("test_sqlite_store_upsert_is_idempotent", "delete_before should remove older rows");
  }

  store.close();
  try {
    store.write(point);
    return fail("test_sqlite_store_upsert_is_idempotent", "write after close should fail");
  } catch (const fleet_hub::core::StorageError&) {
  }
  return 0;
}

int test_partition_naming() {
  if (fleet_hub::storage::partition_name(2024, 3) != "metrics_history_2024_03") {
    return fail("test_partition_naming", "unexpected partition name format");
  }
  if (fleet_hub::storage::partition_name_for(kMarch15) != "metrics_history_2024_03") {
    return fail("test_partition_naming", "timestamp should map to its UTC month");
  }

  const auto parsed = fleet_hub::storage::parse_partition_name("metrics_history_2023_12");
  if (!parsed.has_value() || !(*parsed == YearMonth{.year = 2023, .month = 12})) {
    return fail("test_partition_naming", "valid name should parse");
  }
  if (fleet_hub::storage::parse_partition_name("metrics_history_2023_13").has_value() ||
      fleet_hub::storage::parse_partition_name("metrics_hourly").has_value() ||
      fleet_hub::storage::parse_partition_name("metrics_history_20x3_01").has_value()) {
    return fail("test_partition_naming", "malformed names must be rejected");
  }
  if (fleet_hub::storage::parse_partition_name("metrics_history_2\xc3\xa9_01").has_value() ||
      fleet_hub::storage::parse_partition_name("metrics_history_2024_\xff\xfe").has_value()) {
    return fail("test_partition_naming", "non-ASCII bytes must be rejected");
  }

  const auto december = fleet_hub::storage::next_month(YearMonth{.year = 2023, .month = 12});
  if (!(december == YearMonth{.year = 2024, .month = 1})) {
    return fail("test_partition_naming", "next_month should roll the year");
  }
  if (fleet_hub::storage::month_start_ms(YearMonth{.year = 2024, .month = 1}) != kJanuary1) {
    return fail("test_partition_naming", "month start mismatch");
  }

  try {
    (void)fleet_hub::storage::partition_name(2024, 0);
    return fail("test_partition_naming", "month 0 should be rejected");
  } catch (const std::invalid_argument&) {
  }
  return 0;
}

int test_bucket_width_selection() {
  using fleet_hub::storage::bucket_width_ms;
  if (bucket_width_ms("5m", 0, 0) != 5 * kMillisPerMinute || bucket_width_ms("1d", 0, 0) != kMillisPerDay) {
    return fail("test_bucket_width_selection", "explicit intervals should map directly");
  }
  if (bucket_width_ms("", 0, kMillisPerHour) != kMillisPerMinute) {
    return fail("test_bucket_width_selection", "one hour range should use 1m buckets");
  }
  if (bucket_width_ms("auto", 0, 12 * kMillisPerHour) != 15 * kMillisPerMinute) {
    return fail("test_bucket_width_selection", "half day range should use 15m buckets");
  }
  if (bucket_width_ms("", 0, 30 * kMillisPerDay) != kMillisPerDay) {
    return fail("test_bucket_width_selection", "month range should use daily buckets");
  }
  return 0;
}

int test_history_rollups_and_reconcile() {
  SqliteDatabase db(":memory:");
  HistoryArchive archive(db, HistoryOptions{});
  archive.ensure_schema(kMarch15);

  archive.append(make_point("web-01", kMarch15 + 1000, 10.0, 20));
  archive.append(make_point("web-01", kMarch15 + 2000, 30.0, 40));
  archive.append(make_point("web-01", kMarch15 + 3000, 50.0, 60));
  archive.append(make_point("db-01", kMarch15 + 1000, 80.0, 90));

  if (archive.aggregate_hourly(kMarch15) != 2) {
    return fail("test_history_rollups_and_reconcile", "expected one hourly row per agent");
  }
  if (archive.aggregate_hourly(kMarch15 + 10 * kMillisPerMinute) != 0) {
    return fail("test_history_rollups_and_reconcile", "re-running an hour must add nothing");
  }

  const auto rows = archive.query_hourly("web-01", kMarch15, kMarch15);
  if (rows.size() != 1 || rows[0].data_points != 3 || !almost_equal(rows[0].cpu_avg, 30.0) ||
      !almost_equal(rows[0].cpu_max, 50.0) || !almost_equal(rows[0].mem_avg, 40.0)) {
    return fail("test_history_rollups_and_reconcile", "hourly aggregate values mismatch");
  }

  if (!archive.reconcile_hourly(kMarch15).empty()) {
    return fail("test_history_rollups_and_reconcile", "fresh rollup should reconcile cleanly");
  }

  // A late point lands after the hour was rolled up.
  archive.append(make_point("web-01", kMarch15 + 4000, 70.0));
  const auto mismatches = archive.reconcile_hourly(kMarch15);
  if (mismatches.size() != 1 || mismatches[0].agent_id != "web-01" || mismatches[0].rollup_points != 3 ||
      mismatches[0].source_points != 4) {
    return fail("test_history_rollups_and_reconcile", "late point should be reported, not silently merged");
  }

  const std::int64_t day = kMarch15 - (kMarch15 % kMillisPerDay);
  if (archive.aggregate_daily(day) != 2 || archive.aggregate_daily(day) != 0) {
    return fail("test_history_rollups_and_reconcile", "daily rollup should be append-only");
  }
  const auto daily = archive.query_daily("web-01", day, day);
  if (daily.size() != 1 || daily[0].data_points != 3) {
    return fail("test_history_rollups_and_reconcile", "daily rollup should sum hourly data points");
  }

  const auto buckets = archive.query_bucketed("web-01", kMarch15, kMarch15 + kMillisPerHour, kMillisPerHour);
  if (buckets.size() != 1 || !almost_equal(buckets[0].cpu_percent, 40.0)) {
    return fail("test_history_rollups_and_reconcile", "bucketed query should average raw points");
  }
  return 0;
}

int test_history_backfills_missed_hours() {
  SqliteDatabase db(":memory:");
  HistoryArchive archive(db, HistoryOptions{});
  archive.ensure_schema(kMarch15);

  // Three hours of raw data; only the middle one was ever rolled up.
  archive.append(make_point("web-01", kMarch15 - kMillisPerHour + 1000, 10.0));
  archive.append(make_point("web-01", kMarch15 + 1000, 20.0));
  archive.append(make_point("db-01", kMarch15 + kMillisPerHour + 1000, 30.0));
  archive.append(make_point("web-01", kMarch15 + kMillisPerHour + 2000, 40.0));
  if (archive.aggregate_hourly(kMarch15) != 1) {
    return fail("test_history_backfills_missed_hours", "expected the middle hour to roll up");
  }

  const std::int64_t end = kMarch15 + 2 * kMillisPerHour;
  if (archive.backfill_hourly(kMarch15 - 3 * kMillisPerHour, end) != 3) {
    return fail("test_history_backfills_missed_hours", "missing hours should be rolled up");
  }
  if (archive.query_hourly("web-01", kMarch15 - kMillisPerHour, kMarch15 + kMillisPerHour).size() != 3 ||
      archive.query_hourly("db-01", kMarch15 + kMillisPerHour, kMarch15 + kMillisPerHour).size() != 1) {
    return fail("test_history_backfills_missed_hours", "every hour with raw data should have a rollup");
  }
  for (std::int64_t hour = kMarch15 - kMillisPerHour; hour < end; hour += kMillisPerHour) {
    if (!archive.reconcile_hourly(hour).empty()) {
      return fail("test_history_backfills_missed_hours", "backfilled hours should reconcile cleanly");
    }
  }
  if (archive.backfill_hourly(kMarch15 - 3 * kMillisPerHour, end) != 0) {
    return fail("test_history_backfills_missed_hours", "second backfill should add nothing");
  }

  // A late point in a rolled-up hour is reported, not re-aggregated.
  archive.append(make_point("web-01", kMarch15 + 3000, 90.0));
  if (archive.backfill_hourly(kMarch15, kMarch15 + kMillisPerHour) != 0 ||
      archive.reconcile_hourly(kMarch15).size() != 1) {
    return fail("test_history_backfills_missed_hours", "existing rollups must stay append-only");
  }
  return 0;
}

int test_history_partition_retention() {
  SqliteDatabase db(":memory:");
  HistoryOptions options{};
  options.retention_days = 30;
  HistoryArchive archive(db, options);
  archive.ensure_schema(kMarch15);

  archive.append(make_point("web-01", kJanuary1 + 1000, 1.0));
  archive.append(make_point("web-01", kMarch15 - 30 * kMillisPerDay, 2.0));
  archive.ensure_partition(kMarch15 + kMillisPerDay * 20);

  const auto before = archive.partitions();
  if (before.size() != 4) {
    return fail("test_history_partition_retention", "expected Jan, Feb, Mar and Apr partitions");
  }

  const auto dropped = archive.drop_expired_partitions(kMarch15);
  if (dropped.size() != 1 || dropped[0] != "metrics_history_2024_01") {
    return fail("test_history_partition_retention", "only whole months past retention should be dropped");
  }
  if (!archive.query_raw("web-01", kJanuary1, kJanuary1 + kMillisPerDay, 0).empty()) {
    return fail("test_history_partition_retention", "dropped month should no longer be queryable");
  }
  if (archive.query_raw("web-01", kJanuary1, kMarch15, 0).size() != 1) {
    return fail("test_history_partition_retention", "February point should survive");
  }
  return 0;
}

int test_engine_degrades_and_serves_cache() {
  auto backend = std::make_unique<FlakyStore>();
  FlakyStore* flaky = backend.get();
  StorageEngine engine(std::move(backend), 100);

  engine.write(make_point("web-01", 1000, 1.0));
  if (engine.degraded() || flaky->written.size() != 1) {
    return fail("test_engine_degrades_and_serves_cache", "healthy write should reach the backend");
  }

  flaky->failing = true;
  engine.write(make_point("web-01", 2000, 2.0));
  if (!engine.degraded() || engine.last_error() != "backend offline") {
    return fail("test_engine_degrades_and_serves_cache", "failed durable write should flip degraded mode");
  }

  const auto result = engine.query("web-01", 0, 5000, 0);
  if (!result.from_cache || result.points.size() != 2) {
    return fail("test_engine_degrades_and_serves_cache", "query should fall back to the cache");
  }

  try {
    (void)engine.query("db-01", 0, 5000, 0);
    return fail("test_engine_degrades_and_serves_cache", "empty cache must not mask the backend error");
  } catch (const fleet_hub::core::StorageError&) {
  }

  flaky->failing = false;
  engine.write(make_point("web-01", 3000, 3.0));
  if (engine.degraded()) {
    return fail("test_engine_degrades_and_serves_cache", "successful write should leave degraded mode");
  }
  return 0;
}

int test_engine_appends_history() {
  SqliteDatabase db(":memory:");
  HistoryArchive archive(db, HistoryOptions{});
  archive.ensure_schema(kMarch15);

  StorageEngine engine(std::make_unique<MemoryStore>(10), 10, &archive);
  engine.write(make_point("web-01", kMarch15, 12.0));

  const auto raw = archive.query_raw("web-01", kMarch15, kMarch15, 0);
  if (raw.size() != 1 || !almost_equal(raw[0].mem_percent, 50.0)) {
    return fail("test_engine_appends_history", "engine write should feed the history archive");
  }
  if (engine.backend_name() != "memory" || engine.query("web-01", 0, kMarch15, 0).from_cache) {
    return fail("test_engine_appends_history", "memory backend serves reads directly");
  }
  return 0;
}

int test_store_factory_selection() {
  fleet_hub::core::StorageConfig config{};
  config.type = "sqlite";
  config.sqlite_path = ":memory:";
  if (fleet_hub::storage::make_time_series_store(config)->name() != "sqlite") {
    return fail("test_store_factory_selection", "sqlite type should build the sqlite store");
  }

  config.type = "memory";
  if (fleet_hub::storage::make_time_series_store(config)->name() != "memory") {
    return fail("test_store_factory_selection", "memory type should build the memory store");
  }

  config.type = "cassandra";
  try {
    (void)fleet_hub::storage::make_time_series_store(config);
    return fail("test_store_factory_selection", "unknown type should be rejected");
  } catch (const std::invalid_argument&) {
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_memory_store_evicts_oldest(); rc != 0) return rc;
  if (int rc = test_memory_store_query_bounds_and_limit(); rc != 0) return rc;
  if (int rc = test_sqlite_store_upsert_is_idempotent(); rc != 0) return rc;
  if (int rc = test_partition_naming(); rc != 0) return rc;
  if (int rc = test_bucket_width_selection(); rc != 0) return rc;
  if (int rc = test_history_rollups_and_reconcile(); rc != 0) return rc;
  if (int rc = test_history_backfills_missed_hours(); rc != 0) return rc;
  if (int rc = test_history_partition_retention(); rc != 0) return rc;
  if (int rc = test_engine_degrades_and_serves_cache(); rc != 0) return rc;
  if (int rc = test_engine_appends_history(); rc != 0) return rc;
  if (int rc = test_store_factory_selection(); rc != 0) return rc;

  std::cout << "[PASS] storage unit tests\n";
  return 0;
}
