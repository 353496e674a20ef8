#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/sqlite.hpp"
#include "model/metrics.hpp"

namespace fleet_hub::storage {

struct YearMonth {
  int year{1970};
  int month{1};

  friend bool operator<(const YearMonth& a, const YearMonth& b) {
    return a.year != b.year ? a.year < b.year : a.month < b.month;
  }
  friend bool operator==(const YearMonth& a, const YearMonth& b) { return a.year == b.year && a.month == b.month; }
};

// metrics_history_YYYY_MM. Months are UTC calendar months.
std::string partition_name(int year, int month);
std::string partition_name_for(std::int64_t timestamp_ms);
std::optional<YearMonth> parse_partition_name(const std::string& name);
YearMonth year_month_of(std::int64_t timestamp_ms);
std::int64_t month_start_ms(const YearMonth& month);
YearMonth next_month(const YearMonth& month);
// Partitions strictly before this month are expired.
YearMonth retention_cutoff(std::int64_t now_ms, std::uint32_t retention_days);
// "1m", "5m", "1h", "1d"; anything else picks a width from the range length.
std::int64_t bucket_width_ms(const std::string& interval, std::int64_t start_ms, std::int64_t end_ms);

struct HistoryPoint {
  std::string agent_id{};
  std::int64_t timestamp_ms{0};
  double cpu_percent{0.0};
  double mem_percent{0.0};
  double disk_read_bps{0.0};
  double disk_write_bps{0.0};
  double net_rx_bps{0.0};
  double net_tx_bps{0.0};
  double gpu_percent{0.0};
  double load_avg1{0.0};
};

HistoryPoint to_history_point(const model::MetricSnapshot& snapshot);

struct RollupRow {
  std::string agent_id{};
  std::int64_t bucket_ms{0};
  double cpu_avg{0.0};
  double cpu_max{0.0};
  double mem_avg{0.0};
  double mem_max{0.0};
  double net_rx_total{0.0};
  double net_tx_total{0.0};
  std::int64_t data_points{0};
};

struct RollupMismatch {
  std::string agent_id{};
  std::int64_t bucket_ms{0};
  std::int64_t rollup_points{0};
  std::int64_t source_points{0};
};

struct HistoryOptions {
  std::uint32_t retention_days{30};
  std::uint32_t hourly_retention_days{90};
  std::uint32_t daily_retention_days{365};
};

// Raw history in monthly partitions plus append-only hourly and daily rollups.
class HistoryArchive {
 public:
  HistoryArchive(core::SqliteDatabase& db, HistoryOptions options);

  void ensure_schema(std::int64_t now_ms);
  std::string ensure_partition(std::int64_t timestamp_ms);
  void append(const model::MetricSnapshot& snapshot);

  [[nodiscard]] std::vector<std::string> partitions();
  std::vector<std::string> drop_expired_partitions(std::int64_t now_ms);

  // Inserts only buckets that are not already present; returns rows added.
  std::size_t aggregate_hourly(std::int64_t hour_start_ms);
  std::size_t aggregate_daily(std::int64_t day_start_ms);
  std::size_t prune_rollups(std::int64_t now_ms);
  [[nodiscard]] std::vector<RollupMismatch> reconcile_hourly(std::int64_t hour_start_ms);
  // Rolls up every hour in [from_ms, to_ms) holding raw points with no hourly row yet.
  std::size_t backfill_hourly(std::int64_t from_ms, std::int64_t to_ms);

  [[nodiscard]] std::vector<HistoryPoint> query_raw(const std::string& agent_id, std::int64_t start_ms,
                                                    std::int64_t end_ms, std::size_t limit);
  [[nodiscard]] std::vector<HistoryPoint> query_bucketed(const std::string& agent_id, std::int64_t start_ms,
                                                         std::int64_t end_ms, std::int64_t bucket_ms);
  [[nodiscard]] std::vector<RollupRow> query_hourly(const std::string& agent_id, std::int64_t start_ms,
                                                    std::int64_t end_ms);
  [[nodiscard]] std::vector<RollupRow> query_daily(const std::string& agent_id, std::int64_t start_ms,
                                                   std::int64_t end_ms);

 private:
  std::string ensure_partition_locked(const YearMonth& month);
  std::vector<std::string> partitions_locked();
  std::vector<std::string> partitions_between_locked(std::int64_t start_ms, std::int64_t end_ms);
  std::vector<RollupRow> query_rollup(const char* table, const std::string& agent_id, std::int64_t start_ms,
                                      std::int64_t end_ms);

  core::SqliteDatabase& db_;
  HistoryOptions options_;
  std::set<std::string> known_partitions_{};
};

}  // namespace fleet_hub::storage
