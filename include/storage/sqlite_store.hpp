#pragma once

#include <memory>
#include <string>

#include "core/sqlite.hpp"
#include "storage/time_series_store.hpp"

namespace fleet_hub::storage {

// Relational backend: one row per (time, agent) in `metrics`, child rows per
// mount point and interface. Writes are upserts, so re-delivering a timestamp
// leaves exactly one row holding the latest values.
class SqliteStore final : public TimeSeriesStore {
 public:
  explicit SqliteStore(const std::string& path, std::size_t default_limit = 600);

  void write(const model::MetricSnapshot& point) override;
  std::vector<model::MetricSnapshot> query(const std::string& agent_id, std::int64_t start_ms, std::int64_t end_ms,
                                           std::size_t limit) override;
  AgentSeries query_all(std::int64_t start_ms, std::int64_t end_ms, std::size_t limit) override;
  void delete_before(std::int64_t before_ms) override;
  void close() override;
  [[nodiscard]] std::string name() const override { return "sqlite"; }

  [[nodiscard]] std::size_t row_count(const std::string& agent_id);

 private:
  void ensure_schema();
  std::vector<model::MetricSnapshot> query_locked(const std::string& agent_id, std::int64_t start_ms,
                                                  std::int64_t end_ms, std::size_t limit);
  core::SqliteDatabase& db();

  std::unique_ptr<core::SqliteDatabase> db_;
  std::size_t default_limit_;
};

}  // namespace fleet_hub::storage
