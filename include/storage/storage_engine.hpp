#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "storage/history_archive.hpp"
#include "storage/memory_store.hpp"
#include "storage/time_series_store.hpp"

namespace fleet_hub::storage {

struct QueryResult {
  std::vector<model::MetricSnapshot> points{};
  bool from_cache{false};
};

// The selected backend behind a memory read-through cache. Durable write
// failures never reach the ingest path: they flip the engine into degraded
// mode, logged once per transition.
class StorageEngine {
 public:
  StorageEngine(std::unique_ptr<TimeSeriesStore> backend, std::size_t cache_entries,
                HistoryArchive* archive = nullptr);
  ~StorageEngine();

  StorageEngine(const StorageEngine&) = delete;
  StorageEngine& operator=(const StorageEngine&) = delete;

  void write(const model::MetricSnapshot& point);
  QueryResult query(const std::string& agent_id, std::int64_t start_ms, std::int64_t end_ms, std::size_t limit);
  AgentSeries query_all(std::int64_t start_ms, std::int64_t end_ms, std::size_t limit);
  void delete_before(std::int64_t before_ms);
  void close();

  [[nodiscard]] bool degraded() const noexcept { return degraded_.load(); }
  [[nodiscard]] std::string backend_name() const;
  [[nodiscard]] std::string last_error() const;

 private:
  void record_failure(const std::string& message);
  void record_success();

  std::unique_ptr<TimeSeriesStore> backend_;
  std::unique_ptr<MemoryStore> cache_;
  HistoryArchive* archive_;
  std::atomic<bool> degraded_{false};
  mutable std::mutex error_mutex_;
  std::string last_error_{};
  bool closed_{false};
};

}  // namespace fleet_hub::storage
