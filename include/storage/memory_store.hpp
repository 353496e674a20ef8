#pragma once

#include <deque>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "storage/time_series_store.hpp"

namespace fleet_hub::storage {

// Per-agent bounded ring; at capacity a write evicts the oldest point.
class MemoryStore final : public TimeSeriesStore {
 public:
  explicit MemoryStore(std::size_t max_entries = 600);

  void write(const model::MetricSnapshot& point) override;
  std::vector<model::MetricSnapshot> query(const std::string& agent_id, std::int64_t start_ms, std::int64_t end_ms,
                                           std::size_t limit) override;
  AgentSeries query_all(std::int64_t start_ms, std::int64_t end_ms, std::size_t limit) override;
  void delete_before(std::int64_t before_ms) override;
  void close() override;
  [[nodiscard]] std::string name() const override { return "memory"; }

  [[nodiscard]] std::size_t size(const std::string& agent_id) const;

 private:
  std::vector<model::MetricSnapshot> query_locked(const std::deque<model::MetricSnapshot>& points,
                                                  std::int64_t start_ms, std::int64_t end_ms,
                                                  std::size_t limit) const;

  std::size_t max_entries_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::deque<model::MetricSnapshot>> series_{};
};

}  // namespace fleet_hub::storage
