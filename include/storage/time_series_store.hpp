#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "model/metrics.hpp"

namespace fleet_hub::storage {

using AgentSeries = std::map<std::string, std::vector<model::MetricSnapshot>>;

// Uniform contract for every backend. Query results are chronological, bounded by
// inclusive [start_ms, end_ms], and hold at most the `limit` most recent points
// (0 selects the backend default). Failures throw core::StorageError.
class TimeSeriesStore {
 public:
  virtual ~TimeSeriesStore() = default;

  virtual void write(const model::MetricSnapshot& point) = 0;
  virtual std::vector<model::MetricSnapshot> query(const std::string& agent_id, std::int64_t start_ms,
                                                   std::int64_t end_ms, std::size_t limit) = 0;
  virtual AgentSeries query_all(std::int64_t start_ms, std::int64_t end_ms, std::size_t limit) = 0;
  virtual void delete_before(std::int64_t before_ms) = 0;
  virtual void close() = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

}  // namespace fleet_hub::storage
