#include "storage/memory_store.hpp"

#include <algorithm>
#include <mutex>

namespace fleet_hub::storage {

MemoryStore::MemoryStore(const std::size_t max_entries) : max_entries_(max_entries == 0 ? 600 : max_entries) {}

void MemoryStore::write(const model::MetricSnapshot& point) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto& points = series_[point.agent_id];

  // Receipt order is normally timestamp order; late points are slotted in place
  // and a repeated timestamp replaces the stored point.
  if (points.empty() || points.back().timestamp_ms < point.timestamp_ms) {
    points.push_back(point);
  } else {
    const auto it = std::lower_bound(points.begin(), points.end(), point.timestamp_ms,
                                     [](const model::MetricSnapshot& stored, const std::int64_t ts) {
                                       return stored.timestamp_ms < ts;
                                     });
    if (it != points.end() && it->timestamp_ms == point.timestamp_ms) {
      *it = point;
      return;
    }
    points.insert(it, point);
  }

  while (points.size() > max_entries_) {
    points.pop_front();
  }
}

std::vector<model::MetricSnapshot> MemoryStore::query(const std::string& agent_id, const std::int64_t start_ms,
                                                      const std::int64_t end_ms, const std::size_t limit) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = series_.find(agent_id);
  if (it == series_.end()) {
    return {};
  }
  return query_locked(it->second, start_ms, end_ms, limit);
}

AgentSeries MemoryStore::query_all(const std::int64_t start_ms, const std::int64_t end_ms, const std::size_t limit) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  AgentSeries result;
  for (const auto& [agent_id, points] : series_) {
    auto matched = query_locked(points, start_ms, end_ms, limit);
    if (!matched.empty()) {
      result.emplace(agent_id, std::move(matched));
    }
  }
  return result;
}

void MemoryStore::delete_before(const std::int64_t before_ms) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  for (auto it = series_.begin(); it != series_.end();) {
    auto& points = it->second;
    while (!points.empty() && points.front().timestamp_ms < before_ms) {
      points.pop_front();
    }
    if (points.empty()) {
      it = series_.erase(it);
    } else {
      ++it;
    }
  }
}

void MemoryStore::close() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  series_.clear();
}

std::size_t MemoryStore::size(const std::string& agent_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = series_.find(agent_id);
  return it == series_.end() ? 0 : it->second.size();
}

std::vector<model::MetricSnapshot> MemoryStore::query_locked(const std::deque<model::MetricSnapshot>& points,
                                                             const std::int64_t start_ms, const std::int64_t end_ms,
                                                             const std::size_t limit) const {
  const std::size_t effective_limit = limit == 0 ? max_entries_ : limit;

  std::vector<model::MetricSnapshot> matched;
  for (const auto& point : points) {
    if (point.timestamp_ms >= start_ms && point.timestamp_ms <= end_ms) {
      matched.push_back(point);
    }
  }
  if (matched.size() > effective_limit) {
    matched.erase(matched.begin(), matched.end() - static_cast<std::ptrdiff_t>(effective_limit));
  }
  return matched;
}

}  // namespace fleet_hub::storage
