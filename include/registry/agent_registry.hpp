#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "model/agent.hpp"
#include "model/metrics.hpp"

namespace fleet_hub::registry {

struct FleetSummary {
  std::size_t agent_count{0};
  std::size_t reporting_count{0};
  double avg_cpu_percent{0.0};
  std::uint64_t total_memory{0};
  std::uint64_t used_memory{0};
  double memory_percent{0.0};
};

// Connected agents and their last-known-good snapshot. The agent table and the
// snapshot table have separate reader/writer locks, always taken in that order.
// Liveness is only checked by find_stale(); writers never scan.
class AgentRegistry {
 public:
  using AgentFilter = std::function<bool(const std::string&)>;

  // false when the id is already registered.
  bool register_agent(const model::AgentInfo& info);
  // Idempotent; true only for the call that actually removed the agent.
  bool unregister_agent(const std::string& agent_id);
  bool touch_heartbeat(const std::string& agent_id, std::int64_t now_ms);

  bool update_snapshot(const model::MetricSnapshot& snapshot);
  std::optional<model::MetricSnapshot> merge_realtime(const std::string& agent_id,
                                                      const model::RealtimeSample& sample);
  bool merge_static(const std::string& agent_id, const model::StaticInfo& info);
  bool merge_periodic(const std::string& agent_id, const model::PeriodicData& data);

  [[nodiscard]] std::optional<model::MetricSnapshot> latest(const std::string& agent_id) const;
  [[nodiscard]] std::unordered_map<std::string, model::MetricSnapshot> all_latest() const;
  [[nodiscard]] std::optional<model::AgentInfo> agent(const std::string& agent_id) const;
  [[nodiscard]] std::vector<model::AgentInfo> agents() const;
  [[nodiscard]] bool contains(const std::string& agent_id) const;
  [[nodiscard]] std::size_t connected_count() const;
  [[nodiscard]] std::vector<std::string> find_stale(std::int64_t now_ms, std::int64_t timeout_ms) const;

  // Averages only over agents that have reported a snapshot. `include` runs under
  // the registry locks and must not block.
  [[nodiscard]] FleetSummary summary(const AgentFilter& include = {}) const;

 private:
  struct AgentRecord {
    model::AgentInfo info{};
    model::StaticInfo static_info{};
    bool has_static{false};
    model::PeriodicData periodic{};
    bool has_periodic{false};
  };

  mutable std::shared_mutex agents_mutex_;
  std::unordered_map<std::string, AgentRecord> agents_{};

  mutable std::shared_mutex snapshots_mutex_;
  std::unordered_map<std::string, model::MetricSnapshot> snapshots_{};
};

}  // namespace fleet_hub::registry
