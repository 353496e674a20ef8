#include "registry/agent_registry.hpp"

#include <algorithm>
#include <mutex>

namespace fleet_hub::registry {
namespace {

template <typename T, typename Match>
T& find_or_append(std::vector<T>& items, Match match) {
  auto it = std::find_if(items.begin(), items.end(), match);
  if (it != items.end()) {
    return *it;
  }
  items.emplace_back();
  return items.back();
}

void apply_static(model::MetricSnapshot& snapshot, const model::StaticInfo& info) {
  if (!info.cpu_model.empty()) {
    snapshot.cpu.model = info.cpu_model;
  }
  if (!info.cpu_vendor.empty()) {
    snapshot.cpu.vendor = info.cpu_vendor;
  }
  if (info.cpu_cores != 0) {
    snapshot.cpu.core_count = info.cpu_cores;
  }
  if (info.cpu_frequency_mhz > 0.0 && snapshot.cpu.frequency_mhz <= 0.0) {
    snapshot.cpu.frequency_mhz = info.cpu_frequency_mhz;
  }
  if (info.memory_total != 0) {
    snapshot.memory.total = info.memory_total;
  }
  if (info.swap_total != 0) {
    snapshot.memory.swap_total = info.swap_total;
  }

  for (const auto& disk : info.disks) {
    auto& target = find_or_append(snapshot.disks, [&disk](const model::DiskMetrics& d) {
      return (!disk.mount_point.empty() && d.mount_point == disk.mount_point) ||
             (!disk.device.empty() && d.device == disk.device);
    });
    if (!disk.mount_point.empty()) {
      target.mount_point = disk.mount_point;
    }
    if (!disk.device.empty()) {
      target.device = disk.device;
    }
    if (!disk.fs_type.empty()) {
      target.fs_type = disk.fs_type;
    }
    if (disk.total != 0) {
      target.total = disk.total;
    }
  }

  for (const auto& network : info.networks) {
    auto& target = find_or_append(snapshot.networks, [&network](const model::NetworkMetrics& n) {
      return n.interface == network.interface;
    });
    target.interface = network.interface;
    if (!network.ip_addresses.empty()) {
      target.ip_addresses = network.ip_addresses;
    }
  }

  for (const auto& gpu : info.gpus) {
    auto& target = find_or_append(snapshot.gpus, [&gpu](const model::GpuMetrics& g) { return g.index == gpu.index; });
    target.index = gpu.index;
    if (!gpu.name.empty()) {
      target.name = gpu.name;
    }
    if (gpu.memory_total != 0) {
      target.memory_total = gpu.memory_total;
    }
  }

  for (const auto& npu : info.npus) {
    auto& target = find_or_append(snapshot.npus, [&npu](const model::NpuMetrics& n) { return n.index == npu.index; });
    target.index = npu.index;
    if (!npu.name.empty()) {
      target.name = npu.name;
    }
  }

  if (info.system.has_value()) {
    snapshot.system = info.system;
  }
}

void apply_periodic(model::MetricSnapshot& snapshot, const model::PeriodicData& data) {
  for (const auto& disk : data.disk_usage) {
    auto& target = find_or_append(snapshot.disks, [&disk](const model::DiskMetrics& d) {
      return d.mount_point == disk.mount_point;
    });
    target.mount_point = disk.mount_point;
    if (!disk.device.empty()) {
      target.device = disk.device;
    }
    if (!disk.fs_type.empty()) {
      target.fs_type = disk.fs_type;
    }
    target.total = disk.total;
    target.used = disk.used;
  }

  if (!data.sessions.empty()) {
    snapshot.sessions = data.sessions;
  }

  for (const auto& network : data.network_addresses) {
    auto& target = find_or_append(snapshot.networks, [&network](const model::NetworkMetrics& n) {
      return n.interface == network.interface;
    });
    target.interface = network.interface;
    target.is_up = network.is_up;
    if (!network.ip_addresses.empty()) {
      target.ip_addresses = network.ip_addresses;
    }
  }

  if (data.system.has_value()) {
    snapshot.system = data.system;
  }
}

void apply_realtime(model::MetricSnapshot& snapshot, const model::RealtimeSample& sample) {
  if (sample.cpu_usage_percent.has_value()) {
    snapshot.cpu.usage_percent = *sample.cpu_usage_percent;
  }
  if (!sample.per_core.empty()) {
    snapshot.cpu.per_core = sample.per_core;
  }
  if (sample.cpu_temperature.has_value()) {
    snapshot.cpu.temperature = *sample.cpu_temperature;
  }
  if (sample.cpu_frequency_mhz.has_value()) {
    snapshot.cpu.frequency_mhz = *sample.cpu_frequency_mhz;
  }
  if (sample.memory_used.has_value()) {
    snapshot.memory.used = *sample.memory_used;
  }
  if (sample.memory_available.has_value()) {
    snapshot.memory.available = *sample.memory_available;
  }
  if (sample.memory_cached.has_value()) {
    snapshot.memory.cached = *sample.memory_cached;
  }
  if (sample.swap_used.has_value()) {
    snapshot.memory.swap_used = *sample.swap_used;
  }
  if (!sample.load_average.empty()) {
    snapshot.load_average = sample.load_average;
  }

  for (const auto& io : sample.disk_io) {
    auto& target = find_or_append(snapshot.disks, [&io](const model::DiskMetrics& d) {
      return (!io.device.empty() && d.device == io.device) ||
             (!io.mount_point.empty() && d.mount_point == io.mount_point);
    });
    if (target.device.empty()) {
      target.device = io.device;
    }
    if (target.mount_point.empty()) {
      target.mount_point = io.mount_point;
    }
    target.read_bps = io.read_bps;
    target.write_bps = io.write_bps;
  }

  for (const auto& io : sample.network_io) {
    auto& target = find_or_append(snapshot.networks, [&io](const model::NetworkMetrics& n) {
      return n.interface == io.interface;
    });
    target.interface = io.interface;
    target.rx_bps = io.rx_bps;
    target.tx_bps = io.tx_bps;
  }

  for (const auto& gpu : sample.gpus) {
    auto& target = find_or_append(snapshot.gpus, [&gpu](const model::GpuMetrics& g) { return g.index == gpu.index; });
    target.index = gpu.index;
    target.usage_percent = gpu.usage_percent;
    target.memory_used = gpu.memory_used;
    target.temperature = gpu.temperature;
    target.power_watts = gpu.power_watts;
  }

  for (const auto& npu : sample.npus) {
    auto& target = find_or_append(snapshot.npus, [&npu](const model::NpuMetrics& n) { return n.index == npu.index; });
    target.index = npu.index;
    target.usage_percent = npu.usage_percent;
  }

  if (sample.timestamp_ms > snapshot.timestamp_ms) {
    snapshot.timestamp_ms = sample.timestamp_ms;
  }
}

}  // namespace

bool AgentRegistry::register_agent(const model::AgentInfo& info) {
  std::unique_lock<std::shared_mutex> lock(agents_mutex_);
  const auto [it, inserted] = agents_.try_emplace(info.id);
  if (inserted) {
    it->second.info = info;
  }
  return inserted;
}

bool AgentRegistry::unregister_agent(const std::string& agent_id) {
  std::unique_lock<std::shared_mutex> agents_lock(agents_mutex_);
  std::unique_lock<std::shared_mutex> snapshots_lock(snapshots_mutex_);
  snapshots_.erase(agent_id);
  return agents_.erase(agent_id) > 0;
}

bool AgentRegistry::touch_heartbeat(const std::string& agent_id, const std::int64_t now_ms) {
  std::unique_lock<std::shared_mutex> lock(agents_mutex_);
  const auto it = agents_.find(agent_id);
  if (it == agents_.end()) {
    return false;
  }
  it->second.info.last_heartbeat_ms = std::max(it->second.info.last_heartbeat_ms, now_ms);
  return true;
}

bool AgentRegistry::update_snapshot(const model::MetricSnapshot& snapshot) {
  std::shared_lock<std::shared_mutex> agents_lock(agents_mutex_);
  const auto it = agents_.find(snapshot.agent_id);
  if (it == agents_.end()) {
    return false;
  }

  // A full snapshot replaces the cached one; identity it omits comes from static info.
  model::MetricSnapshot merged = snapshot;
  if (it->second.has_static) {
    const auto& info = it->second.static_info;
    if (merged.cpu.model.empty()) {
      merged.cpu.model = info.cpu_model;
    }
    if (merged.cpu.vendor.empty()) {
      merged.cpu.vendor = info.cpu_vendor;
    }
    if (merged.cpu.core_count == 0) {
      merged.cpu.core_count = info.cpu_cores;
    }
    if (!merged.system.has_value()) {
      merged.system = info.system;
    }
  }

  std::unique_lock<std::shared_mutex> snapshots_lock(snapshots_mutex_);
  snapshots_[snapshot.agent_id] = std::move(merged);
  return true;
}

std::optional<model::MetricSnapshot> AgentRegistry::merge_realtime(const std::string& agent_id,
                                                                   const model::RealtimeSample& sample) {
  std::shared_lock<std::shared_mutex> agents_lock(agents_mutex_);
  const auto record = agents_.find(agent_id);
  if (record == agents_.end()) {
    return std::nullopt;
  }

  std::unique_lock<std::shared_mutex> snapshots_lock(snapshots_mutex_);
  auto it = snapshots_.find(agent_id);
  if (it == snapshots_.end()) {
    model::MetricSnapshot base{};
    base.agent_id = agent_id;
    if (record->second.has_static) {
      apply_static(base, record->second.static_info);
    }
    if (record->second.has_periodic) {
      apply_periodic(base, record->second.periodic);
    }
    it = snapshots_.emplace(agent_id, std::move(base)).first;
  }
  apply_realtime(it->second, sample);
  return it->second;
}

bool AgentRegistry::merge_static(const std::string& agent_id, const model::StaticInfo& info) {
  std::unique_lock<std::shared_mutex> agents_lock(agents_mutex_);
  const auto record = agents_.find(agent_id);
  if (record == agents_.end()) {
    return false;
  }
  record->second.static_info = info;
  record->second.has_static = true;

  std::unique_lock<std::shared_mutex> snapshots_lock(snapshots_mutex_);
  if (const auto it = snapshots_.find(agent_id); it != snapshots_.end()) {
    apply_static(it->second, info);
  }
  return true;
}

bool AgentRegistry::merge_periodic(const std::string& agent_id, const model::PeriodicData& data) {
  std::unique_lock<std::shared_mutex> agents_lock(agents_mutex_);
  const auto record = agents_.find(agent_id);
  if (record == agents_.end()) {
    return false;
  }
  record->second.periodic = data;
  record->second.has_periodic = true;

  std::unique_lock<std::shared_mutex> snapshots_lock(snapshots_mutex_);
  if (const auto it = snapshots_.find(agent_id); it != snapshots_.end()) {
    apply_periodic(it->second, data);
  }
  return true;
}

std::optional<model::MetricSnapshot> AgentRegistry::latest(const std::string& agent_id) const {
  std::shared_lock<std::shared_mutex> lock(snapshots_mutex_);
  const auto it = snapshots_.find(agent_id);
  if (it == snapshots_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::unordered_map<std::string, model::MetricSnapshot> AgentRegistry::all_latest() const {
  std::shared_lock<std::shared_mutex> lock(snapshots_mutex_);
  return snapshots_;
}

std::optional<model::AgentInfo> AgentRegistry::agent(const std::string& agent_id) const {
  std::shared_lock<std::shared_mutex> lock(agents_mutex_);
  const auto it = agents_.find(agent_id);
  if (it == agents_.end()) {
    return std::nullopt;
  }
  return it->second.info;
}

std::vector<model::AgentInfo> AgentRegistry::agents() const {
  std::shared_lock<std::shared_mutex> lock(agents_mutex_);
  std::vector<model::AgentInfo> result;
  result.reserve(agents_.size());
  for (const auto& [id, record] : agents_) {
    result.push_back(record.info);
  }
  std::sort(result.begin(), result.end(),
            [](const model::AgentInfo& a, const model::AgentInfo& b) { return a.id < b.id; });
  return result;
}

bool AgentRegistry::contains(const std::string& agent_id) const {
  std::shared_lock<std::shared_mutex> lock(agents_mutex_);
  return agents_.count(agent_id) != 0;
}

std::size_t AgentRegistry::connected_count() const {
  std::shared_lock<std::shared_mutex> lock(agents_mutex_);
  return agents_.size();
}

std::vector<std::string> AgentRegistry::find_stale(const std::int64_t now_ms, const std::int64_t timeout_ms) const {
  std::shared_lock<std::shared_mutex> lock(agents_mutex_);
  std::vector<std::string> stale;
  for (const auto& [id, record] : agents_) {
    if (now_ms - record.info.last_heartbeat_ms > timeout_ms) {
      stale.push_back(id);
    }
  }
  return stale;
}

FleetSummary AgentRegistry::summary(const AgentFilter& include) const {
  std::shared_lock<std::shared_mutex> agents_lock(agents_mutex_);
  std::shared_lock<std::shared_mutex> snapshots_lock(snapshots_mutex_);

  FleetSummary result{};
  double cpu_total = 0.0;
  for (const auto& [id, record] : agents_) {
    if (include && !include(id)) {
      continue;
    }
    ++result.agent_count;

    const auto it = snapshots_.find(id);
    if (it == snapshots_.end()) {
      continue;
    }
    ++result.reporting_count;
    cpu_total += it->second.cpu.usage_percent;
    result.total_memory += it->second.memory.total;
    result.used_memory += it->second.memory.used;
  }

  if (result.reporting_count > 0) {
    result.avg_cpu_percent = cpu_total / static_cast<double>(result.reporting_count);
  }
  if (result.total_memory > 0) {
    result.memory_percent =
        static_cast<double>(result.used_memory) / static_cast<double>(result.total_memory) * 100.0;
  }
  return result;
}

}  // namespace fleet_hub::registry
