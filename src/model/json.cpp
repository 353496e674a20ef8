#include "model/json.hpp"

namespace fleet_hub::model {

void to_json(nlohmann::json& out, const CpuMetrics& cpu) {
  out = nlohmann::json{{"usagePercent", cpu.usage_percent}, {"coreCount", cpu.core_count},
                       {"perCoreUsage", cpu.per_core},     {"model", cpu.model},
                       {"vendor", cpu.vendor},             {"frequencyMhz", cpu.frequency_mhz},
                       {"temperature", cpu.temperature}};
}

void to_json(nlohmann::json& out, const MemoryMetrics& memory) {
  out = nlohmann::json{{"total", memory.total},         {"used", memory.used},
                       {"available", memory.available}, {"swapTotal", memory.swap_total},
                       {"swapUsed", memory.swap_used},  {"cached", memory.cached},
                       {"usagePercent", memory_percent(memory)}};
}

void to_json(nlohmann::json& out, const DiskMetrics& disk) {
  out = nlohmann::json{{"mountPoint", disk.mount_point}, {"device", disk.device},
                       {"fsType", disk.fs_type},         {"total", disk.total},
                       {"used", disk.used},              {"readBytesPerSec", disk.read_bps},
                       {"writeBytesPerSec", disk.write_bps}};
}

void to_json(nlohmann::json& out, const NetworkMetrics& network) {
  out = nlohmann::json{{"interface", network.interface},
                       {"rxBytesPerSec", network.rx_bps},
                       {"txBytesPerSec", network.tx_bps},
                       {"isUp", network.is_up},
                       {"ipAddresses", network.ip_addresses}};
}

void to_json(nlohmann::json& out, const GpuMetrics& gpu) {
  out = nlohmann::json{{"index", gpu.index},                {"name", gpu.name},
                       {"usagePercent", gpu.usage_percent}, {"memoryTotal", gpu.memory_total},
                       {"memoryUsed", gpu.memory_used},     {"temperature", gpu.temperature},
                       {"powerWatts", gpu.power_watts}};
}

void to_json(nlohmann::json& out, const NpuMetrics& npu) {
  out = nlohmann::json{{"index", npu.index}, {"name", npu.name}, {"usagePercent", npu.usage_percent}};
}

void to_json(nlohmann::json& out, const UserSession& session) {
  out = nlohmann::json{{"username", session.username},
                       {"tty", session.tty},
                       {"remoteHost", session.remote_host},
                       {"loginTime", session.login_time}};
}

void to_json(nlohmann::json& out, const SystemInfo& system) {
  out = nlohmann::json{{"osName", system.os_name},
                       {"osVersion", system.os_version},
                       {"kernelVersion", system.kernel_version},
                       {"hostname", system.hostname},
                       {"uptimeSeconds", system.uptime_seconds}};
}

void to_json(nlohmann::json& out, const MetricSnapshot& snapshot) {
  out = nlohmann::json{{"agentId", snapshot.agent_id},
                       {"timestamp", snapshot.timestamp_ms},
                       {"cpu", snapshot.cpu},
                       {"memory", snapshot.memory},
                       {"disks", snapshot.disks},
                       {"networks", snapshot.networks},
                       {"gpus", snapshot.gpus},
                       {"npus", snapshot.npus},
                       {"userSessions", snapshot.sessions},
                       {"loadAverage", snapshot.load_average}};
  if (snapshot.system.has_value()) {
    out["systemInfo"] = *snapshot.system;
  }
}

void to_json(nlohmann::json& out, const AgentInfo& agent) {
  out = nlohmann::json{{"id", agent.id},
                       {"hostname", agent.hostname},
                       {"os", agent.os},
                       {"arch", agent.arch},
                       {"version", agent.version},
                       {"transport", transport_name(agent.transport)},
                       {"connectedAt", agent.connected_at_ms},
                       {"lastHeartbeat", agent.last_heartbeat_ms}};
}

}  // namespace fleet_hub::model
