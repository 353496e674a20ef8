#include "gateway/payload_decoder.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <unordered_map>

#include "core/errors.hpp"

namespace fleet_hub::gateway {
namespace {

constexpr double kTwoTo63 = 9223372036854775808.0;
constexpr double kTwoTo64 = 18446744073709551616.0;

using nlohmann::json;

const std::unordered_map<std::string, std::vector<std::string>>& compatibility_table() {
  static const std::unordered_map<std::string, std::vector<std::string>> kTable = {
      {"agent_id", {"agentId", "agent_id"}},
      {"token", {"token"}},
      {"hostname", {"hostname", "hostName"}},
      {"os", {"os", "osName"}},
      {"arch", {"arch", "architecture"}},
      {"version", {"version", "agentVersion"}},
      {"timestamp", {"timestamp"}},
      {"cpu", {"cpu"}},
      {"usage_percent", {"usagePercent", "usage"}},
      {"cpu_usage", {"cpuUsage", "cpuPercent"}},
      {"core_count", {"coreCount", "cores"}},
      {"per_core", {"perCoreUsage", "perCore"}},
      {"model", {"model"}},
      {"vendor", {"vendor"}},
      {"frequency_mhz", {"frequencyMhz", "frequency"}},
      {"temperature", {"temperature"}},
      {"memory", {"memory", "mem"}},
      {"total", {"total"}},
      {"used", {"used"}},
      {"available", {"available"}},
      {"swap_total", {"swapTotal"}},
      {"swap_used", {"swapUsed"}},
      {"cached", {"cached"}},
      {"disks", {"disks", "disk"}},
      {"mount_point", {"mountPoint", "mount"}},
      {"device", {"device"}},
      {"fs_type", {"fsType", "filesystem"}},
      {"read_bps", {"readBytesPerSec", "readBytes"}},
      {"write_bps", {"writeBytesPerSec", "writeBytes"}},
      {"networks", {"networks", "network", "net"}},
      {"interface", {"interface", "iface"}},
      {"rx_bps", {"rxBytesPerSec", "bytesRecv", "rx_bytes_per_sec"}},
      {"tx_bps", {"txBytesPerSec", "bytesSent", "tx_bytes_per_sec"}},
      {"is_up", {"isUp", "up"}},
      {"ip_addresses", {"ipAddresses", "addresses"}},
      {"gpus", {"gpus", "gpu"}},
      {"npus", {"npus", "npu"}},
      {"index", {"index"}},
      {"name", {"name"}},
      {"memory_total", {"memoryTotal"}},
      {"memory_used", {"memoryUsed"}},
      {"power_watts", {"powerWatts", "power"}},
      {"sessions", {"userSessions", "sessions"}},
      {"username", {"username", "user"}},
      {"tty", {"tty"}},
      {"remote_host", {"remoteHost", "host"}},
      {"login_time", {"loginTime"}},
      {"system", {"systemInfo", "system"}},
      {"os_name", {"osName"}},
      {"os_version", {"osVersion"}},
      {"kernel_version", {"kernelVersion"}},
      {"uptime_seconds", {"uptimeSeconds", "uptime"}},
      {"load_average", {"loadAverage", "loadAvg"}},
      {"command_id", {"commandId"}},
      {"success", {"success"}},
      {"output", {"output"}},
      {"error", {"error"}},
  };
  return kTable;
}

// Present spelling of `canonical` in `object`, or nullptr.
const json* field(const json& object, const std::string& canonical) {
  if (!object.is_object()) {
    return nullptr;
  }
  const json* found = nullptr;
  std::string found_name;
  for (const auto& spelling : field_spellings(canonical)) {
    const auto it = object.find(spelling);
    if (it == object.end() || it->is_null()) {
      continue;
    }
    if (found == nullptr) {
      found = &*it;
      found_name = spelling;
      continue;
    }
    if (*found != *it) {
      throw core::ValidationError("ambiguous field " + canonical + ": '" + found_name + "' and '" + spelling +
                                  "' disagree");
    }
  }
  return found;
}

double number_field(const json& object, const std::string& canonical, const double fallback = 0.0) {
  const json* value = field(object, canonical);
  if (value == nullptr) {
    return fallback;
  }
  if (!value->is_number()) {
    throw core::ValidationError(canonical + " must be a number");
  }
  return value->get<double>();
}

std::optional<double> optional_number(const json& object, const std::string& canonical) {
  if (field(object, canonical) == nullptr) {
    return std::nullopt;
  }
  return number_field(object, canonical);
}

std::uint64_t unsigned_field(const json& object, const std::string& canonical, const std::uint64_t fallback = 0) {
  const json* value = field(object, canonical);
  if (value == nullptr) {
    return fallback;
  }
  if (value->is_number_unsigned()) {
    return value->get<std::uint64_t>();
  }
  if (value->is_number()) {
    const double parsed = value->get<double>();
    if (parsed < 0.0) {
      throw core::ValidationError(canonical + " must not be negative");
    }
    if (!std::isfinite(parsed) || parsed >= kTwoTo64) {
      throw core::ValidationError(canonical + " is out of range");
    }
    return static_cast<std::uint64_t>(parsed);
  }
  throw core::ValidationError(canonical + " must be a number");
}

std::optional<std::uint64_t> optional_unsigned(const json& object, const std::string& canonical) {
  if (field(object, canonical) == nullptr) {
    return std::nullopt;
  }
  return unsigned_field(object, canonical);
}

std::int64_t integer_field(const json& object, const std::string& canonical, const std::int64_t fallback = 0) {
  const json* value = field(object, canonical);
  if (value == nullptr) {
    return fallback;
  }
  if (!value->is_number()) {
    throw core::ValidationError(canonical + " must be a number");
  }
  if (value->is_number_unsigned()) {
    const auto parsed = value->get<std::uint64_t>();
    if (parsed > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      throw core::ValidationError(canonical + " is out of range");
    }
    return static_cast<std::int64_t>(parsed);
  }
  if (value->is_number_integer()) {
    return value->get<std::int64_t>();
  }
  const double parsed = value->get<double>();
  if (!std::isfinite(parsed) || parsed < -kTwoTo63 || parsed >= kTwoTo63) {
    throw core::ValidationError(canonical + " is out of range");
  }
  return static_cast<std::int64_t>(parsed);
}

std::string string_field(const json& object, const std::string& canonical) {
  const json* value = field(object, canonical);
  if (value == nullptr) {
    return {};
  }
  if (!value->is_string()) {
    throw core::ValidationError(canonical + " must be a string");
  }
  return value->get<std::string>();
}

bool bool_field(const json& object, const std::string& canonical, const bool fallback) {
  const json* value = field(object, canonical);
  if (value == nullptr) {
    return fallback;
  }
  if (!value->is_boolean()) {
    throw core::ValidationError(canonical + " must be a boolean");
  }
  return value->get<bool>();
}

std::vector<double> number_list(const json& object, const std::string& canonical) {
  const json* value = field(object, canonical);
  if (value == nullptr) {
    return {};
  }
  if (!value->is_array()) {
    throw core::ValidationError(canonical + " must be an array");
  }
  std::vector<double> items;
  items.reserve(value->size());
  for (const auto& item : *value) {
    if (!item.is_number()) {
      throw core::ValidationError(canonical + " must contain numbers");
    }
    items.push_back(item.get<double>());
  }
  return items;
}

std::vector<std::string> string_list(const json& object, const std::string& canonical) {
  const json* value = field(object, canonical);
  if (value == nullptr) {
    return {};
  }
  if (value->is_string()) {
    return {value->get<std::string>()};
  }
  if (!value->is_array()) {
    throw core::ValidationError(canonical + " must be an array");
  }
  std::vector<std::string> items;
  for (const auto& item : *value) {
    if (!item.is_string()) {
      throw core::ValidationError(canonical + " must contain strings");
    }
    items.push_back(item.get<std::string>());
  }
  return items;
}

// A lone object where a list is expected counts as a one-element list.
std::vector<const json*> object_list(const json& object, const std::string& canonical) {
  const json* value = field(object, canonical);
  if (value == nullptr) {
    return {};
  }
  if (value->is_object()) {
    return {value};
  }
  if (!value->is_array()) {
    throw core::ValidationError(canonical + " must be an array or object");
  }
  std::vector<const json*> items;
  for (const auto& item : *value) {
    if (!item.is_object()) {
      throw core::ValidationError(canonical + " entries must be objects");
    }
    items.push_back(&item);
  }
  return items;
}

const json& object_field(const json& object, const std::string& canonical) {
  static const json kEmpty = json::object();
  const json* value = field(object, canonical);
  if (value == nullptr) {
    return kEmpty;
  }
  if (!value->is_object()) {
    throw core::ValidationError(canonical + " must be an object");
  }
  return *value;
}

std::uint32_t index_field(const json& object) {
  const std::uint64_t index = unsigned_field(object, "index");
  if (index > std::numeric_limits<std::uint32_t>::max()) {
    throw core::ValidationError("index out of range");
  }
  return static_cast<std::uint32_t>(index);
}

model::DiskMetrics decode_disk(const json& object) {
  model::DiskMetrics disk{};
  disk.mount_point = string_field(object, "mount_point");
  disk.device = string_field(object, "device");
  disk.fs_type = string_field(object, "fs_type");
  disk.total = unsigned_field(object, "total");
  disk.used = unsigned_field(object, "used");
  disk.read_bps = number_field(object, "read_bps");
  disk.write_bps = number_field(object, "write_bps");
  if (disk.mount_point.empty() && disk.device.empty()) {
    throw core::ValidationError("disk entry needs a mount point or device");
  }
  return disk;
}

model::NetworkMetrics decode_network(const json& object) {
  model::NetworkMetrics network{};
  network.interface = string_field(object, "interface");
  if (network.interface.empty()) {
    network.interface = string_field(object, "name");
  }
  if (network.interface.empty()) {
    throw core::ValidationError("network entry needs an interface name");
  }
  network.rx_bps = number_field(object, "rx_bps");
  network.tx_bps = number_field(object, "tx_bps");
  network.is_up = bool_field(object, "is_up", true);
  network.ip_addresses = string_list(object, "ip_addresses");
  return network;
}

model::GpuMetrics decode_gpu(const json& object) {
  model::GpuMetrics gpu{};
  gpu.index = index_field(object);
  gpu.name = string_field(object, "name");
  gpu.usage_percent = number_field(object, "usage_percent");
  gpu.memory_total = unsigned_field(object, "memory_total");
  gpu.memory_used = unsigned_field(object, "memory_used");
  gpu.temperature = number_field(object, "temperature");
  gpu.power_watts = number_field(object, "power_watts");
  return gpu;
}

model::NpuMetrics decode_npu(const json& object) {
  return model::NpuMetrics{.index = index_field(object),
                           .name = string_field(object, "name"),
                           .usage_percent = number_field(object, "usage_percent")};
}

model::UserSession decode_session(const json& object) {
  return model::UserSession{.username = string_field(object, "username"),
                            .tty = string_field(object, "tty"),
                            .remote_host = string_field(object, "remote_host"),
                            .login_time = integer_field(object, "login_time")};
}

std::optional<model::SystemInfo> decode_system(const json& payload) {
  const json* value = field(payload, "system");
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_object()) {
    throw core::ValidationError("system must be an object");
  }
  return model::SystemInfo{.os_name = string_field(*value, "os_name"),
                           .os_version = string_field(*value, "os_version"),
                           .kernel_version = string_field(*value, "kernel_version"),
                           .hostname = string_field(*value, "hostname"),
                           .uptime_seconds = unsigned_field(*value, "uptime_seconds")};
}

template <typename T, typename Decode>
std::vector<T> decode_list(const json& payload, const std::string& canonical, Decode decode) {
  std::vector<T> items;
  for (const json* entry : object_list(payload, canonical)) {
    items.push_back(decode(*entry));
  }
  return items;
}

std::int64_t frame_timestamp(const json& payload, const std::int64_t received_ms) {
  const std::int64_t timestamp = integer_field(payload, "timestamp", 0);
  return timestamp > 0 ? timestamp : received_ms;
}

AuthFrame decode_auth(const json& payload) {
  AuthFrame frame{};
  frame.token = string_field(payload, "token");
  frame.agent_id = string_field(payload, "agent_id");
  frame.hostname = string_field(payload, "hostname");
  frame.os = string_field(payload, "os");
  frame.arch = string_field(payload, "arch");
  frame.version = string_field(payload, "version");
  if (frame.agent_id.empty()) {
    frame.agent_id = frame.hostname;
  }
  if (frame.agent_id.empty()) {
    throw core::ValidationError("auth frame needs an agentId or hostname");
  }
  if (frame.agent_id.size() > 255) {
    throw core::ValidationError("agent id too long");
  }
  return frame;
}

model::MetricSnapshot decode_snapshot(const json& payload, const std::int64_t received_ms) {
  model::MetricSnapshot snapshot{};
  snapshot.timestamp_ms = frame_timestamp(payload, received_ms);

  const json& cpu = object_field(payload, "cpu");
  snapshot.cpu.usage_percent = number_field(cpu, "usage_percent");
  snapshot.cpu.core_count = static_cast<std::uint32_t>(unsigned_field(cpu, "core_count"));
  snapshot.cpu.per_core = number_list(cpu, "per_core");
  snapshot.cpu.model = string_field(cpu, "model");
  snapshot.cpu.vendor = string_field(cpu, "vendor");
  snapshot.cpu.frequency_mhz = number_field(cpu, "frequency_mhz");
  snapshot.cpu.temperature = number_field(cpu, "temperature");
  if (snapshot.cpu.usage_percent < 0.0 || snapshot.cpu.usage_percent > 100.0) {
    throw core::ValidationError("cpu usage must be within 0..100");
  }

  const json& memory = object_field(payload, "memory");
  snapshot.memory.total = unsigned_field(memory, "total");
  snapshot.memory.used = unsigned_field(memory, "used");
  snapshot.memory.available = unsigned_field(memory, "available");
  snapshot.memory.swap_total = unsigned_field(memory, "swap_total");
  snapshot.memory.swap_used = unsigned_field(memory, "swap_used");
  snapshot.memory.cached = unsigned_field(memory, "cached");

  snapshot.disks = decode_list<model::DiskMetrics>(payload, "disks", decode_disk);
  snapshot.networks = decode_list<model::NetworkMetrics>(payload, "networks", decode_network);
  snapshot.gpus = decode_list<model::GpuMetrics>(payload, "gpus", decode_gpu);
  snapshot.npus = decode_list<model::NpuMetrics>(payload, "npus", decode_npu);
  snapshot.sessions = decode_list<model::UserSession>(payload, "sessions", decode_session);
  snapshot.system = decode_system(payload);
  snapshot.load_average = number_list(payload, "load_average");
  return snapshot;
}

// A value given in both the nested and the flat realtime form must agree.
template <typename T>
std::optional<T> merge_flat(const std::optional<T>& nested, const std::optional<T>& flat, const char* what) {
  if (nested.has_value() && flat.has_value() && *nested != *flat) {
    throw core::ValidationError(std::string("ambiguous ") + what + ": nested and flat values disagree");
  }
  return nested.has_value() ? nested : flat;
}

model::RealtimeSample decode_realtime(const json& payload, const std::int64_t received_ms) {
  model::RealtimeSample sample{};
  sample.timestamp_ms = frame_timestamp(payload, received_ms);

  // Realtime frames are either nested ({"cpu": {...}}) or flat ({"cpuUsage": ...}).
  const json& cpu = object_field(payload, "cpu");
  sample.cpu_usage_percent = optional_number(cpu, "usage_percent");
  sample.per_core = number_list(cpu, "per_core");
  sample.cpu_temperature = optional_number(cpu, "temperature");
  sample.cpu_frequency_mhz = optional_number(cpu, "frequency_mhz");
  sample.cpu_usage_percent = merge_flat(sample.cpu_usage_percent, optional_number(payload, "cpu_usage"), "cpu usage");
  if (sample.cpu_usage_percent.has_value() &&
      (*sample.cpu_usage_percent < 0.0 || *sample.cpu_usage_percent > 100.0)) {
    throw core::ValidationError("cpu usage must be within 0..100");
  }

  const json& memory = object_field(payload, "memory");
  sample.memory_used =
      merge_flat(optional_unsigned(memory, "used"), optional_unsigned(payload, "memory_used"), "memory used");
  sample.memory_available = optional_unsigned(memory, "available");
  sample.memory_cached = optional_unsigned(memory, "cached");
  sample.swap_used = optional_unsigned(memory, "swap_used");

  sample.load_average = number_list(payload, "load_average");
  sample.disk_io = decode_list<model::DiskMetrics>(payload, "disks", decode_disk);
  sample.network_io = decode_list<model::NetworkMetrics>(payload, "networks", decode_network);
  sample.gpus = decode_list<model::GpuMetrics>(payload, "gpus", decode_gpu);
  sample.npus = decode_list<model::NpuMetrics>(payload, "npus", decode_npu);
  return sample;
}

model::StaticInfo decode_static(const json& payload) {
  model::StaticInfo info{};
  const json& cpu = object_field(payload, "cpu");
  info.cpu_model = string_field(cpu, "model");
  info.cpu_vendor = string_field(cpu, "vendor");
  info.cpu_cores = static_cast<std::uint32_t>(unsigned_field(cpu, "core_count"));
  info.cpu_frequency_mhz = number_field(cpu, "frequency_mhz");

  const json& memory = object_field(payload, "memory");
  info.memory_total = unsigned_field(memory, "total");
  info.swap_total = unsigned_field(memory, "swap_total");

  info.disks = decode_list<model::DiskMetrics>(payload, "disks", decode_disk);
  info.networks = decode_list<model::NetworkMetrics>(payload, "networks", decode_network);
  info.gpus = decode_list<model::GpuMetrics>(payload, "gpus", decode_gpu);
  info.npus = decode_list<model::NpuMetrics>(payload, "npus", decode_npu);
  info.system = decode_system(payload);
  return info;
}

model::PeriodicData decode_periodic(const json& payload, const std::int64_t received_ms) {
  model::PeriodicData data{};
  data.timestamp_ms = frame_timestamp(payload, received_ms);
  data.disk_usage = decode_list<model::DiskMetrics>(payload, "disks", decode_disk);
  data.sessions = decode_list<model::UserSession>(payload, "sessions", decode_session);
  data.network_addresses = decode_list<model::NetworkMetrics>(payload, "networks", decode_network);
  data.system = decode_system(payload);
  return data;
}

model::CommandReply decode_command_result(const json& payload) {
  model::CommandReply reply{};
  reply.command_id = string_field(payload, "command_id");
  if (reply.command_id.empty()) {
    throw core::ValidationError("command_result needs a commandId");
  }
  reply.success = bool_field(payload, "success", false);
  reply.output = string_field(payload, "output");
  reply.error = string_field(payload, "error");
  return reply;
}

}  // namespace

const std::vector<std::string>& field_spellings(const std::string& canonical) {
  const auto& table = compatibility_table();
  const auto it = table.find(canonical);
  if (it == table.end()) {
    throw std::logic_error("field missing from compatibility table: " + canonical);
  }
  return it->second;
}

InboundFrame decode_frame(const std::string& kind, const nlohmann::json& payload, const std::int64_t received_ms) {
  if (!payload.is_object()) {
    throw core::ValidationError("payload for " + kind + " must be an object");
  }

  if (kind == "auth") {
    return decode_auth(payload);
  }
  if (kind == "static_info") {
    return decode_static(payload);
  }
  if (kind == "periodic") {
    return decode_periodic(payload, received_ms);
  }
  if (kind == "metrics") {
    return decode_snapshot(payload, received_ms);
  }
  if (kind == "realtime") {
    return decode_realtime(payload, received_ms);
  }
  if (kind == "heartbeat") {
    return HeartbeatFrame{.timestamp_ms = frame_timestamp(payload, received_ms)};
  }
  if (kind == "command_result") {
    return decode_command_result(payload);
  }
  throw core::ValidationError("unknown frame type: " + kind);
}

}  // namespace fleet_hub::gateway
