#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fleet_hub::model {

struct CpuMetrics {
  double usage_percent{0.0};
  std::uint32_t core_count{0};
  std::vector<double> per_core{};
  std::string model{};
  std::string vendor{};
  double frequency_mhz{0.0};
  double temperature{0.0};
};

struct MemoryMetrics {
  std::uint64_t total{0};
  std::uint64_t used{0};
  std::uint64_t available{0};
  std::uint64_t swap_total{0};
  std::uint64_t swap_used{0};
  std::uint64_t cached{0};
};

struct DiskMetrics {
  std::string mount_point{};
  std::string device{};
  std::string fs_type{};
  std::uint64_t total{0};
  std::uint64_t used{0};
  double read_bps{0.0};
  double write_bps{0.0};
};

struct NetworkMetrics {
  std::string interface{};
  double rx_bps{0.0};
  double tx_bps{0.0};
  bool is_up{true};
  std::vector<std::string> ip_addresses{};
};

struct GpuMetrics {
  std::uint32_t index{0};
  std::string name{};
  double usage_percent{0.0};
  std::uint64_t memory_total{0};
  std::uint64_t memory_used{0};
  double temperature{0.0};
  double power_watts{0.0};
};

struct NpuMetrics {
  std::uint32_t index{0};
  std::string name{};
  double usage_percent{0.0};
};

struct UserSession {
  std::string username{};
  std::string tty{};
  std::string remote_host{};
  std::int64_t login_time{0};
};

struct SystemInfo {
  std::string os_name{};
  std::string os_version{};
  std::string kernel_version{};
  std::string hostname{};
  std::uint64_t uptime_seconds{0};
};

// One full sample from one agent. Stored copies are never modified.
struct MetricSnapshot {
  std::string agent_id{};
  std::int64_t timestamp_ms{0};
  CpuMetrics cpu{};
  MemoryMetrics memory{};
  std::vector<DiskMetrics> disks{};
  std::vector<NetworkMetrics> networks{};
  std::vector<GpuMetrics> gpus{};
  std::vector<NpuMetrics> npus{};
  std::vector<UserSession> sessions{};
  std::optional<SystemInfo> system{};
  std::vector<double> load_average{};
};

// High-frequency cpu/memory/io sample; only the fields present are applied.
struct RealtimeSample {
  std::int64_t timestamp_ms{0};
  std::optional<double> cpu_usage_percent{};
  std::vector<double> per_core{};
  std::optional<double> cpu_temperature{};
  std::optional<double> cpu_frequency_mhz{};
  std::optional<std::uint64_t> memory_used{};
  std::optional<std::uint64_t> memory_available{};
  std::optional<std::uint64_t> memory_cached{};
  std::optional<std::uint64_t> swap_used{};
  std::vector<double> load_average{};
  std::vector<DiskMetrics> disk_io{};
  std::vector<NetworkMetrics> network_io{};
  std::vector<GpuMetrics> gpus{};
  std::vector<NpuMetrics> npus{};
};

// Hardware identity, sent once after authentication.
struct StaticInfo {
  std::string cpu_model{};
  std::string cpu_vendor{};
  std::uint32_t cpu_cores{0};
  double cpu_frequency_mhz{0.0};
  std::uint64_t memory_total{0};
  std::uint64_t swap_total{0};
  std::vector<DiskMetrics> disks{};
  std::vector<NetworkMetrics> networks{};
  std::vector<GpuMetrics> gpus{};
  std::vector<NpuMetrics> npus{};
  std::optional<SystemInfo> system{};
};

// Low-frequency data: disk usage, logged-in users, interface addresses.
struct PeriodicData {
  std::int64_t timestamp_ms{0};
  std::vector<DiskMetrics> disk_usage{};
  std::vector<UserSession> sessions{};
  std::vector<NetworkMetrics> network_addresses{};
  std::optional<SystemInfo> system{};
};

inline double memory_percent(const MemoryMetrics& memory) {
  if (memory.total == 0) {
    return 0.0;
  }
  return static_cast<double>(memory.used) / static_cast<double>(memory.total) * 100.0;
}

}  // namespace fleet_hub::model
