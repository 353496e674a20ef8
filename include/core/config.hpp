#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fleet_hub::core {

struct ServerConfig {
  std::string bind_address{"0.0.0.0"};
  std::uint16_t api_port{8080};
  std::uint16_t agent_framed_port{9100};
  std::uint16_t agent_rpc_port{9200};
};

struct GatewayConfig {
  std::chrono::seconds heartbeat_timeout{90};
  std::chrono::milliseconds sweep_interval{1000};
  std::chrono::milliseconds auth_timeout{5000};
  std::chrono::milliseconds read_timeout{1000};
  std::chrono::milliseconds write_timeout{5000};
  std::size_t max_frame_bytes{512 * 1024};
  std::size_t subscriber_queue_capacity{256};
  bool subscriber_disconnect_on_overflow{false};
};

struct AuthConfig {
  bool enabled{true};
  std::vector<std::string> agent_tokens{};
  std::string superadmin_token{};
  std::string elevation_secret{};
  std::chrono::seconds elevation_ttl{300};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"fleet"};
  std::uint32_t timeout_ms{1000};
};

struct StorageConfig {
  std::string type{"memory"};
  std::size_t max_entries{600};
  std::uint32_t retention_days{7};
  RedisConfig redis{};
  std::string sqlite_path{"./data/fleet-metrics.db"};
};

struct HistoryConfig {
  bool enabled{true};
  std::uint32_t retention_days{30};
  std::uint32_t hourly_retention_days{90};
  std::uint32_t daily_retention_days{365};
  std::chrono::seconds aggregation_interval{3600};
  std::chrono::seconds cleanup_interval{86400};
};

struct HubConfig {
  ServerConfig server{};
  GatewayConfig gateway{};
  AuthConfig auth{};
  StorageConfig storage{};
  HistoryConfig history{};
  std::string database_path{"./data/fleet-hub.db"};
  std::uint32_t audit_retention_days{90};
  std::chrono::milliseconds command_timeout{30000};
};

HubConfig load_hub_config(const std::string& path);

// FLEET_HUB_SUPERADMIN_TOKEN / FLEET_HUB_ELEVATION_SECRET take precedence over the file.
void apply_environment_overrides(HubConfig& config);

}  // namespace fleet_hub::core
