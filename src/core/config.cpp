#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fleet_hub::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value, const long long min_value,
                        const long long max_value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (parsed < min_value || parsed > max_value) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min_value) + ".." + std::to_string(max_value));
  }
  return parsed;
}

std::uint16_t parse_port(const std::string& key, const std::string& value) {
  return static_cast<std::uint16_t>(parse_integer(key, value, 1, 65535));
}

std::vector<std::string> split_list(const std::string& value) {
  std::string body = value;
  if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
    body = body.substr(1, body.size() - 2);
  }

  std::vector<std::string> items;
  std::stringstream stream(body);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = unquote(trim(item));
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  redis.port = parse_port("storage.redis.address", value.substr(split + 1));
}

void apply_key_value(HubConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);
  constexpr long long kMaxU32 = std::numeric_limits<std::uint32_t>::max();

  if (key == "server.bind_address") {
    config.server.bind_address = value;
    return;
  }
  if (key == "server.api_port") {
    config.server.api_port = parse_port(key, value);
    return;
  }
  if (key == "server.agent_framed_port") {
    config.server.agent_framed_port = parse_port(key, value);
    return;
  }
  if (key == "server.agent_rpc_port") {
    config.server.agent_rpc_port = parse_port(key, value);
    return;
  }

  if (key == "gateway.heartbeat_timeout_s") {
    config.gateway.heartbeat_timeout = std::chrono::seconds(parse_integer(key, value, 1, 86400));
    return;
  }
  if (key == "gateway.sweep_interval_ms") {
    config.gateway.sweep_interval = std::chrono::milliseconds(parse_integer(key, value, 10, 600000));
    return;
  }
  if (key == "gateway.auth_timeout_ms") {
    config.gateway.auth_timeout = std::chrono::milliseconds(parse_integer(key, value, 10, 600000));
    return;
  }
  if (key == "gateway.write_timeout_ms") {
    config.gateway.write_timeout = std::chrono::milliseconds(parse_integer(key, value, 10, 600000));
    return;
  }
  if (key == "gateway.read_timeout_ms") {
    config.gateway.read_timeout = std::chrono::milliseconds(parse_integer(key, value, 10, 600000));
    return;
  }
  if (key == "gateway.max_frame_bytes") {
    config.gateway.max_frame_bytes = static_cast<std::size_t>(parse_integer(key, value, 1024, 64LL * 1024 * 1024));
    return;
  }
  if (key == "gateway.subscriber_queue_capacity") {
    config.gateway.subscriber_queue_capacity = static_cast<std::size_t>(parse_integer(key, value, 1, 1000000));
    return;
  }
  if (key == "gateway.subscriber_overflow") {
    if (value == "drop_oldest") {
      config.gateway.subscriber_disconnect_on_overflow = false;
    } else if (value == "disconnect") {
      config.gateway.subscriber_disconnect_on_overflow = true;
    } else {
      throw std::runtime_error("gateway.subscriber_overflow must be drop_oldest or disconnect");
    }
    return;
  }

  if (key == "auth.enabled") {
    config.auth.enabled = parse_bool(value);
    return;
  }
  if (key == "auth.agent_tokens") {
    config.auth.agent_tokens = split_list(raw_value);
    return;
  }
  if (key == "auth.superadmin_token") {
    config.auth.superadmin_token = value;
    return;
  }
  if (key == "auth.elevation_secret") {
    config.auth.elevation_secret = value;
    return;
  }
  if (key == "auth.elevation_ttl_s") {
    config.auth.elevation_ttl = std::chrono::seconds(parse_integer(key, value, 1, 86400));
    return;
  }

  if (key == "storage.type") {
    config.storage.type = value;
    return;
  }
  if (key == "storage.max_entries") {
    config.storage.max_entries = static_cast<std::size_t>(parse_integer(key, value, 1, 10000000));
    return;
  }
  if (key == "storage.retention_days") {
    config.storage.retention_days = static_cast<std::uint32_t>(parse_integer(key, value, 1, 36500));
    return;
  }
  if (key == "storage.redis.address") {
    apply_redis_address(config.storage.redis, value);
    return;
  }
  if (key == "storage.redis.password") {
    config.storage.redis.password = value;
    return;
  }
  if (key == "storage.redis.db") {
    config.storage.redis.db = static_cast<int>(parse_integer(key, value, 0, 15));
    return;
  }
  if (key == "storage.redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("storage.redis.key_prefix must not be empty");
    }
    config.storage.redis.key_prefix = value;
    return;
  }
  if (key == "storage.redis.timeout_ms") {
    config.storage.redis.timeout_ms = static_cast<std::uint32_t>(parse_integer(key, value, 1, kMaxU32));
    return;
  }
  if (key == "storage.sqlite.path") {
    config.storage.sqlite_path = value;
    return;
  }

  if (key == "database.path") {
    config.database_path = value;
    return;
  }

  if (key == "history.enabled") {
    config.history.enabled = parse_bool(value);
    return;
  }
  if (key == "history.retention_days") {
    config.history.retention_days = static_cast<std::uint32_t>(parse_integer(key, value, 1, 36500));
    return;
  }
  if (key == "history.hourly_retention_days") {
    config.history.hourly_retention_days = static_cast<std::uint32_t>(parse_integer(key, value, 1, 36500));
    return;
  }
  if (key == "history.daily_retention_days") {
    config.history.daily_retention_days = static_cast<std::uint32_t>(parse_integer(key, value, 1, 36500));
    return;
  }
  if (key == "history.aggregation_interval_s") {
    config.history.aggregation_interval = std::chrono::seconds(parse_integer(key, value, 1, 86400));
    return;
  }
  if (key == "history.cleanup_interval_s") {
    config.history.cleanup_interval = std::chrono::seconds(parse_integer(key, value, 1, 7 * 86400));
    return;
  }

  if (key == "audit.retention_days") {
    config.audit_retention_days = static_cast<std::uint32_t>(parse_integer(key, value, 1, 36500));
    return;
  }

  if (key == "commands.timeout_ms") {
    config.command_timeout = std::chrono::milliseconds(parse_integer(key, value, 100, 3600000));
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

}  // namespace

HubConfig load_hub_config(const std::string& path) {
  HubConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  if (config.storage.type != "memory" && config.storage.type != "redis" && config.storage.type != "sqlite") {
    throw std::runtime_error("storage.type must be memory, redis or sqlite");
  }

  apply_environment_overrides(config);
  return config;
}

void apply_environment_overrides(HubConfig& config) {
  if (const char* token = std::getenv("FLEET_HUB_SUPERADMIN_TOKEN"); token != nullptr && *token != '\0') {
    config.auth.superadmin_token = token;
  }
  if (const char* secret = std::getenv("FLEET_HUB_ELEVATION_SECRET"); secret != nullptr && *secret != '\0') {
    config.auth.elevation_secret = secret;
  }
}

}  // namespace fleet_hub::core
