#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/hub.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const fleet_hub::core::HubConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[hub] loaded config from " << config_path
         << " | bind_address=" << config.server.bind_address
         << " | api_port=" << config.server.api_port
         << " | agent_framed_port=" << config.server.agent_framed_port
         << " | agent_rpc_port=" << config.server.agent_rpc_port
         << " | heartbeat_timeout_s=" << config.gateway.heartbeat_timeout.count()
         << " | auth_enabled=" << (config.auth.enabled ? "true" : "false")
         << " | agent_tokens=" << config.auth.agent_tokens.size()
         << " | superadmin_token=" << (config.auth.superadmin_token.empty() ? "unset" : "set")
         << " | elevation_secret=" << (config.auth.elevation_secret.empty() ? "unset" : "set")
         << " | storage_type=" << config.storage.type
         << " | history_enabled=" << (config.history.enabled ? "true" : "false")
         << " | database_path=" << config.database_path;

  if (config.storage.type == "redis") {
    output << " | redis_address=";
    if (!config.storage.redis.unix_socket.empty()) {
      output << "unix://" << config.storage.redis.unix_socket;
    } else {
      output << config.storage.redis.host << ':' << config.storage.redis.port;
    }
  } else if (config.storage.type == "sqlite") {
    output << " | sqlite_path=" << config.storage.sqlite_path;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::signal(SIGPIPE, SIG_IGN);

  const std::string config_path = argc > 1 ? argv[1] : "configs/hub.yaml";

  fleet_hub::core::HubConfig config{};
  try {
    config = fleet_hub::core::load_hub_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  try {
    fleet_hub::core::Hub hub{config};
    hub.start();
    while (g_shutdown_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    std::cerr << "[hub] shutdown signal received; exiting cleanly\n";
    hub.stop();
  } catch (const std::exception& ex) {
    std::cerr << "[hub] fatal: " << ex.what() << '\n';
    return 1;
  }

  return 0;
}
