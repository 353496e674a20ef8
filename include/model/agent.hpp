#pragma once

#include <cstdint>
#include <string>

namespace fleet_hub::model {

enum class TransportKind : std::uint8_t {
  RPC_STREAM = 0,
  FRAMED_SOCKET = 1,
};

inline const char* transport_name(const TransportKind kind) {
  return kind == TransportKind::RPC_STREAM ? "rpc_stream" : "framed_socket";
}

struct AgentInfo {
  std::string id{};
  std::string hostname{};
  std::string os{};
  std::string arch{};
  std::string version{};
  TransportKind transport{TransportKind::FRAMED_SOCKET};
  std::int64_t connected_at_ms{0};
  std::int64_t last_heartbeat_ms{0};
};

}  // namespace fleet_hub::model
