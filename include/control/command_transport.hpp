#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "model/command.hpp"

namespace fleet_hub::control {

enum class Delivery : std::uint8_t {
  SENT = 0,
  NOT_CONNECTED = 1,
  // The agent stopped reading; its connection is dropped.
  TIMED_OUT = 2,
};

// Delivery side of command dispatch, implemented by the gateway.
class CommandTransport {
 public:
  virtual ~CommandTransport() = default;

  [[nodiscard]] virtual bool is_streaming(const std::string& agent_id) const = 0;
  // The write completes or fails within `timeout`.
  virtual Delivery send_command(const std::string& agent_id, const model::Command& command,
                                std::chrono::milliseconds timeout) = 0;
};

// Receives correlated replies and agent departures from the gateway.
class ReplyListener {
 public:
  virtual ~ReplyListener() = default;

  virtual void on_reply(const std::string& agent_id, const model::CommandReply& reply) = 0;
  virtual void on_agent_gone(const std::string& agent_id) = 0;
};

}  // namespace fleet_hub::control
