#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "model/agent.hpp"

namespace fleet_hub::gateway {

// One inbound frame before normalization: `kind` is the frame type name.
struct ChannelFrame {
  std::string kind{};
  nlohmann::json payload = nlohmann::json::object();
};

enum class OutboundKind : std::uint8_t {
  AUTH_RESULT = 0,
  HEARTBEAT_ACK = 1,
  COMMAND = 2,
};

const char* outbound_kind_name(OutboundKind kind) noexcept;

constexpr std::chrono::milliseconds kDefaultSendTimeout{5000};

struct OutboundMessage {
  OutboundKind kind{OutboundKind::HEARTBEAT_ACK};
  nlohmann::json payload = nlohmann::json::object();
  // Command id for COMMAND messages.
  std::string correlation{};
  // Upper bound on the whole write, including waits on a peer that stopped reading.
  std::chrono::milliseconds send_timeout{kDefaultSendTimeout};
};

enum class SendStatus : std::uint8_t {
  SENT = 0,
  CLOSED = 1,
  // The peer did not drain the socket in time; the channel is closed afterwards.
  TIMED_OUT = 2,
};

// The peer went away or broke framing; the channel is unusable afterwards.
class ChannelClosedError : public std::runtime_error {
 public:
  explicit ChannelClosedError(const std::string& message) : std::runtime_error(message) {}
};

// Transport-neutral view of one agent connection. read() is called from the
// session thread only; send() and close() may be called from any thread.
class FrameChannel {
 public:
  virtual ~FrameChannel() = default;

  [[nodiscard]] virtual model::TransportKind transport() const = 0;
  // nullopt when nothing complete arrived within `timeout`. Throws
  // ChannelClosedError on disconnect and core::ValidationError on a malformed frame.
  virtual std::optional<ChannelFrame> read(std::chrono::milliseconds timeout) = 0;
  virtual SendStatus send(const OutboundMessage& message) = 0;
  // Wakes a blocked read(); safe to call more than once.
  virtual void close() = 0;
  [[nodiscard]] virtual std::string peer() const = 0;
};

}  // namespace fleet_hub::gateway
