#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "gateway/frame_channel.hpp"
#include "gateway/payload_decoder.hpp"
#include "model/command.hpp"

namespace fleet_hub::gateway {

enum class SessionState : std::uint8_t {
  CONNECTING = 0,
  AUTHENTICATED = 1,
  STREAMING = 2,
  DRAINING = 3,
  LOST = 4,
  CLOSED = 5,
};

const char* session_state_name(SessionState state) noexcept;

class AgentSession;

// What a session needs from the gateway that owns it.
class SessionHost {
 public:
  virtual ~SessionHost() = default;

  [[nodiscard]] virtual bool authenticate_agent(const AuthFrame& auth) const = 0;
  // Registers the agent; throws core::ConflictError when the id is already streaming.
  virtual void admit(const std::shared_ptr<AgentSession>& session, const AuthFrame& auth) = 0;
  virtual void on_frame(AgentSession& session, const InboundFrame& frame) = 0;
  // The single exit path for an admitted session, whatever the cause.
  virtual void retire(const AgentSession& session) = 0;
};

struct SessionOptions {
  std::chrono::milliseconds auth_timeout{5000};
  std::chrono::milliseconds read_timeout{1000};
  std::chrono::milliseconds write_timeout{kDefaultSendTimeout};
};

// One agent connection: Connecting -> Authenticated -> Streaming ->
// (Draining | Lost) -> Closed. run() blocks on the connection's own thread.
class AgentSession : public std::enable_shared_from_this<AgentSession> {
 public:
  AgentSession(std::unique_ptr<FrameChannel> channel, SessionHost& host, SessionOptions options);

  AgentSession(const AgentSession&) = delete;
  AgentSession& operator=(const AgentSession&) = delete;

  void run();

  // Heartbeat timeout; the caller retires the agent.
  void mark_lost();
  // Orderly shutdown.
  void drain();

  SendStatus send_command(const model::Command& command, std::chrono::milliseconds timeout);
  SendStatus send(const OutboundMessage& message);

  [[nodiscard]] SessionState state() const noexcept { return state_.load(); }
  [[nodiscard]] const std::string& agent_id() const noexcept { return agent_id_; }
  [[nodiscard]] model::TransportKind transport() const { return channel_->transport(); }
  [[nodiscard]] std::string peer() const { return channel_->peer(); }

 private:
  bool authenticate();
  void stream();
  void reject(const std::string& reason);

  std::unique_ptr<FrameChannel> channel_;
  SessionHost& host_;
  SessionOptions options_;
  std::atomic<SessionState> state_{SessionState::CONNECTING};
  std::string agent_id_{};
  bool admitted_{false};
};

}  // namespace fleet_hub::gateway
