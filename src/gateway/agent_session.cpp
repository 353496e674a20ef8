#include "gateway/agent_session.hpp"

#include <exception>
#include <iostream>

#include "auth/permission.hpp"
#include "core/errors.hpp"
#include "core/timestamp.hpp"

namespace fleet_hub::gateway {

const char* session_state_name(const SessionState state) noexcept {
  switch (state) {
    case SessionState::CONNECTING:
      return "connecting";
    case SessionState::AUTHENTICATED:
      return "authenticated";
    case SessionState::STREAMING:
      return "streaming";
    case SessionState::DRAINING:
      return "draining";
    case SessionState::LOST:
      return "lost";
    case SessionState::CLOSED:
      return "closed";
  }
  return "unknown";
}

AgentSession::AgentSession(std::unique_ptr<FrameChannel> channel, SessionHost& host, SessionOptions options)
    : channel_(std::move(channel)), host_(host), options_(options) {}

void AgentSession::run() {
  try {
    if (authenticate()) {
      stream();
    }
  } catch (const ChannelClosedError& ex) {
    if (state_.load() == SessionState::STREAMING) {
      std::cerr << "[gateway] agent " << agent_id_ << " disconnected: " << ex.what() << '\n';
    }
  } catch (const std::exception& ex) {
    std::cerr << "[gateway] closing connection from " << channel_->peer() << ": " << ex.what() << '\n';
  }

  if (admitted_) {
    host_.retire(*this);
  }
  channel_->close();
  state_.store(SessionState::CLOSED);
}

bool AgentSession::authenticate() {
  const auto deadline = std::chrono::steady_clock::now() + options_.auth_timeout;
  std::optional<ChannelFrame> frame;
  while (!frame.has_value()) {
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      std::cerr << "[gateway] auth timeout from " << channel_->peer() << '\n';
      return false;
    }
    try {
      frame = channel_->read(left);
    } catch (const core::ValidationError& ex) {
      reject(ex.what());
      return false;
    } catch (const nlohmann::json::exception& ex) {
      reject(std::string("malformed frame: ") + ex.what());
      return false;
    }
  }

  if (frame->kind != "auth") {
    reject("authentication required before " + frame->kind);
    return false;
  }

  AuthFrame auth;
  try {
    auth = std::get<AuthFrame>(decode_frame(frame->kind, frame->payload, core::unix_timestamp_now_ms()));
  } catch (const core::ValidationError& ex) {
    reject(ex.what());
    return false;
  } catch (const nlohmann::json::exception& ex) {
    reject(std::string("malformed auth frame: ") + ex.what());
    return false;
  }

  if (!host_.authenticate_agent(auth)) {
    reject("invalid agent token");
    return false;
  }
  agent_id_ = auth.agent_id;
  state_.store(SessionState::AUTHENTICATED);

  try {
    host_.admit(shared_from_this(), auth);
  } catch (const core::ConflictError& ex) {
    reject(ex.what());
    return false;
  }
  admitted_ = true;
  state_.store(SessionState::STREAMING);

  // Agents may only be commanded up to the catalogue ceiling; users are gated separately.
  const auto acknowledged = channel_->send(OutboundMessage{
      .kind = OutboundKind::AUTH_RESULT,
      .payload = {{"success", true},
                  {"agentId", agent_id_},
                  {"permissionLevel", static_cast<int>(auth::PermissionLevel::SYSTEM_ADMIN)}},
      .correlation = {},
      .send_timeout = options_.write_timeout});
  if (acknowledged != SendStatus::SENT) {
    throw ChannelClosedError("auth result not delivered");
  }
  std::cerr << "[gateway] agent " << agent_id_ << " streaming via " << model::transport_name(channel_->transport())
            << " from " << channel_->peer() << '\n';
  return true;
}

void AgentSession::stream() {
  while (state_.load() == SessionState::STREAMING) {
    try {
      const auto frame = channel_->read(options_.read_timeout);
      if (!frame.has_value()) {
        continue;
      }
      host_.on_frame(*this, decode_frame(frame->kind, frame->payload, core::unix_timestamp_now_ms()));
    } catch (const core::ValidationError& ex) {
      std::cerr << "[gateway] dropped frame from " << agent_id_ << ": " << ex.what() << '\n';
    } catch (const nlohmann::json::exception& ex) {
      std::cerr << "[gateway] dropped malformed frame from " << agent_id_ << ": " << ex.what() << '\n';
    } catch (const core::HubError& ex) {
      std::cerr << "[gateway] frame from " << agent_id_ << " failed: " << ex.what() << '\n';
    }
  }
}

void AgentSession::reject(const std::string& reason) {
  std::cerr << "[gateway] rejected connection from " << channel_->peer() << ": " << reason << '\n';
  const auto delivered = channel_->send(OutboundMessage{.kind = OutboundKind::AUTH_RESULT,
                                                        .payload = {{"success", false}, {"error", reason}},
                                                        .correlation = {},
                                                        .send_timeout = options_.write_timeout});
  if (delivered != SendStatus::SENT) {
    std::cerr << "[gateway] rejection not delivered to " << channel_->peer() << '\n';
  }
}

void AgentSession::mark_lost() {
  auto expected = SessionState::STREAMING;
  if (state_.compare_exchange_strong(expected, SessionState::LOST)) {
    channel_->close();
  }
}

void AgentSession::drain() {
  auto state = state_.load();
  while (state != SessionState::CLOSED && state != SessionState::LOST && state != SessionState::DRAINING) {
    if (state_.compare_exchange_weak(state, SessionState::DRAINING)) {
      break;
    }
  }
  channel_->close();
}

SendStatus AgentSession::send_command(const model::Command& command, const std::chrono::milliseconds timeout) {
  if (state_.load() != SessionState::STREAMING) {
    return SendStatus::CLOSED;
  }
  return send(OutboundMessage{.kind = OutboundKind::COMMAND,
                              .payload = {{"commandId", command.id},
                                          {"type", command.type},
                                          {"target", command.target},
                                          {"params", command.params}},
                              .correlation = command.id,
                              .send_timeout = timeout});
}

SendStatus AgentSession::send(const OutboundMessage& message) { return channel_->send(message); }

}  // namespace fleet_hub::gateway
