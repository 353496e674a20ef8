#pragma once

#include <atomic>
#include <mutex>

#include "gateway/frame_channel.hpp"
#include "gateway/socket_io.hpp"

namespace fleet_hub::gateway {

// Newline-delimited JSON-RPC 2.0 in both directions. Agent frames arrive as
// notifications named after the frame kind; `auth` is a request answered by
// AUTH_RESULT; commands go out as requests whose id is the command id and
// come back as responses, surfaced here as command_result frames.
class JsonRpcStreamChannel final : public FrameChannel {
 public:
  JsonRpcStreamChannel(SocketHandle socket, std::string peer, std::size_t max_line_bytes);

  [[nodiscard]] model::TransportKind transport() const override { return model::TransportKind::RPC_STREAM; }
  std::optional<ChannelFrame> read(std::chrono::milliseconds timeout) override;
  SendStatus send(const OutboundMessage& message) override;
  void close() override;
  [[nodiscard]] std::string peer() const override { return peer_; }

 private:
  SendStatus write_line(const nlohmann::json& message, const OutboundMessage& source);

  SocketHandle socket_;
  std::string peer_;
  SocketReader reader_;
  std::mutex send_mutex_;
  nlohmann::json auth_request_id_ = nullptr;
  std::atomic<bool> closed_{false};
};

// Maps one JSON-RPC message from an agent to a frame. Exposed for tests.
ChannelFrame rpc_message_to_frame(const nlohmann::json& message);

}  // namespace fleet_hub::gateway
