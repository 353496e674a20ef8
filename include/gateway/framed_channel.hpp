#pragma once

#include <atomic>
#include <mutex>

#include "gateway/frame_channel.hpp"
#include "gateway/socket_io.hpp"

namespace fleet_hub::gateway {

// Length-prefixed JSON envelopes: {"type", "timestamp", "payload"}.
class FramedSocketChannel final : public FrameChannel {
 public:
  FramedSocketChannel(SocketHandle socket, std::string peer, std::size_t max_frame_bytes);

  [[nodiscard]] model::TransportKind transport() const override { return model::TransportKind::FRAMED_SOCKET; }
  std::optional<ChannelFrame> read(std::chrono::milliseconds timeout) override;
  SendStatus send(const OutboundMessage& message) override;
  void close() override;
  [[nodiscard]] std::string peer() const override { return peer_; }

 private:
  SocketHandle socket_;
  std::string peer_;
  SocketReader reader_;
  std::mutex send_mutex_;
  std::atomic<bool> closed_{false};
};

// Parses one framed envelope body. Exposed for tests.
ChannelFrame parse_envelope(const std::string& body);

}  // namespace fleet_hub::gateway
