#include "gateway/framed_channel.hpp"

#include <iostream>

#include "core/errors.hpp"
#include "core/timestamp.hpp"

namespace fleet_hub::gateway {

const char* outbound_kind_name(const OutboundKind kind) noexcept {
  switch (kind) {
    case OutboundKind::AUTH_RESULT:
      return "auth_result";
    case OutboundKind::HEARTBEAT_ACK:
      return "heartbeat_ack";
    case OutboundKind::COMMAND:
      return "command";
  }
  return "unknown";
}

ChannelFrame parse_envelope(const std::string& body) {
  const auto envelope = nlohmann::json::parse(body, nullptr, false);
  if (envelope.is_discarded() || !envelope.is_object()) {
    throw core::ValidationError("frame is not a JSON object");
  }

  const auto type_it = envelope.find("type");
  if (type_it == envelope.end() || !type_it->is_string()) {
    throw core::ValidationError("frame type must be a string");
  }

  ChannelFrame frame{.kind = type_it->get<std::string>(), .payload = nlohmann::json::object()};
  const auto payload_it = envelope.find("payload");
  if (payload_it != envelope.end() && !payload_it->is_null()) {
    frame.payload = *payload_it;
  }

  // The envelope timestamp applies when the payload carries none of its own.
  const auto timestamp_it = envelope.find("timestamp");
  if (frame.payload.is_object() && timestamp_it != envelope.end() && timestamp_it->is_number() &&
      !frame.payload.contains("timestamp")) {
    frame.payload["timestamp"] = *timestamp_it;
  }
  return frame;
}

FramedSocketChannel::FramedSocketChannel(SocketHandle socket, std::string peer, const std::size_t max_frame_bytes)
    : socket_(std::move(socket)), peer_(std::move(peer)), reader_(socket_.get(), max_frame_bytes) {}

std::optional<ChannelFrame> FramedSocketChannel::read(const std::chrono::milliseconds timeout) {
  if (closed_.load()) {
    throw ChannelClosedError("channel closed");
  }
  const auto body = reader_.read_length_prefixed(timeout);
  if (!body.has_value()) {
    return std::nullopt;
  }
  return parse_envelope(*body);
}

SendStatus FramedSocketChannel::send(const OutboundMessage& message) {
  if (closed_.load()) {
    return SendStatus::CLOSED;
  }
  const nlohmann::json envelope{{"type", outbound_kind_name(message.kind)},
                                {"timestamp", core::unix_timestamp_now_ms()},
                                {"payload", message.payload}};
  const auto encoded = encode_length_prefixed(envelope.dump());

  std::lock_guard<std::mutex> lock(send_mutex_);
  const auto status = send_all(socket_.get(), encoded.data(), encoded.size(), message.send_timeout);
  if (status == SendStatus::TIMED_OUT) {
    std::cerr << "[gateway] " << outbound_kind_name(message.kind) << " to " << peer_ << " timed out after "
              << message.send_timeout.count() << "ms; closing\n";
    close();
  }
  return status;
}

void FramedSocketChannel::close() {
  if (!closed_.exchange(true)) {
    socket_.shutdown();
  }
}

}  // namespace fleet_hub::gateway
