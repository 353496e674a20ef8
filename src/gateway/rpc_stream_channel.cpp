#include "gateway/rpc_stream_channel.hpp"

#include <iostream>

#include "api/jsonrpc.hpp"
#include "core/errors.hpp"

namespace fleet_hub::gateway {

namespace {

std::string id_to_string(const nlohmann::json& id) {
  if (id.is_string()) {
    return id.get<std::string>();
  }
  if (id.is_number_integer() || id.is_number_unsigned()) {
    return id.dump();
  }
  throw core::ValidationError("response id must be a string or integer");
}

}  // namespace

ChannelFrame rpc_message_to_frame(const nlohmann::json& message) {
  if (!message.is_object()) {
    throw core::ValidationError("message must be a JSON object");
  }

  if (message.contains("method")) {
    const auto request = api::parse_request(message);
    if (!request.params.is_object()) {
      throw core::ValidationError("params must be an object");
    }
    return ChannelFrame{.kind = request.method, .payload = request.params};
  }

  // A response to a command we sent.
  const auto id_it = message.find("id");
  if (id_it == message.end()) {
    throw core::ValidationError("message is neither a request nor a response");
  }
  nlohmann::json payload = nlohmann::json::object();
  const auto result_it = message.find("result");
  const auto error_it = message.find("error");
  if (result_it != message.end()) {
    if (result_it->is_object()) {
      payload = *result_it;
    } else if (result_it->is_string()) {
      payload["output"] = *result_it;
    }
    if (!payload.contains("success")) {
      payload["success"] = true;
    }
  } else if (error_it != message.end()) {
    payload["success"] = false;
    if (!error_it->is_object()) {
      payload["error"] = error_it->dump();
    } else {
      const auto message_it = error_it->find("message");
      if (message_it == error_it->end()) {
        payload["error"] = "command failed";
      } else if (message_it->is_string()) {
        payload["error"] = *message_it;
      } else {
        throw core::ValidationError("error.message must be a string");
      }
    }
  } else {
    throw core::ValidationError("response needs a result or an error");
  }
  payload["commandId"] = id_to_string(*id_it);
  return ChannelFrame{.kind = "command_result", .payload = std::move(payload)};
}

JsonRpcStreamChannel::JsonRpcStreamChannel(SocketHandle socket, std::string peer, const std::size_t max_line_bytes)
    : socket_(std::move(socket)), peer_(std::move(peer)), reader_(socket_.get(), max_line_bytes) {}

std::optional<ChannelFrame> JsonRpcStreamChannel::read(const std::chrono::milliseconds timeout) {
  if (closed_.load()) {
    throw ChannelClosedError("channel closed");
  }
  const auto line = reader_.read_line(timeout);
  if (!line.has_value() || line->empty()) {
    return std::nullopt;
  }

  const auto message = nlohmann::json::parse(*line, nullptr, false);
  if (message.is_discarded()) {
    throw core::ValidationError("malformed JSON-RPC message");
  }
  ChannelFrame frame = rpc_message_to_frame(message);
  if (frame.kind == "auth") {
    std::lock_guard<std::mutex> lock(send_mutex_);
    auth_request_id_ = message.value("id", nlohmann::json(nullptr));
  }
  return frame;
}

SendStatus JsonRpcStreamChannel::send(const OutboundMessage& message) {
  if (closed_.load()) {
    return SendStatus::CLOSED;
  }

  switch (message.kind) {
    case OutboundKind::AUTH_RESULT: {
      nlohmann::json id;
      {
        std::lock_guard<std::mutex> lock(send_mutex_);
        id = auth_request_id_;
      }
      if (message.payload.value("success", false)) {
        return write_line(api::make_result_response(id, message.payload), message);
      }
      return write_line(api::make_error_response(
                            id, api::JsonRpcError{.code = api::kAuthenticationFailed,
                                                  .message = message.payload.value(
                                                      "error", std::string{"authentication failed"})}),
                        message);
    }
    case OutboundKind::HEARTBEAT_ACK:
      return write_line(api::make_notification("heartbeat_ack", message.payload), message);
    case OutboundKind::COMMAND:
      return write_line(nlohmann::json{{"jsonrpc", api::kJsonRpcVersion},
                                       {"id", message.correlation},
                                       {"method", "command"},
                                       {"params", message.payload}},
                        message);
  }
  return SendStatus::CLOSED;
}

SendStatus JsonRpcStreamChannel::write_line(const nlohmann::json& message, const OutboundMessage& source) {
  const auto line = message.dump() + "\n";
  std::lock_guard<std::mutex> lock(send_mutex_);
  const auto status = send_all(socket_.get(), line.data(), line.size(), source.send_timeout);
  if (status == SendStatus::TIMED_OUT) {
    std::cerr << "[gateway] " << outbound_kind_name(source.kind) << " to " << peer_ << " timed out after "
              << source.send_timeout.count() << "ms; closing\n";
    close();
  }
  return status;
}

void JsonRpcStreamChannel::close() {
  if (!closed_.exchange(true)) {
    socket_.shutdown();
  }
}

}  // namespace fleet_hub::gateway
