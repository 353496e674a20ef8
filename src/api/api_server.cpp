#include "api/api_server.hpp"

#include <iostream>

#include "api/jsonrpc.hpp"
#include "gateway/frame_channel.hpp"

namespace fleet_hub::api {

namespace {

constexpr std::chrono::milliseconds kAcceptPoll{200};
constexpr std::chrono::milliseconds kPushPoll{200};

}  // namespace

ApiServer::ApiServer(ApiServerOptions options, ApiService& service, gateway::EventBus& events)
    : options_(std::move(options)), service_(service), events_(events) {}

ApiServer::~ApiServer() { stop(); }

void ApiServer::start() {
  if (running_.exchange(true)) {
    return;
  }
  listener_ = std::make_unique<gateway::TcpListener>(options_.bind_address, options_.port);
  port_ = listener_->port();
  accept_thread_ = std::thread([this] { accept_loop(); });
  std::cerr << "[api] listening on " << options_.bind_address << ":" << port_ << '\n';
}

void ApiServer::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  listener_->shutdown();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  reap_clients(true);
}

std::string ApiServer::handle_line(const std::string& line, const std::string& peer,
                                   std::optional<auth::Principal>* subscriber) {
  const auto request = nlohmann::json::parse(line, nullptr, false);
  if (request.is_discarded()) {
    return make_error_response(nullptr, JsonRpcError{.code = kParseError, .message = "parse error"}).dump();
  }

  bool should_respond = true;
  const auto response = handle_request(request, peer, should_respond, subscriber);
  return should_respond ? response.dump() : std::string{};
}

nlohmann::json ApiServer::handle_request(const nlohmann::json& request, const std::string& peer,
                                         bool& should_respond, std::optional<auth::Principal>* subscriber) {
  nlohmann::json id = nullptr;
  try {
    const auto parsed = parse_request(request);
    should_respond = parsed.id.has_value();
    if (parsed.id.has_value()) {
      id = *parsed.id;
    }

    if (parsed.method == "subscribe") {
      const auto principal = service_.authenticate(parsed.params);
      if (subscriber != nullptr) {
        *subscriber = principal;
      }
      should_respond = true;
      return make_result_response(id, nlohmann::json{{"subscribed", true}});
    }

    return make_result_response(id, service_.call(parsed.method, parsed.params, peer));
  } catch (const std::exception& ex) {
    const auto error = error_from_exception(ex);
    if (error.code == kInternalError) {
      std::cerr << "[api] request from " << peer << " failed: " << ex.what() << '\n';
    }
    if (!should_respond) {
      return {};
    }
    return make_error_response(id, error);
  }
}

void ApiServer::accept_loop() {
  while (running_.load()) {
    auto accepted = listener_->accept(kAcceptPoll);
    reap_clients(false);
    if (!accepted.has_value()) {
      continue;
    }

    auto client = std::make_shared<Client>();
    client->socket = std::move(accepted->socket);
    client->peer = std::move(accepted->peer);

    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_.emplace_back(client, std::thread([this, client] {
                            serve_client(client);
                            client->done.store(true);
                          }));
  }
}

void ApiServer::serve_client(const std::shared_ptr<Client>& client) {
  gateway::SocketReader reader(client->socket.get(), options_.max_line_bytes);
  try {
    while (running_.load()) {
      const auto line = reader.read_line(options_.read_timeout);
      if (!line.has_value() || line->empty()) {
        continue;
      }

      std::optional<auth::Principal> subscriber;
      const auto response = handle_line(*line, client->peer, &subscriber);
      if (!response.empty() && !write_line(*client, response)) {
        return;
      }
      if (subscriber.has_value()) {
        push_events(client, reader, *subscriber);
        return;
      }
    }
  } catch (const gateway::ChannelClosedError&) {
    // Client went away.
  }
}

void ApiServer::push_events(const std::shared_ptr<Client>& client, gateway::SocketReader& reader,
                            const auth::Principal& principal) {
  // Subscribe before taking the state snapshot so no update falls in between.
  const auto subscription = events_.subscribe();
  std::cerr << "[api] subscriber " << principal.username << " connected from " << client->peer << '\n';

  try {
    if (write_line(*client, service_.state_notification(principal).dump())) {
      while (running_.load() && !subscription->closed()) {
        const auto event = subscription->next(kPushPoll);
        if (event.has_value()) {
          const auto notification = service_.event_notification(principal, *event);
          if (notification.has_value() && !write_line(*client, notification->dump())) {
            break;
          }
          continue;
        }
        // Drains (and ignores) client input; throws once the client hangs up.
        while (reader.read_line(std::chrono::milliseconds(0)).has_value()) {
        }
      }
    }
  } catch (const gateway::ChannelClosedError&) {
    // Client went away.
  }

  if (subscription->dropped() > 0) {
    std::cerr << "[api] subscriber " << principal.username << " dropped " << subscription->dropped()
              << " event(s)\n";
  }
  events_.unsubscribe(subscription);
}

bool ApiServer::write_line(const Client& client, const std::string& line) {
  const auto framed = line + "\n";
  return gateway::send_all(client.socket.get(), framed.data(), framed.size(), options_.write_timeout) ==
         gateway::SendStatus::SENT;
}

void ApiServer::reap_clients(const bool join_all) {
  std::vector<std::pair<std::shared_ptr<Client>, std::thread>> finished;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (auto it = clients_.begin(); it != clients_.end();) {
      if (join_all || it->first->done.load()) {
        finished.push_back(std::move(*it));
        it = clients_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& [client, thread] : finished) {
    if (join_all) {
      client->socket.shutdown();
    }
  }
  for (auto& [client, thread] : finished) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

}  // namespace fleet_hub::api
