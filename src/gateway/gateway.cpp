#include "gateway/gateway.hpp"

#include <iostream>
#include <type_traits>
#include <variant>

#include "core/errors.hpp"
#include "core/timestamp.hpp"
#include "gateway/framed_channel.hpp"
#include "gateway/rpc_stream_channel.hpp"

namespace fleet_hub::gateway {

namespace {

constexpr std::chrono::milliseconds kAcceptPoll{200};

}  // namespace

GatewayOptions make_gateway_options(const core::ServerConfig& server, const core::GatewayConfig& gateway) {
  return GatewayOptions{.bind_address = server.bind_address,
                        .framed_port = server.agent_framed_port,
                        .rpc_port = server.agent_rpc_port,
                        .heartbeat_timeout = gateway.heartbeat_timeout,
                        .sweep_interval = gateway.sweep_interval,
                        .auth_timeout = gateway.auth_timeout,
                        .read_timeout = gateway.read_timeout,
                        .write_timeout = gateway.write_timeout,
                        .max_frame_bytes = gateway.max_frame_bytes};
}

Gateway::Gateway(GatewayOptions options, registry::AgentRegistry& registry, storage::StorageEngine& storage,
                 EventBus& events, const auth::Authenticator& authenticator)
    : options_(std::move(options)),
      registry_(registry),
      storage_(storage),
      events_(events),
      authenticator_(authenticator) {}

Gateway::~Gateway() { stop(); }

void Gateway::set_reply_listener(control::ReplyListener* listener) { listener_.store(listener); }

void Gateway::start() {
  if (running_.exchange(true)) {
    return;
  }
  framed_listener_ = std::make_unique<TcpListener>(options_.bind_address, options_.framed_port);
  rpc_listener_ = std::make_unique<TcpListener>(options_.bind_address, options_.rpc_port);
  framed_port_ = framed_listener_->port();
  rpc_port_ = rpc_listener_->port();

  service_threads_.emplace_back(
      [this] { accept_loop(*framed_listener_, model::TransportKind::FRAMED_SOCKET); });
  service_threads_.emplace_back([this] { accept_loop(*rpc_listener_, model::TransportKind::RPC_STREAM); });
  service_threads_.emplace_back([this] { sweep_loop(); });

  std::cerr << "[gateway] listening framed=" << options_.bind_address << ":" << framed_port_
            << " rpc=" << options_.bind_address << ":" << rpc_port_ << '\n';
}

void Gateway::stop() {
  const bool was_running = running_.exchange(false);
  if (was_running) {
    framed_listener_->shutdown();
    rpc_listener_->shutdown();
    sweep_wakeup_.notify_all();
  }
  for (auto& thread : service_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  service_threads_.clear();
  reap_workers(true);
}

void Gateway::attach(std::unique_ptr<FrameChannel> channel) {
  auto session = std::make_shared<AgentSession>(
      std::move(channel), *this,
      SessionOptions{.auth_timeout = options_.auth_timeout,
                     .read_timeout = options_.read_timeout,
                     .write_timeout = options_.write_timeout});
  auto done = std::make_shared<std::atomic<bool>>(false);

  std::lock_guard<std::mutex> lock(workers_mutex_);
  workers_.push_back(Worker{.session = session, .done = done, .thread = std::thread([session, done] {
                              session->run();
                              done->store(true);
                            })});
}

void Gateway::serve(std::unique_ptr<FrameChannel> channel) {
  auto session = std::make_shared<AgentSession>(
      std::move(channel), *this,
      SessionOptions{.auth_timeout = options_.auth_timeout,
                     .read_timeout = options_.read_timeout,
                     .write_timeout = options_.write_timeout});
  session->run();
}

void Gateway::reap_workers(const bool join_all) {
  std::vector<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (join_all || it->done->load()) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& worker : finished) {
    if (join_all) {
      worker.session->drain();
    }
  }
  for (auto& worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

bool Gateway::authenticate_agent(const AuthFrame& auth) const { return authenticator_.authenticate_agent(auth.token); }

void Gateway::admit(const std::shared_ptr<AgentSession>& session, const AuthFrame& auth) {
  const auto now_ms = core::unix_timestamp_now_ms();
  model::AgentInfo info{.id = auth.agent_id,
                        .hostname = auth.hostname.empty() ? auth.agent_id : auth.hostname,
                        .os = auth.os,
                        .arch = auth.arch,
                        .version = auth.version,
                        .transport = session->transport(),
                        .connected_at_ms = now_ms,
                        .last_heartbeat_ms = now_ms};
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (sessions_.count(auth.agent_id) != 0 || !registry_.register_agent(info)) {
      throw core::ConflictError("agent already connected: " + auth.agent_id);
    }
    sessions_.emplace(auth.agent_id, session);
  }
  publish(EventKind::AGENT_ONLINE, info.id, info, std::nullopt);
}

void Gateway::on_frame(AgentSession& session, const InboundFrame& frame) {
  const auto& agent_id = session.agent_id();
  registry_.touch_heartbeat(agent_id, core::unix_timestamp_now_ms());

  std::visit(
      [&](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, AuthFrame>) {
          throw core::ValidationError("agent already authenticated");
        } else if constexpr (std::is_same_v<T, model::StaticInfo>) {
          registry_.merge_static(agent_id, value);
        } else if constexpr (std::is_same_v<T, model::PeriodicData>) {
          registry_.merge_periodic(agent_id, value);
        } else if constexpr (std::is_same_v<T, model::MetricSnapshot>) {
          model::MetricSnapshot snapshot = value;
          snapshot.agent_id = agent_id;
          if (!registry_.update_snapshot(snapshot)) {
            return;
          }
          storage_.write(snapshot);
          publish(EventKind::METRICS_UPDATED, agent_id, std::nullopt, registry_.latest(agent_id));
        } else if constexpr (std::is_same_v<T, model::RealtimeSample>) {
          auto updated = registry_.merge_realtime(agent_id, value);
          if (updated.has_value()) {
            publish(EventKind::METRICS_UPDATED, agent_id, std::nullopt, std::move(updated));
          }
        } else if constexpr (std::is_same_v<T, HeartbeatFrame>) {
          const auto acknowledged =
              session.send(OutboundMessage{.kind = OutboundKind::HEARTBEAT_ACK,
                                           .payload = {{"timestamp", core::unix_timestamp_now_ms()}},
                                           .correlation = {},
                                           .send_timeout = options_.write_timeout});
          if (acknowledged != SendStatus::SENT) {
            throw ChannelClosedError("heartbeat ack not delivered");
          }
        } else if constexpr (std::is_same_v<T, model::CommandReply>) {
          auto* listener = listener_.load();
          if (listener != nullptr) {
            listener->on_reply(agent_id, value);
          }
        }
      },
      frame);
}

void Gateway::retire(const AgentSession& session) { retire_agent(session.agent_id(), &session); }

void Gateway::retire_agent(const std::string& agent_id, const AgentSession* expected) {
  bool removed = false;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    const auto it = sessions_.find(agent_id);
    if (expected != nullptr && (it == sessions_.end() || it->second.get() != expected)) {
      return;
    }
    if (it != sessions_.end()) {
      sessions_.erase(it);
    }
    removed = registry_.unregister_agent(agent_id);
  }
  if (!removed) {
    return;
  }

  std::cerr << "[gateway] agent " << agent_id << " offline\n";
  publish(EventKind::AGENT_OFFLINE, agent_id, std::nullopt, std::nullopt);
  auto* listener = listener_.load();
  if (listener != nullptr) {
    listener->on_agent_gone(agent_id);
  }
}

std::vector<std::string> Gateway::sweep(const std::int64_t now_ms) {
  const auto stale = registry_.find_stale(now_ms, options_.heartbeat_timeout.count());
  for (const auto& agent_id : stale) {
    std::shared_ptr<AgentSession> session;
    {
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      const auto it = sessions_.find(agent_id);
      if (it != sessions_.end()) {
        session = it->second;
      }
    }
    std::cerr << "[gateway] agent " << agent_id << " missed heartbeat\n";
    if (session) {
      session->mark_lost();
    }
    retire_agent(agent_id, session.get());
  }
  reap_workers(false);
  return stale;
}

bool Gateway::is_streaming(const std::string& agent_id) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  const auto it = sessions_.find(agent_id);
  return it != sessions_.end() && it->second->state() == SessionState::STREAMING;
}

control::Delivery Gateway::send_command(const std::string& agent_id, const model::Command& command,
                                        const std::chrono::milliseconds timeout) {
  std::shared_ptr<AgentSession> session;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    const auto it = sessions_.find(agent_id);
    if (it == sessions_.end()) {
      return control::Delivery::NOT_CONNECTED;
    }
    session = it->second;
  }
  switch (session->send_command(command, timeout)) {
    case SendStatus::SENT:
      return control::Delivery::SENT;
    case SendStatus::TIMED_OUT:
      return control::Delivery::TIMED_OUT;
    case SendStatus::CLOSED:
      break;
  }
  return control::Delivery::NOT_CONNECTED;
}

std::size_t Gateway::session_count() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

void Gateway::publish(const EventKind kind, const std::string& agent_id, std::optional<model::AgentInfo> agent,
                      std::optional<model::MetricSnapshot> snapshot) {
  events_.publish(HubEvent{.kind = kind,
                           .agent_id = agent_id,
                           .timestamp_ms = core::unix_timestamp_now_ms(),
                           .agent = std::move(agent),
                           .snapshot = std::move(snapshot)});
}

void Gateway::accept_loop(TcpListener& listener, const model::TransportKind transport) {
  while (running_.load()) {
    auto accepted = listener.accept(kAcceptPoll);
    if (!accepted.has_value()) {
      continue;
    }
    if (transport == model::TransportKind::FRAMED_SOCKET) {
      attach(std::make_unique<FramedSocketChannel>(std::move(accepted->socket), std::move(accepted->peer),
                                                   options_.max_frame_bytes));
    } else {
      attach(std::make_unique<JsonRpcStreamChannel>(std::move(accepted->socket), std::move(accepted->peer),
                                                    options_.max_frame_bytes));
    }
  }
}

void Gateway::sweep_loop() {
  std::unique_lock<std::mutex> lock(sweep_mutex_);
  while (running_.load()) {
    sweep_wakeup_.wait_for(lock, options_.sweep_interval, [this] { return !running_.load(); });
    if (!running_.load()) {
      break;
    }
    lock.unlock();
    sweep(core::unix_timestamp_now_ms());
    lock.lock();
  }
}

}  // namespace fleet_hub::gateway
