#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "auth/authenticator.hpp"
#include "control/command_transport.hpp"
#include "core/config.hpp"
#include "gateway/agent_session.hpp"
#include "gateway/event_bus.hpp"
#include "gateway/socket_io.hpp"
#include "registry/agent_registry.hpp"
#include "storage/storage_engine.hpp"

namespace fleet_hub::gateway {

struct GatewayOptions {
  std::string bind_address{"0.0.0.0"};
  std::uint16_t framed_port{9100};
  std::uint16_t rpc_port{9200};
  std::chrono::milliseconds heartbeat_timeout{90000};
  std::chrono::milliseconds sweep_interval{1000};
  std::chrono::milliseconds auth_timeout{5000};
  std::chrono::milliseconds read_timeout{1000};
  std::chrono::milliseconds write_timeout{kDefaultSendTimeout};
  std::size_t max_frame_bytes{512 * 1024};
};

GatewayOptions make_gateway_options(const core::ServerConfig& server, const core::GatewayConfig& gateway);

// Accepts agents on both transports, feeds normalized frames into the
// registry, storage and event bus, and delivers commands back to agents.
class Gateway final : public control::CommandTransport, public SessionHost {
 public:
  Gateway(GatewayOptions options, registry::AgentRegistry& registry, storage::StorageEngine& storage,
          EventBus& events, const auth::Authenticator& authenticator);
  ~Gateway() override;

  Gateway(const Gateway&) = delete;
  Gateway& operator=(const Gateway&) = delete;

  void set_reply_listener(control::ReplyListener* listener);

  // Binds both listeners and starts the heartbeat sweep.
  void start();
  void stop();

  // Runs a session on its own thread.
  void attach(std::unique_ptr<FrameChannel> channel);
  // Runs a session on the calling thread until it closes.
  void serve(std::unique_ptr<FrameChannel> channel);

  // Retires every agent whose heartbeat is older than the timeout; returns their ids.
  std::vector<std::string> sweep(std::int64_t now_ms);

  [[nodiscard]] bool is_streaming(const std::string& agent_id) const override;
  control::Delivery send_command(const std::string& agent_id, const model::Command& command,
                                 std::chrono::milliseconds timeout) override;

  [[nodiscard]] std::size_t session_count() const;
  [[nodiscard]] std::uint16_t framed_port() const noexcept { return framed_port_; }
  [[nodiscard]] std::uint16_t rpc_port() const noexcept { return rpc_port_; }

  [[nodiscard]] bool authenticate_agent(const AuthFrame& auth) const override;
  void admit(const std::shared_ptr<AgentSession>& session, const AuthFrame& auth) override;
  void on_frame(AgentSession& session, const InboundFrame& frame) override;
  void retire(const AgentSession& session) override;

 private:
  struct Worker {
    std::shared_ptr<AgentSession> session;
    std::shared_ptr<std::atomic<bool>> done;
    std::thread thread;
  };

  // The only place an agent leaves the registry. `expected` restricts the
  // removal to that session; nullptr retires whatever is registered.
  void retire_agent(const std::string& agent_id, const AgentSession* expected);
  void publish(EventKind kind, const std::string& agent_id, std::optional<model::AgentInfo> agent,
               std::optional<model::MetricSnapshot> snapshot);
  void accept_loop(TcpListener& listener, model::TransportKind transport);
  void sweep_loop();
  void reap_workers(bool join_all);

  GatewayOptions options_;
  registry::AgentRegistry& registry_;
  storage::StorageEngine& storage_;
  EventBus& events_;
  const auth::Authenticator& authenticator_;
  std::atomic<control::ReplyListener*> listener_{nullptr};

  mutable std::mutex sessions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<AgentSession>> sessions_{};

  std::mutex workers_mutex_;
  std::vector<Worker> workers_{};

  std::unique_ptr<TcpListener> framed_listener_{};
  std::unique_ptr<TcpListener> rpc_listener_{};
  std::uint16_t framed_port_{0};
  std::uint16_t rpc_port_{0};
  std::atomic<bool> running_{false};
  std::mutex sweep_mutex_;
  std::condition_variable sweep_wakeup_;
  std::vector<std::thread> service_threads_{};
};

}  // namespace fleet_hub::gateway
