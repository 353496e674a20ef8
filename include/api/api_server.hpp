#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "api/api_service.hpp"
#include "gateway/event_bus.hpp"
#include "gateway/socket_io.hpp"

namespace fleet_hub::api {

struct ApiServerOptions {
  std::string bind_address{"0.0.0.0"};
  std::uint16_t port{8080};
  std::chrono::milliseconds read_timeout{1000};
  std::chrono::milliseconds write_timeout{5000};
  std::size_t max_line_bytes{512 * 1024};
};

// Newline-delimited JSON-RPC 2.0 over TCP, one thread per client. A
// successful `subscribe` turns the connection into a push stream.
class ApiServer {
 public:
  ApiServer(ApiServerOptions options, ApiService& service, gateway::EventBus& events);
  ~ApiServer();

  ApiServer(const ApiServer&) = delete;
  ApiServer& operator=(const ApiServer&) = delete;

  void start();
  void stop();
  [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

  // One request in, one response out (empty for notifications). `subscriber`
  // receives the caller's principal when the request was a valid subscribe.
  std::string handle_line(const std::string& line, const std::string& peer,
                          std::optional<auth::Principal>* subscriber = nullptr);

 private:
  struct Client {
    gateway::SocketHandle socket{};
    std::string peer{};
    std::atomic<bool> done{false};
  };

  nlohmann::json handle_request(const nlohmann::json& request, const std::string& peer, bool& should_respond,
                                std::optional<auth::Principal>* subscriber);
  void accept_loop();
  void serve_client(const std::shared_ptr<Client>& client);
  void push_events(const std::shared_ptr<Client>& client, gateway::SocketReader& reader,
                   const auth::Principal& principal);
  bool write_line(const Client& client, const std::string& line);
  void reap_clients(bool join_all);

  ApiServerOptions options_;
  ApiService& service_;
  gateway::EventBus& events_;
  std::unique_ptr<gateway::TcpListener> listener_{};
  std::uint16_t port_{0};
  std::atomic<bool> running_{false};
  std::thread accept_thread_{};

  std::mutex clients_mutex_;
  std::vector<std::pair<std::shared_ptr<Client>, std::thread>> clients_{};
};

}  // namespace fleet_hub::api
