#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "auth/authenticator.hpp"
#include "auth/resolver.hpp"
#include "control/audit_log.hpp"
#include "control/command_transport.hpp"
#include "registry/agent_registry.hpp"

namespace fleet_hub::control {

struct CommandRequest {
  std::string agent_id{};
  std::string type{};
  std::string target{};
  nlohmann::json params = nlohmann::json::object();
  std::string elevated_credential{};
  std::string ip_address{};
};

struct CommandResult {
  std::string command_id{};
  bool success{false};
  std::string output{};
  std::string error{};
  std::int64_t duration_ms{0};
  std::int64_t audit_id{0};
};

// Routes authorized commands to a streaming agent and blocks the caller until
// the correlated reply, the agent leaving, or the timeout. An agent refusing
// the command is a result with success=false; no answer is a TimeoutError.
class CommandDispatcher final : public ReplyListener {
 public:
  CommandDispatcher(CommandTransport& transport, const auth::PermissionResolver& resolver,
                    auth::Authenticator& authenticator, AuditLog& audit, const registry::AgentRegistry& registry,
                    std::chrono::milliseconds timeout);

  CommandResult dispatch(const auth::Principal& principal, const CommandRequest& request);

  void on_reply(const std::string& agent_id, const model::CommandReply& reply) override;
  void on_agent_gone(const std::string& agent_id) override;

  // Completes every pending command as cancelled and refuses new ones.
  void shutdown();

  [[nodiscard]] std::size_t pending_count() const;

 private:
  struct Outcome {
    bool disconnected{false};
    bool cancelled{false};
    model::CommandReply reply{};
  };

  struct Pending {
    std::string agent_id{};
    std::promise<Outcome> promise{};
  };

  void settle(std::int64_t audit_id, AuditStatus status, const std::string& error, std::int64_t duration_ms);
  bool forget(const std::string& command_id);

  CommandTransport& transport_;
  const auth::PermissionResolver& resolver_;
  auth::Authenticator& authenticator_;
  AuditLog& audit_;
  const registry::AgentRegistry& registry_;
  std::chrono::milliseconds timeout_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Pending>> pending_{};
  bool stopping_{false};
};

}  // namespace fleet_hub::control
