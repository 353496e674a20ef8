#include "control/dispatcher.hpp"

#include <algorithm>
#include <iostream>

#include "core/errors.hpp"
#include "core/ids.hpp"
#include "core/timestamp.hpp"

namespace fleet_hub::control {

CommandDispatcher::CommandDispatcher(CommandTransport& transport, const auth::PermissionResolver& resolver,
                                     auth::Authenticator& authenticator, AuditLog& audit,
                                     const registry::AgentRegistry& registry, const std::chrono::milliseconds timeout)
    : transport_(transport),
      resolver_(resolver),
      authenticator_(authenticator),
      audit_(audit),
      registry_(registry),
      timeout_(timeout) {}

CommandResult CommandDispatcher::dispatch(const auth::Principal& principal, const CommandRequest& request) {
  const auto* spec = auth::find_command_spec(request.type);
  if (spec == nullptr) {
    throw core::ValidationError("unknown command type: " + request.type);
  }
  if (!request.params.is_object()) {
    throw core::ValidationError("command params must be an object");
  }

  resolver_.require(principal.user_id, request.agent_id, spec->min_level);
  if (spec->requires_elevation &&
      !authenticator_.verify_elevated(principal, request.elevated_credential, core::unix_timestamp_now_ms())) {
    throw core::AuthenticationError("valid elevated credential required for " + request.type);
  }
  if (!transport_.is_streaming(request.agent_id)) {
    throw core::NotFoundError("agent not connected: " + request.agent_id);
  }

  const auto started = std::chrono::steady_clock::now();
  const auto deadline = started + timeout_;
  const auto elapsed_ms = [&started] {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
  };

  model::Command command{.id = core::random_hex_id(16),
                         .type = request.type,
                         .target = request.target,
                         .params = request.params};

  AuditEntry entry{};
  entry.timestamp_ms = core::unix_timestamp_now_ms();
  entry.user_id = principal.user_id;
  entry.username = principal.username;
  entry.agent_id = request.agent_id;
  if (const auto agent = registry_.agent(request.agent_id); agent.has_value()) {
    entry.agent_hostname = agent->hostname;
  }
  entry.command_type = request.type;
  entry.command_id = command.id;
  entry.target = request.target;
  entry.params = request.params;
  entry.ip_address = request.ip_address;

  auto pending = std::make_shared<Pending>();
  pending->agent_id = request.agent_id;
  auto outcome_future = pending->promise.get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      throw core::NotFoundError("agent not connected: hub shutting down");
    }
    pending_.emplace(command.id, pending);
  }

  std::int64_t audit_id = 0;
  try {
    audit_id = audit_.record_pending(entry);
  } catch (const core::StorageError&) {
    forget(command.id);
    throw;
  }

  // One deadline covers both the write and the wait for the reply.
  const auto delivery = transport_.send_command(request.agent_id, command, timeout_);
  if (delivery == Delivery::TIMED_OUT) {
    forget(command.id);
    settle(audit_id, AuditStatus::TIMEOUT, "agent stopped reading", elapsed_ms());
    std::cerr << "[control] command " << command.id << " to " << request.agent_id << " not delivered in time\n";
    throw core::TimeoutError("command " + command.id + " not delivered within " + std::to_string(timeout_.count()) +
                             "ms");
  }
  if (delivery != Delivery::SENT) {
    forget(command.id);
    settle(audit_id, AuditStatus::DISCONNECTED, "agent not connected", elapsed_ms());
    throw core::NotFoundError("agent not connected: " + request.agent_id);
  }

  const auto remaining =
      std::max(std::chrono::milliseconds(0),
               std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()));
  if (outcome_future.wait_for(remaining) != std::future_status::ready && forget(command.id)) {
    settle(audit_id, AuditStatus::TIMEOUT, "no reply within timeout", elapsed_ms());
    std::cerr << "[control] command " << command.id << " (" << request.type << ") to " << request.agent_id
              << " timed out\n";
    throw core::TimeoutError("command " + command.id + " timed out after " + std::to_string(timeout_.count()) +
                             "ms");
  }

  const Outcome outcome = outcome_future.get();
  const auto duration_ms = elapsed_ms();
  if (outcome.cancelled) {
    settle(audit_id, AuditStatus::DISCONNECTED, "hub shutting down", duration_ms);
    throw core::NotFoundError("agent disconnected: hub shutting down");
  }
  if (outcome.disconnected) {
    settle(audit_id, AuditStatus::DISCONNECTED, "agent disconnected", duration_ms);
    throw core::NotFoundError("agent disconnected: " + request.agent_id);
  }

  settle(audit_id, outcome.reply.success ? AuditStatus::SUCCESS : AuditStatus::FAILED, outcome.reply.error,
         duration_ms);
  return CommandResult{.command_id = command.id,
                       .success = outcome.reply.success,
                       .output = outcome.reply.output,
                       .error = outcome.reply.error,
                       .duration_ms = duration_ms,
                       .audit_id = audit_id};
}

void CommandDispatcher::on_reply(const std::string& agent_id, const model::CommandReply& reply) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = pending_.find(reply.command_id);
  if (it == pending_.end() || it->second->agent_id != agent_id) {
    std::cerr << "[control] dropped late or unknown reply " << reply.command_id << " from " << agent_id << '\n';
    return;
  }
  it->second->promise.set_value(Outcome{.disconnected = false, .reply = reply});
  pending_.erase(it);
}

void CommandDispatcher::on_agent_gone(const std::string& agent_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (it->second->agent_id == agent_id) {
      it->second->promise.set_value(Outcome{.disconnected = true, .reply = {}});
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }
}

void CommandDispatcher::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  stopping_ = true;
  for (auto& [command_id, pending] : pending_) {
    pending->promise.set_value(Outcome{.disconnected = false, .cancelled = true, .reply = {}});
  }
  if (!pending_.empty()) {
    std::cerr << "[control] cancelled " << pending_.size() << " pending command(s) at shutdown\n";
  }
  pending_.clear();
}

std::size_t CommandDispatcher::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

bool CommandDispatcher::forget(const std::string& command_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.erase(command_id) > 0;
}

void CommandDispatcher::settle(const std::int64_t audit_id, const AuditStatus status, const std::string& error,
                               const std::int64_t duration_ms) {
  try {
    audit_.complete(audit_id, status, error, duration_ms);
  } catch (const core::HubError& ex) {
    std::cerr << "[control] audit entry " << audit_id << " not settled: " << ex.what() << '\n';
  }
}

}  // namespace fleet_hub::control
