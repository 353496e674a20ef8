#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "auth/auth_store.hpp"
#include "auth/authenticator.hpp"
#include "auth/resolver.hpp"
#include "control/audit_log.hpp"
#include "control/command_transport.hpp"
#include "control/dispatcher.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/sqlite.hpp"
#include "core/timestamp.hpp"
#include "model/agent.hpp"
#include "model/command.hpp"
#include "registry/agent_registry.hpp"

using fleet_hub::auth::PermissionResolver;
using fleet_hub::auth::PermissionSource;
using fleet_hub::auth::Principal;
using fleet_hub::control::AuditEntry;
using fleet_hub::control::AuditFilter;
using fleet_hub::control::AuditLog;
using fleet_hub::control::AuditStats;
using fleet_hub::control::AuditStatus;
using fleet_hub::control::CommandDispatcher;
using fleet_hub::control::CommandRequest;
using fleet_hub::control::CommandResult;
using fleet_hub::control::CommandTransport;
using fleet_hub::control::Delivery;
using fleet_hub::model::Command;
using fleet_hub::model::CommandReply;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

class FakePermissionSource final : public PermissionSource {
 public:
  bool is_superadmin(const std::int64_t) const override { return false; }

  std::vector<long long> group_binding_levels(const std::int64_t user_id, const std::string& agent_id) const override {
    const auto it = levels.find({user_id, agent_id});
    return it == levels.end() ? std::vector<long long>{} : std::vector<long long>{it->second};
  }

  std::optional<long long> user_override(const std::int64_t, const std::string&) const override { return std::nullopt; }

  std::map<std::pair<std::int64_t, std::string>, long long> levels{};
};

// Records commands; `on_send` lets a test answer from inside send_command.
class FakeTransport final : public CommandTransport {
 public:
  bool is_streaming(const std::string& agent_id) const override { return streaming.count(agent_id) != 0; }

  Delivery send_command(const std::string& agent_id, const Command& command,
                        const std::chrono::milliseconds timeout) override {
    sent.emplace_back(agent_id, command);
    last_timeout = timeout;
    if (delivery != Delivery::SENT) {
      return delivery;
    }
    if (on_send) {
      on_send(agent_id, command);
    }
    return Delivery::SENT;
  }

  std::set<std::string> streaming{};
  Delivery delivery{Delivery::SENT};
  std::chrono::milliseconds last_timeout{0};
  std::function<void(const std::string&, const Command&)> on_send{};
  std::vector<std::pair<std::string, Command>> sent{};
};

struct ControlFixture {
  explicit ControlFixture(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
      : db(":memory:"),
        auth_store(db),
        authenticator(make_auth_config(), auth_store),
        resolver(permissions),
        audit(db),
        dispatcher(transport, resolver, authenticator, audit, registry, timeout) {
    auth_store.ensure_schema();
    audit.ensure_schema();
    registry.register_agent(fleet_hub::model::AgentInfo{.id = "web-01", .hostname = "web-01.prod"});
    transport.streaming.insert("web-01");
  }

  static fleet_hub::core::AuthConfig make_auth_config() {
    fleet_hub::core::AuthConfig config{};
    config.elevation_secret = "elevation-secret-0123";
    return config;
  }

  void answer_with(CommandReply reply) {
    transport.on_send = [this, reply](const std::string& agent_id, const Command& command) {
      CommandReply answer = reply;
      answer.command_id = command.id;
      dispatcher.on_reply(agent_id, answer);
    };
  }

  std::vector<AuditEntry> audit_rows() { return audit.query(AuditFilter{}); }

  fleet_hub::core::SqliteDatabase db;
  fleet_hub::auth::AuthStore auth_store;
  fleet_hub::auth::Authenticator authenticator;
  FakePermissionSource permissions{};
  PermissionResolver resolver;
  AuditLog audit;
  fleet_hub::registry::AgentRegistry registry{};
  FakeTransport transport{};
  CommandDispatcher dispatcher;
};

const Principal kOperator{.user_id = 5, .username = "ops", .superadmin = false};

CommandRequest request(const std::string& type, const std::string& target = "nginx") {
  CommandRequest req{};
  req.agent_id = "web-01";
  req.type = type;
  req.target = target;
  req.ip_address = "10.0.0.9";
  return req;
}

int test_insufficient_level_leaves_no_audit_row() {
  ControlFixture fixture;
  fixture.permissions.levels[{5, "web-01"}] = 1;

  try {
    (void)fixture.dispatcher.dispatch(kOperator, request("service_restart"));
    return fail("test_insufficient_level_leaves_no_audit_row", "level 1 must not restart services");
  } catch (const fleet_hub::core::AuthorizationError& ex) {
    if (ex.reason() != fleet_hub::core::AuthorizationReason::INSUFFICIENT_LEVEL) {
      return fail("test_insufficient_level_leaves_no_audit_row", "expected an insufficient level rejection");
    }
  }
  if (!fixture.transport.sent.empty() || fixture.audit.count(AuditFilter{}) != 0) {
    return fail("test_insufficient_level_leaves_no_audit_row", "rejected command must not be sent or audited");
  }
  return 0;
}

int test_invisible_agent_and_unknown_type() {
  ControlFixture fixture;

  try {
    (void)fixture.dispatcher.dispatch(kOperator, request("process_list"));
    return fail("test_invisible_agent_and_unknown_type", "unbound agent must be rejected");
  } catch (const fleet_hub::core::AuthorizationError& ex) {
    if (ex.reason() != fleet_hub::core::AuthorizationReason::NO_ACCESS ||
        std::string(ex.what()) != "agent not found: web-01") {
      return fail("test_invisible_agent_and_unknown_type", "invisible agent should read as not found");
    }
  }

  fixture.permissions.levels[{5, "web-01"}] = 3;
  try {
    (void)fixture.dispatcher.dispatch(kOperator, request("format_disk"));
    return fail("test_invisible_agent_and_unknown_type", "unknown command types must be rejected");
  } catch (const fleet_hub::core::ValidationError&) {
  }
  if (fixture.audit.count(AuditFilter{}) != 0) {
    return fail("test_invisible_agent_and_unknown_type", "nothing should have been audited");
  }
  return 0;
}

int test_elevated_commands_need_a_credential() {
  ControlFixture fixture;
  fixture.permissions.levels[{5, "web-01"}] = 3;
  fixture.answer_with(CommandReply{.success = true, .output = "rebooting"});

  try {
    (void)fixture.dispatcher.dispatch(kOperator, request("system_reboot", ""));
    return fail("test_elevated_commands_need_a_credential", "reboot without elevation must be rejected");
  } catch (const fleet_hub::core::AuthenticationError&) {
  }
  if (!fixture.transport.sent.empty()) {
    return fail("test_elevated_commands_need_a_credential", "unelevated reboot must not reach the agent");
  }

  const auto credential =
      fixture.authenticator.elevate(kOperator, "elevation-secret-0123", fleet_hub::core::unix_timestamp_now_ms());
  auto elevated = request("system_reboot", "");
  elevated.elevated_credential = credential.token;
  const CommandResult result = fixture.dispatcher.dispatch(kOperator, elevated);
  if (!result.success || result.output != "rebooting") {
    return fail("test_elevated_commands_need_a_credential", "elevated reboot should be delivered");
  }

  // A credential is bound to the user who obtained it.
  const Principal other{.user_id = 6, .username = "dev", .superadmin = false};
  fixture.permissions.levels[{6, "web-01"}] = 3;
  try {
    (void)fixture.dispatcher.dispatch(other, elevated);
    return fail("test_elevated_commands_need_a_credential", "borrowed credential must be rejected");
  } catch (const fleet_hub::core::AuthenticationError&) {
  }
  return 0;
}

int test_disconnected_agent_fails_fast() {
  ControlFixture fixture(std::chrono::milliseconds(5000));
  fixture.permissions.levels[{5, "web-01"}] = 2;
  fixture.transport.streaming.clear();

  const auto started = std::chrono::steady_clock::now();
  try {
    (void)fixture.dispatcher.dispatch(kOperator, request("service_status"));
    return fail("test_disconnected_agent_fails_fast", "offline agent must be rejected");
  } catch (const fleet_hub::core::NotFoundError&) {
  }
  if (std::chrono::steady_clock::now() - started > std::chrono::seconds(1)) {
    return fail("test_disconnected_agent_fails_fast", "offline agent should not wait for the timeout");
  }
  if (!fixture.transport.sent.empty() || fixture.audit.count(AuditFilter{}) != 0) {
    return fail("test_disconnected_agent_fails_fast", "nothing should be sent or audited");
  }

  // Streaming, but the write itself fails.
  fixture.transport.streaming.insert("web-01");
  fixture.transport.delivery = Delivery::NOT_CONNECTED;
  try {
    (void)fixture.dispatcher.dispatch(kOperator, request("service_status"));
    return fail("test_disconnected_agent_fails_fast", "failed delivery must be reported");
  } catch (const fleet_hub::core::NotFoundError&) {
  }
  const auto rows = fixture.audit_rows();
  if (rows.size() != 1 || rows[0].status != AuditStatus::DISCONNECTED || fixture.dispatcher.pending_count() != 0) {
    return fail("test_disconnected_agent_fails_fast", "failed delivery should settle as disconnected");
  }
  return 0;
}

int test_reply_outcomes_are_audited() {
  ControlFixture fixture;
  fixture.permissions.levels[{5, "web-01"}] = 2;

  fixture.answer_with(CommandReply{.success = true, .output = "active (running)"});
  const auto ok = fixture.dispatcher.dispatch(kOperator, request("service_restart"));
  if (!ok.success || ok.output != "active (running)" || ok.audit_id == 0 || ok.command_id.empty()) {
    return fail("test_reply_outcomes_are_audited", "successful reply should be returned");
  }

  fixture.answer_with(CommandReply{.success = false, .error = "unit nginx.service not found"});
  const auto refused = fixture.dispatcher.dispatch(kOperator, request("service_restart"));
  if (refused.success || refused.error != "unit nginx.service not found") {
    return fail("test_reply_outcomes_are_audited", "agent refusal is a result, not an error");
  }

  const auto success_row = fixture.audit.find(ok.audit_id);
  const auto failed_row = fixture.audit.find(refused.audit_id);
  if (!success_row.has_value() || success_row->status != AuditStatus::SUCCESS || !success_row->success ||
      success_row->agent_hostname != "web-01.prod" || success_row->ip_address != "10.0.0.9" ||
      success_row->command_id != ok.command_id) {
    return fail("test_reply_outcomes_are_audited", "success row mismatch");
  }
  if (!failed_row.has_value() || failed_row->status != AuditStatus::FAILED || failed_row->success ||
      failed_row->error != "unit nginx.service not found") {
    return fail("test_reply_outcomes_are_audited", "failed row mismatch");
  }

  const auto& [agent_id, command] = fixture.transport.sent.back();
  if (agent_id != "web-01" || command.type != "service_restart" || command.target != "nginx") {
    return fail("test_reply_outcomes_are_audited", "command should carry type and target");
  }
  return 0;
}

int test_timeout_is_distinct_from_refusal() {
  ControlFixture fixture(std::chrono::milliseconds(50));
  fixture.permissions.levels[{5, "web-01"}] = 0;
  std::string sent_id;
  fixture.transport.on_send = [&fixture, &sent_id](const std::string&, const Command& command) {
    sent_id = command.id;
    // Replies from a different agent never settle the command.
    fixture.dispatcher.on_reply("web-02", CommandReply{.command_id = command.id, .success = true});
  };

  try {
    (void)fixture.dispatcher.dispatch(kOperator, request("process_list"));
    return fail("test_timeout_is_distinct_from_refusal", "silent agent should time out");
  } catch (const fleet_hub::core::TimeoutError&) {
  }

  const auto rows = fixture.audit_rows();
  if (rows.size() != 1 || rows[0].status != AuditStatus::TIMEOUT || rows[0].success) {
    return fail("test_timeout_is_distinct_from_refusal", "timeout should be audited as such");
  }
  if (fixture.dispatcher.pending_count() != 0) {
    return fail("test_timeout_is_distinct_from_refusal", "timed out command must be forgotten");
  }

  // A reply after the timeout is dropped.
  fixture.dispatcher.on_reply("web-01", CommandReply{.command_id = sent_id, .success = true});
  if (fixture.audit.find(rows[0].id)->status != AuditStatus::TIMEOUT) {
    return fail("test_timeout_is_distinct_from_refusal", "late reply must not rewrite the audit row");
  }
  return 0;
}

int test_agent_leaving_settles_pending_commands() {
  ControlFixture fixture;
  fixture.permissions.levels[{5, "web-01"}] = 0;
  fixture.transport.on_send = [&fixture](const std::string& agent_id, const Command&) {
    fixture.dispatcher.on_agent_gone(agent_id);
  };

  try {
    (void)fixture.dispatcher.dispatch(kOperator, request("process_list"));
    return fail("test_agent_leaving_settles_pending_commands", "departed agent should fail the command");
  } catch (const fleet_hub::core::NotFoundError& ex) {
    if (std::string(ex.what()).find("disconnected") == std::string::npos) {
      return fail("test_agent_leaving_settles_pending_commands", "error should say the agent disconnected");
    }
  }
  const auto rows = fixture.audit_rows();
  if (rows.size() != 1 || rows[0].status != AuditStatus::DISCONNECTED) {
    return fail("test_agent_leaving_settles_pending_commands", "departure should be audited as disconnected");
  }
  return 0;
}

int test_undeliverable_command_times_out() {
  ControlFixture fixture(std::chrono::milliseconds(5000));
  fixture.permissions.levels[{5, "web-01"}] = 0;
  // The agent is connected but its socket never drains.
  fixture.transport.delivery = Delivery::TIMED_OUT;

  const auto started = std::chrono::steady_clock::now();
  try {
    (void)fixture.dispatcher.dispatch(kOperator, request("process_list"));
    return fail("test_undeliverable_command_times_out", "blocked write should surface as a timeout");
  } catch (const fleet_hub::core::TimeoutError&) {
  }
  if (std::chrono::steady_clock::now() - started > std::chrono::seconds(1)) {
    return fail("test_undeliverable_command_times_out", "failed write must not wait for a reply as well");
  }
  if (fixture.transport.last_timeout != std::chrono::milliseconds(5000)) {
    return fail("test_undeliverable_command_times_out", "write should be bounded by the command timeout");
  }

  const auto rows = fixture.audit_rows();
  if (rows.size() != 1 || rows[0].status != AuditStatus::TIMEOUT || rows[0].error != "agent stopped reading") {
    return fail("test_undeliverable_command_times_out", "undelivered command should be audited as a timeout");
  }
  if (fixture.dispatcher.pending_count() != 0) {
    return fail("test_undeliverable_command_times_out", "undelivered command must be forgotten");
  }
  return 0;
}

int test_shutdown_cancels_pending_commands() {
  ControlFixture fixture(std::chrono::milliseconds(30000));
  fixture.permissions.levels[{5, "web-01"}] = 0;
  std::promise<void> delivered;
  fixture.transport.on_send = [&delivered](const std::string&, const Command&) { delivered.set_value(); };

  std::string caught;
  const auto started = std::chrono::steady_clock::now();
  std::thread caller([&fixture, &caught] {
    try {
      (void)fixture.dispatcher.dispatch(kOperator, request("process_list"));
      caught = "result";
    } catch (const fleet_hub::core::NotFoundError& ex) {
      caught = ex.what();
    } catch (const std::exception& ex) {
      caught = std::string("unexpected: ") + ex.what();
    }
  });

  if (delivered.get_future().wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
    fixture.dispatcher.shutdown();
    caller.join();
    return fail("test_shutdown_cancels_pending_commands", "command was never sent");
  }
  fixture.dispatcher.shutdown();
  caller.join();

  if (std::chrono::steady_clock::now() - started > std::chrono::seconds(5)) {
    return fail("test_shutdown_cancels_pending_commands", "shutdown should release the waiting caller");
  }
  if (caught.find("shutting down") == std::string::npos) {
    return fail("test_shutdown_cancels_pending_commands", "caller should see an agent-disconnected error");
  }
  const auto rows = fixture.audit_rows();
  if (rows.size() != 1 || rows[0].status != AuditStatus::DISCONNECTED || rows[0].error != "hub shutting down" ||
      fixture.dispatcher.pending_count() != 0) {
    return fail("test_shutdown_cancels_pending_commands", "cancelled command should settle as disconnected");
  }

  // Nothing new is accepted once stopping.
  try {
    (void)fixture.dispatcher.dispatch(kOperator, request("process_list"));
    return fail("test_shutdown_cancels_pending_commands", "dispatch after shutdown must be refused");
  } catch (const fleet_hub::core::NotFoundError&) {
  }
  if (fixture.transport.sent.size() != 1 || fixture.audit.count(AuditFilter{}) != 1) {
    return fail("test_shutdown_cancels_pending_commands", "refused command must not be sent or audited");
  }
  return 0;
}

AuditEntry make_entry(std::int64_t ts, std::int64_t user_id, const std::string& agent_id, const std::string& type) {
  AuditEntry entry{};
  entry.timestamp_ms = ts;
  entry.user_id = user_id;
  entry.username = "user-" + std::to_string(user_id);
  entry.agent_id = agent_id;
  entry.command_type = type;
  entry.command_id = "cmd-" + std::to_string(ts);
  entry.params = {{"lines", 20}};
  return entry;
}

int test_audit_log_transitions_and_filters() {
  fleet_hub::core::SqliteDatabase db(":memory:");
  AuditLog audit(db);
  audit.ensure_schema();

  const auto first = audit.record_pending(make_entry(1000, 1, "web-01", "file_tail"));
  const auto second = audit.record_pending(make_entry(2000, 1, "web-02", "service_restart"));
  const auto third = audit.record_pending(make_entry(3000, 2, "web-01", "file_tail"));

  audit.complete(first, AuditStatus::SUCCESS, "", 12);
  audit.complete(second, AuditStatus::FAILED, "exit status 3", 40);

  try {
    audit.complete(first, AuditStatus::FAILED, "again", 1);
    return fail("test_audit_log_transitions_and_filters", "settled rows must not change");
  } catch (const fleet_hub::core::ConflictError&) {
  }
  try {
    audit.complete(third, AuditStatus::PENDING, "", 0);
    return fail("test_audit_log_transitions_and_filters", "rows cannot be set back to pending");
  } catch (const fleet_hub::core::ValidationError&) {
  }

  const auto all = audit.query(AuditFilter{});
  if (all.size() != 3 || all[0].id != third || all[2].id != first) {
    return fail("test_audit_log_transitions_and_filters", "rows should come back newest first");
  }
  if (all[2].params.value("lines", 0) != 20 || all[2].duration_ms != 12) {
    return fail("test_audit_log_transitions_and_filters", "params and duration should round trip");
  }

  AuditFilter by_agent{};
  by_agent.agent_id = "web-01";
  AuditFilter by_status{};
  by_status.status = AuditStatus::FAILED;
  AuditFilter by_user_window{};
  by_user_window.user_id = 1;
  by_user_window.start_ms = 1500;
  if (audit.count(by_agent) != 2 || audit.count(by_status) != 1 || audit.count(by_user_window) != 1) {
    return fail("test_audit_log_transitions_and_filters", "filters should narrow the rows");
  }

  AuditFilter paged{};
  paged.limit = 1;
  paged.offset = 1;
  const auto page = audit.query(paged);
  if (page.size() != 1 || page[0].id != second) {
    return fail("test_audit_log_transitions_and_filters", "limit and offset should page");
  }

  // Pending rows survive pruning.
  if (audit.prune(5000) != 2 || !audit.find(third).has_value() || audit.find(first).has_value()) {
    return fail("test_audit_log_transitions_and_filters", "prune should drop only settled old rows");
  }
  return 0;
}

int test_audit_stats_counts_by_type_and_status() {
  fleet_hub::core::SqliteDatabase db(":memory:");
  AuditLog audit(db);
  audit.ensure_schema();

  const auto first = audit.record_pending(make_entry(1000, 1, "web-01", "file_tail"));
  const auto second = audit.record_pending(make_entry(2000, 1, "web-02", "service_restart"));
  const auto third = audit.record_pending(make_entry(3000, 2, "web-01", "file_tail"));
  (void)audit.record_pending(make_entry(4000, 3, "db-01", "process_list"));
  const auto old = audit.record_pending(make_entry(10, 9, "db-09", "shell_execute"));
  audit.complete(first, AuditStatus::SUCCESS, "", 5);
  audit.complete(second, AuditStatus::FAILED, "exit status 3", 5);
  audit.complete(third, AuditStatus::TIMEOUT, "no reply within timeout", 5);
  audit.complete(old, AuditStatus::SUCCESS, "", 5);

  const AuditStats stats = audit.stats(1000, std::nullopt);
  if (stats.total != 4 || stats.successful != 1 || stats.failed != 2) {
    return fail("test_audit_stats_counts_by_type_and_status", "totals should cover only the window");
  }
  if (stats.unique_users != 3 || stats.unique_agents != 3) {
    return fail("test_audit_stats_counts_by_type_and_status", "distinct users and agents mismatch");
  }
  if (stats.by_command_type.size() != 3 || stats.by_command_type.at("file_tail") != 2 ||
      stats.by_command_type.count("shell_execute") != 0) {
    return fail("test_audit_stats_counts_by_type_and_status", "command type breakdown mismatch");
  }
  if (stats.by_status.at("pending") != 1 || stats.by_status.at("timeout") != 1 || stats.by_status.at("success") != 1) {
    return fail("test_audit_stats_counts_by_type_and_status", "status breakdown mismatch");
  }

  const AuditStats bounded = audit.stats(1500, 3000);
  if (bounded.total != 2 || bounded.by_command_type.count("process_list") != 0) {
    return fail("test_audit_stats_counts_by_type_and_status", "end bound should be inclusive and respected");
  }

  const AuditStats empty = audit.stats(50000, std::nullopt);
  if (empty.total != 0 || empty.successful != 0 || !empty.by_status.empty()) {
    return fail("test_audit_stats_counts_by_type_and_status", "empty window should yield zeros");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_insufficient_level_leaves_no_audit_row(); rc != 0) return rc;
  if (int rc = test_invisible_agent_and_unknown_type(); rc != 0) return rc;
  if (int rc = test_elevated_commands_need_a_credential(); rc != 0) return rc;
  if (int rc = test_disconnected_agent_fails_fast(); rc != 0) return rc;
  if (int rc = test_reply_outcomes_are_audited(); rc != 0) return rc;
  if (int rc = test_timeout_is_distinct_from_refusal(); rc != 0) return rc;
  if (int rc = test_agent_leaving_settles_pending_commands(); rc != 0) return rc;
  if (int rc = test_undeliverable_command_times_out(); rc != 0) return rc;
  if (int rc = test_shutdown_cancels_pending_commands(); rc != 0) return rc;
  if (int rc = test_audit_log_transitions_and_filters(); rc != 0) return rc;
  if (int rc = test_audit_stats_counts_by_type_and_status(); rc != 0) return rc;

  std::cout << "[PASS] control unit tests\n";
  return 0;
}
