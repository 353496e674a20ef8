#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "model/agent.hpp"
#include "model/metrics.hpp"
#include "registry/agent_registry.hpp"

using fleet_hub::model::AgentInfo;
using fleet_hub::model::MetricSnapshot;
using fleet_hub::model::PeriodicData;
using fleet_hub::model::RealtimeSample;
using fleet_hub::model::StaticInfo;
using fleet_hub::registry::AgentRegistry;

namespace {

bool almost_equal(double a, double b, double eps = 1e-6) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

AgentInfo make_agent(const std::string& id, std::int64_t heartbeat_ms = 0) {
  return AgentInfo{.id = id,
                   .hostname = id + ".local",
                   .os = "linux",
                   .arch = "x86_64",
                   .version = "1.0.0",
                   .connected_at_ms = heartbeat_ms,
                   .last_heartbeat_ms = heartbeat_ms};
}

MetricSnapshot make_snapshot(const std::string& id, std::int64_t ts, double cpu, std::uint64_t used,
                             std::uint64_t total) {
  MetricSnapshot snapshot{};
  snapshot.agent_id = id;
  snapshot.timestamp_ms = ts;
  snapshot.cpu.usage_percent = cpu;
  snapshot.memory.total = total;
  snapshot.memory.used = used;
  return snapshot;
}

int test_register_is_exclusive_and_unregister_idempotent() {
  AgentRegistry registry;
  if (!registry.register_agent(make_agent("web-01")) || registry.register_agent(make_agent("web-01"))) {
    return fail("test_register_is_exclusive_and_unregister_idempotent", "second register of an id must fail");
  }
  if (registry.connected_count() != 1 || !registry.contains("web-01")) {
    return fail("test_register_is_exclusive_and_unregister_idempotent", "agent should be registered once");
  }

  registry.update_snapshot(make_snapshot("web-01", 1000, 10.0, 1, 2));
  if (!registry.unregister_agent("web-01") || registry.unregister_agent("web-01")) {
    return fail("test_register_is_exclusive_and_unregister_idempotent", "only the first unregister removes");
  }
  if (registry.latest("web-01").has_value()) {
    return fail("test_register_is_exclusive_and_unregister_idempotent", "snapshot must leave with the agent");
  }
  return 0;
}

int test_updates_for_unknown_agents_are_ignored() {
  AgentRegistry registry;
  if (registry.update_snapshot(make_snapshot("ghost", 1000, 10.0, 1, 2)) ||
      registry.merge_realtime("ghost", RealtimeSample{}).has_value() || registry.merge_static("ghost", StaticInfo{}) ||
      registry.merge_periodic("ghost", PeriodicData{}) || registry.touch_heartbeat("ghost", 5)) {
    return fail("test_updates_for_unknown_agents_are_ignored", "writes for unregistered ids must be rejected");
  }
  if (!registry.all_latest().empty()) {
    return fail("test_updates_for_unknown_agents_are_ignored", "no snapshot should have been created");
  }
  return 0;
}

int test_fleet_summary_scenario() {
  AgentRegistry registry;
  registry.register_agent(make_agent("web-01"));
  registry.register_agent(make_agent("web-02"));
  registry.register_agent(make_agent("idle-01"));

  registry.update_snapshot(make_snapshot("web-01", 1000, 30.0, 4, 8));
  registry.update_snapshot(make_snapshot("web-02", 1000, 55.0, 4, 8));

  const auto summary = registry.summary();
  if (summary.agent_count != 3 || summary.reporting_count != 2) {
    return fail("test_fleet_summary_scenario", "agent and reporting counts mismatch");
  }
  if (!almost_equal(summary.avg_cpu_percent, 42.5)) {
    return fail("test_fleet_summary_scenario", "average cpu should only count reporting agents");
  }
  if (summary.total_memory != 16 || summary.used_memory != 8 || !almost_equal(summary.memory_percent, 50.0)) {
    return fail("test_fleet_summary_scenario", "memory totals mismatch");
  }

  const auto filtered = registry.summary([](const std::string& id) { return id == "web-02"; });
  if (filtered.agent_count != 1 || !almost_equal(filtered.avg_cpu_percent, 55.0)) {
    return fail("test_fleet_summary_scenario", "filter should restrict the aggregate");
  }

  const auto empty = registry.summary([](const std::string&) { return false; });
  if (empty.agent_count != 0 || empty.avg_cpu_percent != 0.0 || empty.memory_percent != 0.0) {
    return fail("test_fleet_summary_scenario", "empty fleet should summarize to zeros");
  }
  return 0;
}

int test_realtime_merges_into_static_baseline() {
  AgentRegistry registry;
  registry.register_agent(make_agent("web-01"));

  StaticInfo info{};
  info.cpu_model = "EPYC";
  info.cpu_cores = 16;
  info.memory_total = 1000;
  info.disks.push_back(fleet_hub::model::DiskMetrics{.mount_point = "/", .device = "sda1", .total = 500});
  registry.merge_static("web-01", info);

  RealtimeSample sample{};
  sample.timestamp_ms = 2000;
  sample.cpu_usage_percent = 12.5;
  sample.memory_used = 250;
  sample.disk_io.push_back(fleet_hub::model::DiskMetrics{.device = "sda1", .read_bps = 100.0});
  const auto merged = registry.merge_realtime("web-01", sample);

  if (!merged.has_value() || merged->cpu.model != "EPYC" || merged->cpu.core_count != 16) {
    return fail("test_realtime_merges_into_static_baseline", "static identity should seed the snapshot");
  }
  if (!almost_equal(merged->cpu.usage_percent, 12.5) || merged->memory.used != 250 || merged->memory.total != 1000) {
    return fail("test_realtime_merges_into_static_baseline", "realtime fields should overlay the baseline");
  }
  if (merged->disks.size() != 1 || merged->disks[0].mount_point != "/" || !almost_equal(merged->disks[0].read_bps, 100.0)) {
    return fail("test_realtime_merges_into_static_baseline", "disk io should join the static disk by device");
  }

  RealtimeSample partial{};
  partial.timestamp_ms = 1500;
  partial.memory_used = 300;
  const auto second = registry.merge_realtime("web-01", partial);
  if (!second.has_value() || !almost_equal(second->cpu.usage_percent, 12.5) || second->memory.used != 300) {
    return fail("test_realtime_merges_into_static_baseline", "absent fields must keep their last value");
  }
  if (second->timestamp_ms != 2000) {
    return fail("test_realtime_merges_into_static_baseline", "snapshot timestamp must not move backwards");
  }
  return 0;
}

int test_periodic_and_full_snapshot_interplay() {
  AgentRegistry registry;
  registry.register_agent(make_agent("web-01"));

  StaticInfo info{};
  info.cpu_model = "Xeon";
  registry.merge_static("web-01", info);

  auto full = make_snapshot("web-01", 1000, 20.0, 10, 20);
  registry.update_snapshot(full);
  if (registry.latest("web-01")->cpu.model != "Xeon") {
    return fail("test_periodic_and_full_snapshot_interplay", "full snapshot should inherit static identity");
  }

  PeriodicData periodic{};
  periodic.disk_usage.push_back(fleet_hub::model::DiskMetrics{.mount_point = "/data", .total = 100, .used = 70});
  periodic.sessions.push_back(fleet_hub::model::UserSession{.username = "ops", .tty = "pts/0"});
  registry.merge_periodic("web-01", periodic);

  const auto latest = registry.latest("web-01");
  if (!latest.has_value() || latest->disks.size() != 1 || latest->disks[0].used != 70 || latest->sessions.size() != 1) {
    return fail("test_periodic_and_full_snapshot_interplay", "periodic data should merge into the snapshot");
  }
  if (!almost_equal(latest->cpu.usage_percent, 20.0)) {
    return fail("test_periodic_and_full_snapshot_interplay", "periodic merge must leave cpu untouched");
  }
  return 0;
}

int test_stale_detection_uses_heartbeats() {
  AgentRegistry registry;
  registry.register_agent(make_agent("fresh", 1000));
  registry.register_agent(make_agent("stale", 1000));

  registry.touch_heartbeat("fresh", 95000);
  registry.touch_heartbeat("fresh", 90000);
  if (registry.agent("fresh")->last_heartbeat_ms != 95000) {
    return fail("test_stale_detection_uses_heartbeats", "heartbeat time must be monotonic");
  }

  const auto stale = registry.find_stale(100000, 90000);
  if (stale.size() != 1 || stale[0] != "stale") {
    return fail("test_stale_detection_uses_heartbeats", "only the silent agent should be stale");
  }
  if (!registry.find_stale(91000, 90000).empty()) {
    return fail("test_stale_detection_uses_heartbeats", "exactly at the timeout is not yet stale");
  }
  return 0;
}

int test_concurrent_readers_and_writers() {
  AgentRegistry registry;
  for (int i = 0; i < 8; ++i) {
    registry.register_agent(make_agent("agent-" + std::to_string(i)));
  }

  std::atomic<bool> torn{false};
  std::vector<std::thread> writers;
  for (int i = 0; i < 8; ++i) {
    writers.emplace_back([&registry, i] {
      const std::string id = "agent-" + std::to_string(i);
      for (int n = 1; n <= 500; ++n) {
        registry.update_snapshot(make_snapshot(id, n, static_cast<double>(n), static_cast<std::uint64_t>(n),
                                               static_cast<std::uint64_t>(n)));
      }
    });
  }
  std::thread reader([&registry, &torn] {
    for (int n = 0; n < 500; ++n) {
      for (const auto& [id, snapshot] : registry.all_latest()) {
        // Every write sets used == total == timestamp; a mix means a torn read.
        if (snapshot.memory.used != snapshot.memory.total ||
            static_cast<std::int64_t>(snapshot.memory.used) != snapshot.timestamp_ms) {
          torn = true;
        }
      }
      (void)registry.summary();
    }
  });

  for (auto& writer : writers) {
    writer.join();
  }
  reader.join();

  if (torn) {
    return fail("test_concurrent_readers_and_writers", "reader observed a partially written snapshot");
  }
  const auto all = registry.all_latest();
  if (all.size() != 8 || std::any_of(all.begin(), all.end(), [](const auto& entry) {
        return entry.second.timestamp_ms != 500;
      })) {
    return fail("test_concurrent_readers_and_writers", "final snapshots should be the last write");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_register_is_exclusive_and_unregister_idempotent(); rc != 0) return rc;
  if (int rc = test_updates_for_unknown_agents_are_ignored(); rc != 0) return rc;
  if (int rc = test_fleet_summary_scenario(); rc != 0) return rc;
  if (int rc = test_realtime_merges_into_static_baseline(); rc != 0) return rc;
  if (int rc = test_periodic_and_full_snapshot_interplay(); rc != 0) return rc;
  if (int rc = test_stale_detection_uses_heartbeats(); rc != 0) return rc;
  if (int rc = test_concurrent_readers_and_writers(); rc != 0) return rc;

  std::cout << "[PASS] registry unit tests\n";
  return 0;
}
