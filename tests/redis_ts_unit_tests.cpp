#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

#include "core/errors.hpp"
#include "model/metrics.hpp"
#include "storage/redis_ts_store.hpp"

using fleet_hub::model::MetricSnapshot;
using fleet_hub::storage::RedisTsOptions;
using fleet_hub::storage::RedisTsStore;

namespace {

struct RedisMockState {
  std::vector<std::vector<std::string>> calls{};
  bool connect_fails{false};
  bool create_unknown_command{false};
  // TS.MADD calls whose first key contains this fragment answer with an error.
  std::string failing_madd_fragment{};
  std::vector<std::pair<long long, std::string>> revrange_samples{};
};

RedisMockState g_redis_mock{};

void reset_mock() {
  g_redis_mock = RedisMockState{};
}

redisReply* make_reply(int type) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = type;
  return reply;
}

redisReply* make_string_reply(int type, const std::string& text) {
  redisReply* reply = make_reply(type);
  reply->str = static_cast<char*>(std::calloc(text.size() + 1, 1));
  std::memcpy(reply->str, text.data(), text.size());
  reply->len = text.size();
  return reply;
}

redisReply* make_array_reply(std::vector<redisReply*> items) {
  redisReply* reply = make_reply(REDIS_REPLY_ARRAY);
  reply->elements = items.size();
  if (!items.empty()) {
    reply->element = static_cast<redisReply**>(std::calloc(items.size(), sizeof(redisReply*)));
    for (std::size_t i = 0; i < items.size(); ++i) {
      reply->element[i] = items[i];
    }
  }
  return reply;
}

redisContext* make_context(bool failed) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = failed ? REDIS_ERR_IO : REDIS_OK;
  if (failed) {
    std::strncpy(context->errstr, "Connection refused", sizeof(context->errstr) - 1);
  }
  return context;
}

std::size_t count_calls(const std::string& command) {
  std::size_t count = 0;
  for (const auto& call : g_redis_mock.calls) {
    if (!call.empty() && call.front() == command) {
      ++count;
    }
  }
  return count;
}

const std::vector<std::string>* find_call(const std::string& command, const std::string& key) {
  for (const auto& call : g_redis_mock.calls) {
    if (call.size() > 1 && call[0] == command && call[1] == key) {
      return &call;
    }
  }
  return nullptr;
}

}  // namespace

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  return make_context(g_redis_mock.connect_fails);
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  return make_context(g_redis_mock.connect_fails);
}

int redisSetTimeout(redisContext*, const struct timeval) {
  return REDIS_OK;
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t* argvlen) {
  std::vector<std::string> call;
  for (int i = 0; i < argc; ++i) {
    call.emplace_back(argv[i], argvlen[i]);
  }
  g_redis_mock.calls.push_back(call);

  const std::string& command = call.front();
  if (command == "TS.CREATE") {
    if (g_redis_mock.create_unknown_command) {
      return make_string_reply(REDIS_REPLY_ERROR, "ERR unknown command 'TS.CREATE'");
    }
    return make_string_reply(REDIS_REPLY_STATUS, "OK");
  }
  if (command == "TS.MADD") {
    if (!g_redis_mock.failing_madd_fragment.empty() && call.size() > 1 &&
        call[1].find(g_redis_mock.failing_madd_fragment) != std::string::npos) {
      return make_string_reply(REDIS_REPLY_ERROR, "ERR TSDB: the key is not a TSDB key");
    }
    std::vector<redisReply*> items;
    for (std::size_t i = 1; i + 2 < call.size(); i += 3) {
      redisReply* ts = make_reply(REDIS_REPLY_INTEGER);
      ts->integer = std::atoll(call[i + 1].c_str());
      items.push_back(ts);
    }
    return make_array_reply(std::move(items));
  }
  if (command == "TS.REVRANGE") {
    std::vector<redisReply*> samples;
    for (auto it = g_redis_mock.revrange_samples.rbegin(); it != g_redis_mock.revrange_samples.rend(); ++it) {
      redisReply* ts = make_reply(REDIS_REPLY_INTEGER);
      ts->integer = it->first;
      samples.push_back(make_array_reply({ts, make_string_reply(REDIS_REPLY_STRING, it->second)}));
    }
    return make_array_reply(std::move(samples));
  }
  if (command == "TS.QUERYINDEX") {
    return make_array_reply({});
  }
  return make_string_reply(REDIS_REPLY_STATUS, "OK");
}

void freeReplyObject(void* reply) {
  auto* r = static_cast<redisReply*>(reply);
  if (r == nullptr) {
    return;
  }
  for (std::size_t i = 0; i < r->elements; ++i) {
    freeReplyObject(r->element[i]);
  }
  std::free(r->element);
  std::free(r->str);
  std::free(r);
}

}  // extern "C"

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

MetricSnapshot make_point(std::int64_t ts) {
  MetricSnapshot point{};
  point.agent_id = "web-01";
  point.timestamp_ms = ts;
  point.cpu.usage_percent = 42.5;
  point.memory.total = 1000;
  point.memory.used = 500;
  point.memory.available = 500;
  point.disks.push_back(fleet_hub::model::DiskMetrics{.mount_point = "/", .total = 100, .used = 10});
  return point;
}

int test_write_creates_series_once_and_batches_families() {
  reset_mock();
  RedisTsOptions options{};
  options.key_prefix = "fleet";
  options.retention_ms = 86400000;
  RedisTsStore store(options);

  store.write(make_point(1000));

  // cpu(1) + memory(3) + disk(4)
  if (count_calls("TS.CREATE") != 8) {
    return fail("test_write_creates_series_once_and_batches_families", "expected one TS.CREATE per series");
  }
  if (count_calls("TS.MADD") != 3) {
    return fail("test_write_creates_series_once_and_batches_families", "expected one TS.MADD per family");
  }

  const auto* create = find_call("TS.CREATE", "fleet:web-01:cpu:usage_percent");
  if (create == nullptr || create->size() < 7 || (*create)[2] != "RETENTION" || (*create)[3] != "86400000" ||
      (*create)[4] != "DUPLICATE_POLICY" || (*create)[5] != "LAST") {
    return fail("test_write_creates_series_once_and_batches_families", "TS.CREATE arguments mismatch");
  }

  const auto* madd = find_call("TS.MADD", "fleet:web-01:cpu:usage_percent");
  if (madd == nullptr || madd->size() != 4 || (*madd)[2] != "1000" || (*madd)[3] != "42.500000") {
    return fail("test_write_creates_series_once_and_batches_families", "cpu TS.MADD payload mismatch");
  }

  store.write(make_point(2000));
  if (count_calls("TS.CREATE") != 8 || count_calls("TS.MADD") != 6) {
    return fail("test_write_creates_series_once_and_batches_families", "known series must not be re-created");
  }
  return 0;
}

int test_partial_write_keeps_other_families() {
  reset_mock();
  g_redis_mock.failing_madd_fragment = ":memory:";
  RedisTsStore store;

  try {
    store.write(make_point(1000));
    return fail("test_partial_write_keeps_other_families", "failing family should surface an error");
  } catch (const fleet_hub::core::PartialWriteError& ex) {
    if (ex.failed_families() != std::vector<std::string>{"memory"}) {
      return fail("test_partial_write_keeps_other_families", "only the memory family should be reported");
    }
  }

  if (find_call("TS.MADD", "fleet:web-01:disk:/:total") == nullptr ||
      find_call("TS.MADD", "fleet:web-01:cpu:usage_percent") == nullptr) {
    return fail("test_partial_write_keeps_other_families", "families after and before the failure must be written");
  }
  return 0;
}

int test_missing_timeseries_module_disables_backend() {
  reset_mock();
  g_redis_mock.create_unknown_command = true;
  RedisTsStore store;

  try {
    store.write(make_point(1000));
    return fail("test_missing_timeseries_module_disables_backend", "write without the module should fail");
  } catch (const fleet_hub::core::StorageError&) {
  }
  if (count_calls("TS.CREATE") != 1 || count_calls("TS.MADD") != 0) {
    return fail("test_missing_timeseries_module_disables_backend", "module check should stop after one attempt");
  }

  if (store.check_connectivity()) {
    return fail("test_missing_timeseries_module_disables_backend", "backend should report itself unavailable");
  }
  return 0;
}

int test_connect_failure_is_storage_error() {
  reset_mock();
  g_redis_mock.connect_fails = true;
  RedisTsStore store;

  if (store.check_connectivity()) {
    return fail("test_connect_failure_is_storage_error", "refused connection should not be reported healthy");
  }
  try {
    (void)store.query("web-01", 0, 5000, 0);
    return fail("test_connect_failure_is_storage_error", "query without a connection should throw");
  } catch (const fleet_hub::core::StorageError&) {
  }
  return 0;
}

int test_query_reassembles_chronological_snapshots() {
  reset_mock();
  g_redis_mock.revrange_samples = {{1000, "10"}, {2000, "20"}};
  RedisTsStore store;

  const auto points = store.query("web-01", 0, 5000, 10);
  if (points.size() != 2 || points[0].timestamp_ms != 1000 || points[1].timestamp_ms != 2000) {
    return fail("test_query_reassembles_chronological_snapshots", "REVRANGE output should be returned oldest first");
  }
  if (points[1].cpu.usage_percent != 20.0 || points[1].memory.used != 20) {
    return fail("test_query_reassembles_chronological_snapshots", "series values should land on their snapshot");
  }

  const auto* revrange = find_call("TS.REVRANGE", "fleet:web-01:cpu:usage_percent");
  if (revrange == nullptr || revrange->size() != 6 || (*revrange)[4] != "COUNT" || (*revrange)[5] != "10") {
    return fail("test_query_reassembles_chronological_snapshots", "limit should be passed as COUNT");
  }
  return 0;
}

int test_query_rejects_corrupt_counters() {
  for (const char* corrupt : {"1e30", "-1", "nan", "inf"}) {
    reset_mock();
    g_redis_mock.revrange_samples = {{1000, corrupt}};
    RedisTsStore store;
    try {
      (void)store.query("web-01", 0, 5000, 10);
      return fail("test_query_rejects_corrupt_counters", "out-of-range memory counter must not be converted");
    } catch (const fleet_hub::core::StorageError& ex) {
      if (std::string(ex.what()).find("memory:total") == std::string::npos) {
        return fail("test_query_rejects_corrupt_counters", "error should name the offending series");
      }
    }
  }

  reset_mock();
  g_redis_mock.revrange_samples = {{1000, "1e18"}};
  RedisTsStore store;
  const auto points = store.query("web-01", 0, 5000, 10);
  if (points.size() != 1 || points[0].memory.total != 1000000000000000000ULL) {
    return fail("test_query_rejects_corrupt_counters", "large representable counters should still convert");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_write_creates_series_once_and_batches_families(); rc != 0) return rc;
  if (int rc = test_partial_write_keeps_other_families(); rc != 0) return rc;
  if (int rc = test_missing_timeseries_module_disables_backend(); rc != 0) return rc;
  if (int rc = test_connect_failure_is_storage_error(); rc != 0) return rc;
  if (int rc = test_query_reassembles_chronological_snapshots(); rc != 0) return rc;
  if (int rc = test_query_rejects_corrupt_counters(); rc != 0) return rc;

  std::cout << "[PASS] redis ts unit tests\n";
  return 0;
}
