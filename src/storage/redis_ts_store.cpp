#include "storage/redis_ts_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <iterator>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

#include "core/errors.hpp"

namespace fleet_hub::storage {
namespace {

double sanitize_value(const double value) {
  return std::isfinite(value) ? value : 0.0;
}

// Byte counters come back as doubles; anything outside uint64 range is corrupt.
std::uint64_t counter_value(const double value, const std::string& key) {
  if (!std::isfinite(value) || value < 0.0 || value >= 18446744073709551616.0) {
    throw core::StorageError("series " + key + " holds out-of-range counter " + std::to_string(value));
  }
  return static_cast<std::uint64_t>(value);
}

std::string format_value(const double value) {
  return std::to_string(sanitize_value(value));
}

bool reply_error_contains(const redisReply* reply, const char* needle) {
  return reply != nullptr && reply->type == REDIS_REPLY_ERROR && reply->str != nullptr &&
         std::strstr(reply->str, needle) != nullptr;
}

std::string reply_error_message(const redisReply* reply) {
  if (reply == nullptr) {
    return "no reply";
  }
  return reply->str != nullptr ? reply->str : "unknown";
}

std::string strip_suffix_field(const std::string& rest, std::string& field) {
  const auto split = rest.rfind(':');
  if (split == std::string::npos) {
    field.clear();
    return rest;
  }
  field = rest.substr(split + 1);
  return rest.substr(0, split);
}

}  // namespace

RedisTsStore::RedisTsStore(RedisTsOptions options) : options_(std::move(options)) {}

RedisTsStore::~RedisTsStore() = default;

void RedisTsStore::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

void RedisTsStore::ReplyDeleter::operator()(redisReply* reply) const {
  if (reply != nullptr) {
    freeReplyObject(reply);
  }
}

bool RedisTsStore::check_connectivity() {
  std::lock_guard<std::mutex> lock(mutex_);
  return ensure_connected();
}

bool RedisTsStore::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsStore::reconnect() {
  context_.reset();
  known_series_.clear();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (redisSetTimeout(context_.get(), timeout) != REDIS_OK) {
    std::cerr << "[redis] unable to set command timeout\n";
    context_.reset();
    return false;
  }
  if (!authenticate()) {
    context_.reset();
    return false;
  }
  if (!select_db()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisTsStore::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  const ReplyPtr reply = command({"AUTH", options_.password});
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  return ok;
}

bool RedisTsStore::select_db() {
  if (options_.db == 0) {
    return true;
  }

  const ReplyPtr reply = command({"SELECT", std::to_string(options_.db)});
  return reply != nullptr && reply->type != REDIS_REPLY_ERROR;
}

RedisTsStore::ReplyPtr RedisTsStore::command(const std::vector<std::string>& args) {
  if (context_ == nullptr) {
    return nullptr;
  }

  std::vector<const char*> argv;
  std::vector<std::size_t> argv_len;
  argv.reserve(args.size());
  argv_len.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    argv_len.push_back(arg.size());
  }

  auto* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(argv.size()), argv.data(), argv_len.data()));
  if (reply == nullptr) {
    // The context is unusable after an I/O error or timeout.
    std::cerr << "[redis] command " << args.front() << " failed: "
              << (context_->errstr[0] != '\0' ? context_->errstr : "connection lost") << '\n';
    context_.reset();
    known_series_.clear();
  }
  return ReplyPtr(reply);
}

std::string RedisTsStore::series_key(const std::string& agent_id, const std::string& family) const {
  return options_.key_prefix + ":" + agent_id + ":" + family;
}

bool RedisTsStore::ensure_series(const Sample& sample) {
  if (known_series_.count(sample.key) != 0) {
    return true;
  }
  if (!timeseries_available_) {
    return false;
  }

  std::vector<std::string> args = {"TS.CREATE", sample.key, "RETENTION", std::to_string(options_.retention_ms),
                                    "DUPLICATE_POLICY", "LAST", "LABELS"};
  for (const auto& [label, value] : sample.labels) {
    args.push_back(label);
    args.push_back(value);
  }

  const ReplyPtr reply = command(args);
  if (reply == nullptr) {
    return false;
  }
  if (reply_error_contains(reply.get(), "unknown command")) {
    std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
    timeseries_available_ = false;
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR || reply_error_contains(reply.get(), "already exists");
  if (!ok) {
    std::cerr << "[redis] schema error on TS.CREATE " << sample.key << ": " << reply_error_message(reply.get())
              << '\n';
    return false;
  }

  known_series_.insert(sample.key);
  return true;
}

bool RedisTsStore::write_family(const std::vector<Sample>& samples, const std::int64_t timestamp_ms) {
  for (const auto& sample : samples) {
    if (!ensure_series(sample)) {
      return false;
    }
  }

  std::vector<std::string> args;
  args.reserve(1 + samples.size() * 3);
  args.emplace_back("TS.MADD");
  for (const auto& sample : samples) {
    args.push_back(sample.key);
    args.push_back(std::to_string(timestamp_ms));
    args.push_back(format_value(sample.value));
  }

  const ReplyPtr reply = command(args);
  if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
    return false;
  }
  if (reply->type == REDIS_REPLY_ARRAY) {
    for (std::size_t i = 0; i < reply->elements; ++i) {
      if (reply->element[i] != nullptr && reply->element[i]->type == REDIS_REPLY_ERROR) {
        return false;
      }
    }
  }
  return true;
}

void RedisTsStore::write(const model::MetricSnapshot& point) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ensure_connected()) {
    throw core::StorageError("redis unavailable");
  }

  const auto& agent = point.agent_id;
  const auto label_set = [&agent](const char* family, const char* field) {
    return std::vector<std::pair<std::string, std::string>>{
        {"agent_id", agent}, {"family", family}, {"field", field}};
  };

  std::vector<std::pair<std::string, std::vector<Sample>>> families;

  families.push_back({"cpu",
                      {Sample{series_key(agent, "cpu:usage_percent"), label_set("cpu", "usage_percent"),
                              point.cpu.usage_percent}}});

  families.push_back(
      {"memory",
       {Sample{series_key(agent, "memory:total"), label_set("memory", "total"),
               static_cast<double>(point.memory.total)},
        Sample{series_key(agent, "memory:used"), label_set("memory", "used"), static_cast<double>(point.memory.used)},
        Sample{series_key(agent, "memory:available"), label_set("memory", "available"),
               static_cast<double>(point.memory.available)}}});

  std::vector<Sample> disk_samples;
  for (const auto& disk : point.disks) {
    const std::string base = series_key(agent, "disk:" + disk.mount_point);
    const auto labels = [&](const char* field) {
      auto set = label_set("disk", field);
      set.emplace_back("mount_point", disk.mount_point);
      return set;
    };
    disk_samples.push_back(Sample{base + ":total", labels("total"), static_cast<double>(disk.total)});
    disk_samples.push_back(Sample{base + ":used", labels("used"), static_cast<double>(disk.used)});
    disk_samples.push_back(Sample{base + ":read_bps", labels("read_bps"), disk.read_bps});
    disk_samples.push_back(Sample{base + ":write_bps", labels("write_bps"), disk.write_bps});
  }
  if (!disk_samples.empty()) {
    families.emplace_back("disk", std::move(disk_samples));
  }

  std::vector<Sample> network_samples;
  for (const auto& network : point.networks) {
    const std::string base = series_key(agent, "network:" + network.interface);
    const auto labels = [&](const char* field) {
      auto set = label_set("network", field);
      set.emplace_back("interface", network.interface);
      return set;
    };
    network_samples.push_back(Sample{base + ":rx_bps", labels("rx_bps"), network.rx_bps});
    network_samples.push_back(Sample{base + ":tx_bps", labels("tx_bps"), network.tx_bps});
    network_samples.push_back(Sample{base + ":is_up", labels("is_up"), network.is_up ? 1.0 : 0.0});
  }
  if (!network_samples.empty()) {
    families.emplace_back("network", std::move(network_samples));
  }

  std::vector<std::string> failed;
  for (const auto& [family, samples] : families) {
    if (context_ == nullptr && !reconnect()) {
      failed.push_back(family);
      continue;
    }
    if (!write_family(samples, point.timestamp_ms)) {
      failed.push_back(family);
    }
  }

  if (failed.empty()) {
    return;
  }
  std::string message = "redis write failed for agent " + agent + ", families:";
  for (const auto& family : failed) {
    message += " " + family;
  }
  throw core::PartialWriteError(message, failed);
}

RedisTsStore::Points RedisTsStore::read_series(const std::string& key, const std::int64_t start_ms,
                                               const std::int64_t end_ms, const std::size_t limit) {
  const ReplyPtr reply = command(
      {"TS.REVRANGE", key, std::to_string(start_ms), std::to_string(end_ms), "COUNT", std::to_string(limit)});
  if (reply == nullptr) {
    throw core::StorageError("redis TS.REVRANGE " + key + " failed");
  }
  if (reply_error_contains(reply.get(), "does not exist")) {
    return {};
  }
  if (reply->type != REDIS_REPLY_ARRAY) {
    throw core::StorageError("redis TS.REVRANGE " + key + ": " + reply_error_message(reply.get()));
  }

  Points points;
  points.reserve(reply->elements);
  for (std::size_t i = 0; i < reply->elements; ++i) {
    const redisReply* sample = reply->element[i];
    if (sample == nullptr || sample->type != REDIS_REPLY_ARRAY || sample->elements < 2) {
      continue;
    }
    const redisReply* ts = sample->element[0];
    const redisReply* value = sample->element[1];
    if (ts == nullptr || ts->type != REDIS_REPLY_INTEGER || value == nullptr || value->str == nullptr) {
      continue;
    }
    points.emplace_back(static_cast<std::int64_t>(ts->integer), std::strtod(value->str, nullptr));
  }
  // REVRANGE is newest first.
  std::reverse(points.begin(), points.end());
  return points;
}

std::vector<std::string> RedisTsStore::query_index(const std::vector<std::string>& filters) {
  std::vector<std::string> args = {"TS.QUERYINDEX"};
  args.insert(args.end(), filters.begin(), filters.end());

  const ReplyPtr reply = command(args);
  if (reply == nullptr || reply->type != REDIS_REPLY_ARRAY) {
    throw core::StorageError("redis TS.QUERYINDEX failed: " + reply_error_message(reply.get()));
  }

  std::vector<std::string> keys;
  for (std::size_t i = 0; i < reply->elements; ++i) {
    const redisReply* key = reply->element[i];
    if (key != nullptr && key->str != nullptr) {
      keys.emplace_back(key->str, key->len);
    }
  }
  return keys;
}

std::vector<model::MetricSnapshot> RedisTsStore::query(const std::string& agent_id, const std::int64_t start_ms,
                                                       const std::int64_t end_ms, const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ensure_connected()) {
    throw core::StorageError("redis unavailable");
  }
  return query_locked(agent_id, start_ms, end_ms, limit == 0 ? options_.default_limit : limit);
}

std::vector<model::MetricSnapshot> RedisTsStore::query_locked(const std::string& agent_id,
                                                              const std::int64_t start_ms,
                                                              const std::int64_t end_ms, const std::size_t limit) {
  std::map<std::int64_t, model::MetricSnapshot> by_time;
  const auto slot = [&](const std::int64_t ts) -> model::MetricSnapshot* {
    const auto it = by_time.find(ts);
    return it == by_time.end() ? nullptr : &it->second;
  };

  for (const auto& [ts, value] : read_series(series_key(agent_id, "cpu:usage_percent"), start_ms, end_ms, limit)) {
    auto& snapshot = by_time[ts];
    snapshot.agent_id = agent_id;
    snapshot.timestamp_ms = ts;
    snapshot.cpu.usage_percent = value;
  }
  if (by_time.empty()) {
    return {};
  }

  const auto apply_memory = [&](const char* field, std::uint64_t model::MemoryMetrics::*member) {
    const std::string key = series_key(agent_id, std::string("memory:") + field);
    for (const auto& [ts, value] : read_series(key, start_ms, end_ms, limit)) {
      if (auto* snapshot = slot(ts); snapshot != nullptr) {
        snapshot->memory.*member = counter_value(value, key);
      }
    }
  };
  apply_memory("total", &model::MemoryMetrics::total);
  apply_memory("used", &model::MemoryMetrics::used);
  apply_memory("available", &model::MemoryMetrics::available);

  const std::string disk_prefix = series_key(agent_id, "disk:");
  for (const auto& key : query_index({"agent_id=" + agent_id, "family=disk"})) {
    if (key.rfind(disk_prefix, 0) != 0) {
      continue;
    }
    std::string field;
    const std::string mount = strip_suffix_field(key.substr(disk_prefix.size()), field);
    for (const auto& [ts, value] : read_series(key, start_ms, end_ms, limit)) {
      auto* snapshot = slot(ts);
      if (snapshot == nullptr) {
        continue;
      }
      auto disk = std::find_if(snapshot->disks.begin(), snapshot->disks.end(),
                               [&mount](const model::DiskMetrics& d) { return d.mount_point == mount; });
      if (disk == snapshot->disks.end()) {
        snapshot->disks.push_back(model::DiskMetrics{.mount_point = mount});
        disk = std::prev(snapshot->disks.end());
      }
      if (field == "total") {
        disk->total = counter_value(value, key);
      } else if (field == "used") {
        disk->used = counter_value(value, key);
      } else if (field == "read_bps") {
        disk->read_bps = value;
      } else if (field == "write_bps") {
        disk->write_bps = value;
      }
    }
  }

  const std::string network_prefix = series_key(agent_id, "network:");
  for (const auto& key : query_index({"agent_id=" + agent_id, "family=network"})) {
    if (key.rfind(network_prefix, 0) != 0) {
      continue;
    }
    std::string field;
    const std::string iface = strip_suffix_field(key.substr(network_prefix.size()), field);
    for (const auto& [ts, value] : read_series(key, start_ms, end_ms, limit)) {
      auto* snapshot = slot(ts);
      if (snapshot == nullptr) {
        continue;
      }
      auto network = std::find_if(snapshot->networks.begin(), snapshot->networks.end(),
                                  [&iface](const model::NetworkMetrics& n) { return n.interface == iface; });
      if (network == snapshot->networks.end()) {
        snapshot->networks.push_back(model::NetworkMetrics{.interface = iface});
        network = std::prev(snapshot->networks.end());
      }
      if (field == "rx_bps") {
        network->rx_bps = value;
      } else if (field == "tx_bps") {
        network->tx_bps = value;
      } else if (field == "is_up") {
        network->is_up = value != 0.0;
      }
    }
  }

  std::vector<model::MetricSnapshot> points;
  points.reserve(by_time.size());
  for (auto& [ts, snapshot] : by_time) {
    points.push_back(std::move(snapshot));
  }
  return points;
}

AgentSeries RedisTsStore::query_all(const std::int64_t start_ms, const std::int64_t end_ms, const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ensure_connected()) {
    throw core::StorageError("redis unavailable");
  }

  const std::string prefix = options_.key_prefix + ":";
  const std::string suffix = ":cpu:usage_percent";
  AgentSeries result;
  for (const auto& key : query_index({"family=cpu", "field=usage_percent"})) {
    if (key.size() <= prefix.size() + suffix.size() || key.rfind(prefix, 0) != 0 ||
        key.compare(key.size() - suffix.size(), suffix.size(), suffix) != 0) {
      continue;
    }
    const std::string agent_id = key.substr(prefix.size(), key.size() - prefix.size() - suffix.size());
    auto points = query_locked(agent_id, start_ms, end_ms, limit == 0 ? options_.default_limit : limit);
    if (!points.empty()) {
      result.emplace(agent_id, std::move(points));
    }
  }
  return result;
}

void RedisTsStore::delete_before(const std::int64_t /*before_ms*/) {}

void RedisTsStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  context_.reset();
  known_series_.clear();
}

}  // namespace fleet_hub::storage
