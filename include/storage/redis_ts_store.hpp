#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "storage/time_series_store.hpp"

struct redisContext;
struct redisReply;

namespace fleet_hub::storage {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"fleet"};
  std::uint32_t timeout_ms{1000};
  std::int64_t retention_ms{7LL * 24 * 3600 * 1000};
  std::size_t default_limit{600};
};

// RedisTimeSeries backend. Every metric family is its own TS.MADD, so one failing
// family leaves the others written; the failure surfaces as core::PartialWriteError.
// Expiry is the per-series RETENTION, which makes delete_before a no-op.
class RedisTsStore final : public TimeSeriesStore {
 public:
  explicit RedisTsStore(RedisTsOptions options = {});
  ~RedisTsStore() override;

  RedisTsStore(const RedisTsStore&) = delete;
  RedisTsStore& operator=(const RedisTsStore&) = delete;

  bool check_connectivity();

  void write(const model::MetricSnapshot& point) override;
  std::vector<model::MetricSnapshot> query(const std::string& agent_id, std::int64_t start_ms, std::int64_t end_ms,
                                           std::size_t limit) override;
  AgentSeries query_all(std::int64_t start_ms, std::int64_t end_ms, std::size_t limit) override;
  void delete_before(std::int64_t before_ms) override;
  void close() override;
  [[nodiscard]] std::string name() const override { return "redis"; }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };
  struct ReplyDeleter {
    void operator()(redisReply* reply) const;
  };
  using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

  struct Sample {
    std::string key;
    std::vector<std::pair<std::string, std::string>> labels;
    double value;
  };

  using Points = std::vector<std::pair<std::int64_t, double>>;

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  ReplyPtr command(const std::vector<std::string>& args);
  bool ensure_series(const Sample& sample);
  bool write_family(const std::vector<Sample>& samples, std::int64_t timestamp_ms);
  Points read_series(const std::string& key, std::int64_t start_ms, std::int64_t end_ms, std::size_t limit);
  std::vector<std::string> query_index(const std::vector<std::string>& filters);
  std::vector<model::MetricSnapshot> query_locked(const std::string& agent_id, std::int64_t start_ms,
                                                  std::int64_t end_ms, std::size_t limit);
  [[nodiscard]] std::string series_key(const std::string& agent_id, const std::string& family) const;

  RedisTsOptions options_;
  std::mutex mutex_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::unordered_set<std::string> known_series_{};
  bool timeseries_available_{true};
};

}  // namespace fleet_hub::storage
