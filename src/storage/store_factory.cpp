#include "storage/store_factory.hpp"

#include <stdexcept>

#include "core/timestamp.hpp"
#include "storage/memory_store.hpp"
#include "storage/redis_ts_store.hpp"
#include "storage/sqlite_store.hpp"

namespace fleet_hub::storage {

std::unique_ptr<TimeSeriesStore> make_time_series_store(const core::StorageConfig& config) {
  if (config.type.empty() || config.type == "memory") {
    return std::make_unique<MemoryStore>(config.max_entries);
  }

  if (config.type == "redis") {
    RedisTsOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.password = config.redis.password;
    options.db = config.redis.db;
    options.key_prefix = config.redis.key_prefix;
    options.timeout_ms = config.redis.timeout_ms;
    options.retention_ms = static_cast<std::int64_t>(config.retention_days) * core::kMillisPerDay;
    options.default_limit = config.max_entries;
    return std::make_unique<RedisTsStore>(options);
  }

  if (config.type == "sqlite") {
    return std::make_unique<SqliteStore>(config.sqlite_path, config.max_entries);
  }

  throw std::invalid_argument("unsupported storage type: " + config.type);
}

}  // namespace fleet_hub::storage
