#include "storage/storage_engine.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"

namespace fleet_hub::storage {

StorageEngine::StorageEngine(std::unique_ptr<TimeSeriesStore> backend, const std::size_t cache_entries,
                             HistoryArchive* archive)
    : backend_(std::move(backend)), archive_(archive) {
  if (backend_ == nullptr) {
    throw std::invalid_argument("storage engine requires a backend");
  }
  // A memory backend is its own cache.
  if (backend_->name() != "memory") {
    cache_ = std::make_unique<MemoryStore>(cache_entries);
  }
}

StorageEngine::~StorageEngine() {
  close();
}

void StorageEngine::write(const model::MetricSnapshot& point) {
  if (cache_ != nullptr) {
    cache_->write(point);
  }

  try {
    backend_->write(point);
    record_success();
  } catch (const core::StorageError& ex) {
    record_failure(ex.what());
  }

  if (archive_ != nullptr) {
    try {
      archive_->append(point);
    } catch (const core::StorageError& ex) {
      std::cerr << "[storage] history append failed for " << point.agent_id << ": " << ex.what() << '\n';
    }
  }
}

QueryResult StorageEngine::query(const std::string& agent_id, const std::int64_t start_ms, const std::int64_t end_ms,
                                 const std::size_t limit) {
  try {
    return QueryResult{.points = backend_->query(agent_id, start_ms, end_ms, limit), .from_cache = false};
  } catch (const core::StorageError& ex) {
    if (cache_ == nullptr) {
      throw;
    }
    auto cached = cache_->query(agent_id, start_ms, end_ms, limit);
    if (cached.empty()) {
      throw;
    }
    std::cerr << "[storage] " << backend_->name() << " query failed (" << ex.what() << "); serving cache\n";
    return QueryResult{.points = std::move(cached), .from_cache = true};
  }
}

AgentSeries StorageEngine::query_all(const std::int64_t start_ms, const std::int64_t end_ms,
                                     const std::size_t limit) {
  try {
    return backend_->query_all(start_ms, end_ms, limit);
  } catch (const core::StorageError& ex) {
    if (cache_ == nullptr) {
      throw;
    }
    auto cached = cache_->query_all(start_ms, end_ms, limit);
    if (cached.empty()) {
      throw;
    }
    std::cerr << "[storage] " << backend_->name() << " query_all failed (" << ex.what() << "); serving cache\n";
    return cached;
  }
}

void StorageEngine::delete_before(const std::int64_t before_ms) {
  if (cache_ != nullptr) {
    cache_->delete_before(before_ms);
  }
  backend_->delete_before(before_ms);
}

void StorageEngine::close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  backend_->close();
  if (cache_ != nullptr) {
    cache_->close();
  }
}

std::string StorageEngine::backend_name() const {
  return backend_->name();
}

std::string StorageEngine::last_error() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_;
}

void StorageEngine::record_failure(const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = message;
  }
  if (!degraded_.exchange(true)) {
    std::cerr << "[storage] durable write failed; entering degraded mode: " << message << '\n';
  }
}

void StorageEngine::record_success() {
  if (degraded_.exchange(false)) {
    std::cerr << "[storage] durable write recovered; leaving degraded mode\n";
  }
}

}  // namespace fleet_hub::storage
