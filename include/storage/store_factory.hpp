#pragma once

#include <memory>

#include "core/config.hpp"
#include "storage/time_series_store.hpp"

namespace fleet_hub::storage {

// "memory" | "redis" | "sqlite"; anything else throws std::invalid_argument.
std::unique_ptr<TimeSeriesStore> make_time_series_store(const core::StorageConfig& config);

}  // namespace fleet_hub::storage
