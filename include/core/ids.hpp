#pragma once

#include <cstddef>
#include <string>

namespace fleet_hub::core {

// Random lowercase hex string of `bytes` bytes of entropy.
std::string random_hex_id(std::size_t bytes = 16);

bool constant_time_equal(const std::string& expected, const std::string& provided) noexcept;

}  // namespace fleet_hub::core
