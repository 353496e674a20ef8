#include "core/ids.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace fleet_hub::core {

std::string random_hex_id(const std::size_t bytes) {
  std::random_device device;
  std::uniform_int_distribution<std::uint32_t> dist(0, 255);

  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes; ++i) {
    out << std::setw(2) << dist(device);
  }
  return out.str();
}

bool constant_time_equal(const std::string& expected, const std::string& provided) noexcept {
  if (expected.size() != provided.size()) {
    return false;
  }
  unsigned char diff = 0;
  for (std::size_t i = 0; i < expected.size(); ++i) {
    diff |= static_cast<unsigned char>(expected[i] ^ provided[i]);
  }
  return diff == 0;
}

}  // namespace fleet_hub::core
