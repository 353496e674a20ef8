#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fleet_hub::auth {

enum class PermissionLevel : std::uint8_t {
  READ_ONLY = 0,
  BASIC_WRITE = 1,
  SERVICE_CONTROL = 2,
  SYSTEM_ADMIN = 3,
};

const char* permission_level_name(PermissionLevel level) noexcept;
std::optional<PermissionLevel> permission_level_from_int(long long value) noexcept;

// Outcome of resolving (user, agent). An invisible agent carries no level at all.
struct ResolvedAccess {
  bool visible{false};
  PermissionLevel level{PermissionLevel::READ_ONLY};

  [[nodiscard]] bool allows(const PermissionLevel required) const noexcept {
    return visible && static_cast<int>(level) >= static_cast<int>(required);
  }
};

struct CommandSpec {
  std::string type;
  PermissionLevel min_level;
  bool requires_elevation;
};

const std::vector<CommandSpec>& command_catalogue();
const CommandSpec* find_command_spec(const std::string& type);

}  // namespace fleet_hub::auth
