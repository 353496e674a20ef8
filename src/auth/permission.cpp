#include "auth/permission.hpp"

namespace fleet_hub::auth {

const char* permission_level_name(const PermissionLevel level) noexcept {
  switch (level) {
    case PermissionLevel::READ_ONLY:
      return "READ_ONLY";
    case PermissionLevel::BASIC_WRITE:
      return "BASIC_WRITE";
    case PermissionLevel::SERVICE_CONTROL:
      return "SERVICE_CONTROL";
    case PermissionLevel::SYSTEM_ADMIN:
      return "SYSTEM_ADMIN";
  }
  return "UNKNOWN";
}

std::optional<PermissionLevel> permission_level_from_int(const long long value) noexcept {
  if (value < 0 || value > 3) {
    return std::nullopt;
  }
  return static_cast<PermissionLevel>(value);
}

const std::vector<CommandSpec>& command_catalogue() {
  static const std::vector<CommandSpec> kCommands = {
      {"process_list", PermissionLevel::READ_ONLY, false},
      {"service_status", PermissionLevel::READ_ONLY, false},
      {"docker_list", PermissionLevel::READ_ONLY, false},
      {"file_tail", PermissionLevel::READ_ONLY, false},
      {"file_download", PermissionLevel::BASIC_WRITE, false},
      {"file_truncate", PermissionLevel::BASIC_WRITE, false},
      {"docker_logs", PermissionLevel::BASIC_WRITE, false},
      {"process_kill", PermissionLevel::SERVICE_CONTROL, false},
      {"service_start", PermissionLevel::SERVICE_CONTROL, false},
      {"service_stop", PermissionLevel::SERVICE_CONTROL, false},
      {"service_restart", PermissionLevel::SERVICE_CONTROL, false},
      {"docker_start", PermissionLevel::SERVICE_CONTROL, false},
      {"docker_stop", PermissionLevel::SERVICE_CONTROL, false},
      {"docker_restart", PermissionLevel::SERVICE_CONTROL, false},
      {"file_upload", PermissionLevel::SERVICE_CONTROL, false},
      {"system_reboot", PermissionLevel::SYSTEM_ADMIN, true},
      {"shell_execute", PermissionLevel::SYSTEM_ADMIN, true},
  };
  return kCommands;
}

const CommandSpec* find_command_spec(const std::string& type) {
  for (const auto& spec : command_catalogue()) {
    if (spec.type == type) {
      return &spec;
    }
  }
  return nullptr;
}

}  // namespace fleet_hub::auth
