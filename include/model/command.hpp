#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace fleet_hub::model {

struct Command {
  std::string id{};
  std::string type{};
  std::string target{};
  nlohmann::json params = nlohmann::json::object();
};

struct CommandReply {
  std::string command_id{};
  bool success{false};
  std::string output{};
  std::string error{};
};

}  // namespace fleet_hub::model
