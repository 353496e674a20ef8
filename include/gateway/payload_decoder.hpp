#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/command.hpp"
#include "model/metrics.hpp"

namespace fleet_hub::gateway {

struct AuthFrame {
  std::string token{};
  std::string agent_id{};
  std::string hostname{};
  std::string os{};
  std::string arch{};
  std::string version{};
};

struct HeartbeatFrame {
  std::int64_t timestamp_ms{0};
};

using InboundFrame = std::variant<AuthFrame, model::StaticInfo, model::PeriodicData, model::MetricSnapshot,
                                  model::RealtimeSample, HeartbeatFrame, model::CommandReply>;

// Decodes one inbound payload into the canonical types. Every field is read
// through one compatibility table of accepted spellings; two spellings of the
// same field carrying different values are rejected with core::ValidationError.
// `kind` is one of auth, static_info, periodic, metrics, realtime, heartbeat,
// command_result.
InboundFrame decode_frame(const std::string& kind, const nlohmann::json& payload, std::int64_t received_ms);

// Accepted spellings for a canonical field name, in preference order.
const std::vector<std::string>& field_spellings(const std::string& canonical);

}  // namespace fleet_hub::gateway
