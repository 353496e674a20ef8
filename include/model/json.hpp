#pragma once

#include <nlohmann/json.hpp>

#include "model/agent.hpp"
#include "model/metrics.hpp"

namespace fleet_hub::model {

// Outbound (API and push stream) encodings. Inbound agent payloads go through
// gateway::decode_frame instead.
void to_json(nlohmann::json& out, const CpuMetrics& cpu);
void to_json(nlohmann::json& out, const MemoryMetrics& memory);
void to_json(nlohmann::json& out, const DiskMetrics& disk);
void to_json(nlohmann::json& out, const NetworkMetrics& network);
void to_json(nlohmann::json& out, const GpuMetrics& gpu);
void to_json(nlohmann::json& out, const NpuMetrics& npu);
void to_json(nlohmann::json& out, const UserSession& session);
void to_json(nlohmann::json& out, const SystemInfo& system);
void to_json(nlohmann::json& out, const MetricSnapshot& snapshot);
void to_json(nlohmann::json& out, const AgentInfo& agent);

}  // namespace fleet_hub::model
