#pragma once

#include "vp/config.h"
#include <nlohmann/json.hpp>
#include <string>

namespace vp {

// Apply snake_case overrides (top_k, attack_direction, ...) on top of base.
// Unknown keys and wrong types throw std::invalid_argument.
AlgoConfig configFromJson(const nlohmann::ordered_json& j, AlgoConfig base = AlgoConfig());

AlgoConfig loadConfig(const std::string& path);

nlohmann::ordered_json configToJson(const AlgoConfig& cfg);

} // namespace vp
