#include "vp/config_io.h"
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace vp {

namespace {

using Json = nlohmann::ordered_json;

double asDouble(const Json& v, const std::string& key) {
    if (!v.is_number()) throw std::invalid_argument("config '" + key + "' must be a number");
    return v.get<double>();
}

int asInt(const Json& v, const std::string& key) {
    if (!v.is_number_integer()) throw std::invalid_argument("config '" + key + "' must be an integer");
    bool fits = v.is_number_unsigned()
        ? v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : v.get<int64_t>() >= std::numeric_limits<int>::min() &&
          v.get<int64_t>() <= std::numeric_limits<int>::max();
    if (!fits) throw std::invalid_argument("config '" + key + "' is out of range");
    return v.get<int>();
}

bool asBool(const Json& v, const std::string& key) {
    if (!v.is_boolean()) throw std::invalid_argument("config '" + key + "' must be a boolean");
    return v.get<bool>();
}

std::vector<RolePrior> asRolePriors(const Json& v) {
    if (!v.is_array()) throw std::invalid_argument("config 'role_priors' must be a list");
    std::vector<RolePrior> out;
    for (auto& e : v) {
        if (!e.is_object() || !e.contains("role") || !e.contains("candidate") ||
            !e.contains("bonus") || !e["role"].is_string() || !e["candidate"].is_string()) {
            throw std::invalid_argument(
                "config 'role_priors' entries need string 'role', 'candidate' and numeric 'bonus'");
        }
        out.push_back({e["role"].get<std::string>(), e["candidate"].get<std::string>(),
                       asDouble(e["bonus"], "role_priors.bonus")});
    }
    return out;
}

} // anonymous namespace

AlgoConfig configFromJson(const Json& j, AlgoConfig base) {
    if (!j.is_object()) throw std::invalid_argument("config must be a JSON object");

    AlgoConfig cfg = std::move(base);
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const Json& v = it.value();

        if (key == "top_k") cfg.topK = asInt(v, key);
        else if (key == "attack_direction") cfg.attackDirection = asInt(v, key);
        else if (key == "max_player_speed") cfg.maxPlayerSpeed = asDouble(v, key);
        else if (key == "min_dt") cfg.minDt = asDouble(v, key);
        else if (key == "teammate_radius") cfg.teammateRadius = asDouble(v, key);
        else if (key == "opponent_radius") cfg.opponentRadius = asDouble(v, key);
        else if (key == "enable_ball_focus") cfg.enableBallFocus = asBool(v, key);
        else if (key == "enable_marking_threats") cfg.enableMarkingThreats = asBool(v, key);
        else if (key == "enable_pass_targets") cfg.enablePassTargets = asBool(v, key);
        else if (key == "enable_space_targets") cfg.enableSpaceTargets = asBool(v, key);
        else if (key == "enable_goal_focus") cfg.enableGoalFocus = asBool(v, key);
        else if (key == "space_grid_dx") cfg.spaceGridDx = asDouble(v, key);
        else if (key == "space_grid_dy") cfg.spaceGridDy = asDouble(v, key);
        else if (key == "min_space_clearance") cfg.minSpaceClearance = asDouble(v, key);
        else if (key == "space_window_forward") cfg.spaceWindowForward = asDouble(v, key);
        else if (key == "space_window_half_width") cfg.spaceWindowHalfWidth = asDouble(v, key);
        else if (key == "support_cone_cos") cfg.supportConeCos = asDouble(v, key);
        else if (key == "w_ball_distance") cfg.wBallDistance = asDouble(v, key);
        else if (key == "w_ball_motion") cfg.wBallMotion = asDouble(v, key);
        else if (key == "w_pass_likelihood") cfg.wPassLikelihood = asDouble(v, key);
        else if (key == "w_opponent_pressure") cfg.wOpponentPressure = asDouble(v, key);
        else if (key == "w_teammate_support") cfg.wTeammateSupport = asDouble(v, key);
        else if (key == "w_space_value") cfg.wSpaceValue = asDouble(v, key);
        else if (key == "w_goal_proximity") cfg.wGoalProximity = asDouble(v, key);
        else if (key == "w_role_prior") cfg.wRolePrior = asDouble(v, key);
        else if (key == "role_priors") cfg.rolePriors = asRolePriors(v);
        else if (key == "switch_penalty") cfg.switchPenalty = asDouble(v, key);
        else if (key == "persistence_bonus") cfg.persistenceBonus = asDouble(v, key);
        else if (key == "clamp_scores") cfg.clampScores = asBool(v, key);
        else if (key == "score_min") cfg.scoreMin = asDouble(v, key);
        else if (key == "score_max") cfg.scoreMax = asDouble(v, key);
        else throw std::invalid_argument("Unknown config option: " + key);
    }
    return cfg;
}

AlgoConfig loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::invalid_argument("Config file not found: " + path);
    }
    return configFromJson(Json::parse(file));
}

Json configToJson(const AlgoConfig& cfg) {
    Json j;
    j["top_k"] = cfg.topK;
    j["attack_direction"] = cfg.attackDirection;
    j["max_player_speed"] = cfg.maxPlayerSpeed;
    j["min_dt"] = cfg.minDt;
    j["teammate_radius"] = cfg.teammateRadius;
    j["opponent_radius"] = cfg.opponentRadius;
    j["enable_ball_focus"] = cfg.enableBallFocus;
    j["enable_marking_threats"] = cfg.enableMarkingThreats;
    j["enable_pass_targets"] = cfg.enablePassTargets;
    j["enable_space_targets"] = cfg.enableSpaceTargets;
    j["enable_goal_focus"] = cfg.enableGoalFocus;
    j["space_grid_dx"] = cfg.spaceGridDx;
    j["space_grid_dy"] = cfg.spaceGridDy;
    j["min_space_clearance"] = cfg.minSpaceClearance;
    j["space_window_forward"] = cfg.spaceWindowForward;
    j["space_window_half_width"] = cfg.spaceWindowHalfWidth;
    j["support_cone_cos"] = cfg.supportConeCos;
    j["w_ball_distance"] = cfg.wBallDistance;
    j["w_ball_motion"] = cfg.wBallMotion;
    j["w_pass_likelihood"] = cfg.wPassLikelihood;
    j["w_opponent_pressure"] = cfg.wOpponentPressure;
    j["w_teammate_support"] = cfg.wTeammateSupport;
    j["w_space_value"] = cfg.wSpaceValue;
    j["w_goal_proximity"] = cfg.wGoalProximity;
    j["w_role_prior"] = cfg.wRolePrior;
    j["role_priors"] = Json::array();
    for (auto& rp : cfg.rolePriors) {
        j["role_priors"].push_back({{"role", rp.role}, {"candidate", rp.candidate}, {"bonus", rp.bonus}});
    }
    j["switch_penalty"] = cfg.switchPenalty;
    j["persistence_bonus"] = cfg.persistenceBonus;
    j["clamp_scores"] = cfg.clampScores;
    j["score_min"] = cfg.scoreMin;
    j["score_max"] = cfg.scoreMax;
    return j;
}

} // namespace vp
