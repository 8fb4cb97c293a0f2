#include "vp/config.h"
#include <algorithm>
#include <stdexcept>

namespace vp {

std::vector<RolePrior> defaultRolePriors() {
    // Defenders and keepers watch pressure, forwards watch goal and space,
    // central midfielders watch support.
    return {
        {"GK", "OPP_PRESSURE", 0.8},
        {"CB", "OPP_PRESSURE", 0.8},
        {"LB", "OPP_PRESSURE", 0.8},
        {"RB", "OPP_PRESSURE", 0.8},
        {"ST", "OPP_PRESSURE", 0.2},
        {"LW", "OPP_PRESSURE", 0.2},
        {"RW", "OPP_PRESSURE", 0.2},
        {"CM", "TEAM_SUPPORT", 0.7},
        {"CDM", "TEAM_SUPPORT", 0.7},
        {"ST", "OPEN_SPACE", 0.5},
        {"LW", "OPEN_SPACE", 0.5},
        {"RW", "OPEN_SPACE", 0.5},
        {"CM", "OPEN_SPACE", 0.5},
        {"ST", "GOAL", 0.8},
        {"LW", "GOAL", 0.8},
        {"RW", "GOAL", 0.8},
    };
}

double AlgoConfig::clamp(double score) const {
    if (!clampScores) return score;
    return std::max(scoreMin, std::min(scoreMax, score));
}

void validateConfig(const AlgoConfig& cfg) {
    if (cfg.attackDirection != 1 && cfg.attackDirection != -1) {
        throw std::invalid_argument("attack_direction must be +1 or -1, got " +
                                    std::to_string(cfg.attackDirection));
    }
    if (cfg.maxPlayerSpeed <= 0.0) {
        throw std::invalid_argument("max_player_speed must be positive");
    }
    if (cfg.spaceGridDx <= 0.0 || cfg.spaceGridDy <= 0.0) {
        throw std::invalid_argument("space_grid_dx and space_grid_dy must be positive");
    }
    if (cfg.spaceWindowForward / cfg.spaceGridDx + 1.0 > MAX_GRID_SAMPLES_PER_AXIS ||
        2.0 * cfg.spaceWindowHalfWidth / cfg.spaceGridDy + 1.0 > MAX_GRID_SAMPLES_PER_AXIS) {
        throw std::invalid_argument("space grid step too small: more than " +
                                    std::to_string(MAX_GRID_SAMPLES_PER_AXIS) +
                                    " samples per axis");
    }
    if (cfg.clampScores && cfg.scoreMin > cfg.scoreMax) {
        throw std::invalid_argument("score_min must not exceed score_max");
    }
}

} // namespace vp
