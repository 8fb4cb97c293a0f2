#pragma once

#include <string>
#include <vector>

namespace vp {

// Bonus applied when a player's role meets a candidate kind
struct RolePrior {
    std::string role;       // upper-case role label
    std::string candidate;  // candidate name
    double bonus = 0.0;
};

std::vector<RolePrior> defaultRolePriors();

// Upper bound on open-space grid points along one axis
constexpr int MAX_GRID_SAMPLES_PER_AXIS = 10000;

struct AlgoConfig {
    int topK = 1;               // ranked alternatives kept per recommendation
    int attackDirection = 1;    // +1 attacks +x, -1 attacks -x

    // Pseudo-time
    double maxPlayerSpeed = 8.0;  // nominal m/s, normalization only
    double minDt = 0.2;

    // Graph
    double teammateRadius = 12.0;
    double opponentRadius = 10.0;

    // Candidate generators
    bool enableBallFocus = true;
    bool enableMarkingThreats = true;
    bool enablePassTargets = true;
    bool enableSpaceTargets = true;
    bool enableGoalFocus = true;

    // Open-space grid search
    double spaceGridDx = 6.0;
    double spaceGridDy = 6.0;
    double minSpaceClearance = 4.0;
    double spaceWindowForward = 24.0;
    double spaceWindowHalfWidth = 18.0;

    // Support teammate forward cone
    double supportConeCos = 0.3;

    // Scoring weights (negative = closer is better)
    double wBallDistance = -1.0;
    double wBallMotion = 1.5;
    double wPassLikelihood = 3.0;
    double wOpponentPressure = 2.0;
    double wTeammateSupport = 0.8;
    double wSpaceValue = 1.2;
    double wGoalProximity = 2.5;
    double wRolePrior = 1.0;
    std::vector<RolePrior> rolePriors = defaultRolePriors();

    // Temporal smoothing
    double switchPenalty = 1.5;
    double persistenceBonus = 0.8;

    bool clampScores = true;
    double scoreMin = -10.0;
    double scoreMax = 10.0;

    double clamp(double score) const;
};

// Throws std::invalid_argument on values the pipeline cannot run with
void validateConfig(const AlgoConfig& cfg);

} // namespace vp
