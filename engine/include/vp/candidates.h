#pragma once

#include "vp/config.h"
#include "vp/focus.h"
#include "vp/frame_graph.h"
#include <limits>
#include <string>
#include <vector>

namespace vp {

struct NearestOpponent {
    const GraphNode* node = nullptr;
    double distance = std::numeric_limits<double>::infinity();
};

struct SupportChoice {
    const GraphNode* node = nullptr;
    double score = -1e9;
};

struct SpaceChoice {
    bool found = false;
    Vec2 anchor;
    double value = -1e9;
    int sampled = 0;   // grid points visited, rejected ones included
};

// Nearest opposing player; first minimum in node order wins ties
NearestOpponent nearestOpponent(const FrameGraph& graph, const GraphNode& player);

// Teammate maximizing 2*ahead + 1*cone - 0.15*distance
SupportChoice bestSupportTeammate(const FrameGraph& graph, const GraphNode& player,
                                  const AlgoConfig& cfg);

// Sample points lo, lo+step, ... up to hi inclusive (within 1e-6).
// Positions are computed from the index, never accumulated. Throws
// std::invalid_argument past MAX_GRID_SAMPLES_PER_AXIS points.
std::vector<double> sampleAxis(double lo, double hi, double step);

// Forward grid search for the best open point; rejects points whose nearest
// opponent is closer than minSpaceClearance. Not found without opponents.
SpaceChoice bestOpenSpace(const FrameGraph& graph, const Pitch& pitch,
                          const GraphNode& player, const AlgoConfig& cfg);

// At most one candidate per kind, in the order BALL_NEARBY, OPP_PRESSURE,
// TEAM_SUPPORT, OPEN_SPACE, GOAL. Empty if the player is not in the graph.
std::vector<CandidateEvent> generateCandidates(const FrameGraph& graph, const Pitch& pitch,
                                               const std::string& playerId,
                                               const SummaryMap& summaries,
                                               const AlgoConfig& cfg);

} // namespace vp
