#pragma once

#include "vp/config.h"
#include "vp/enums.h"
#include "vp/tactic.h"
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace vp {

struct GraphNode {
    std::string playerId;
    Team team = Team::A;
    std::string role;
    Vec2 pos;
    Vec2 vel;
};

struct GraphEdge {
    std::string src;
    std::string dst;
    EdgeType type = EdgeType::TEAM_NEAR;
    double distance = 0.0;  // pair distance, or ball distance for BALL_LINK
    Vec2 ballPos;           // BALL_LINK only
};

class FrameGraph {
public:
    int frameIdx = 0;
    std::vector<GraphNode> nodes;  // frame-0 player order
    std::vector<GraphEdge> edges;
    Vec2 ballPos;
    double tRel = 0.0;

    void addNode(GraphNode node);

    // nullptr if the player is not in this frame
    const GraphNode* findNode(const std::string& playerId) const;

private:
    std::unordered_map<std::string, size_t> index_;
};

// Per-player lookups supplied by tactic metadata
struct PlayerDirectory {
    std::unordered_map<std::string, Team> team;
    std::unordered_map<std::string, std::string> role;

    // Unlisted players default to team A, empty role
    Team teamOf(const std::string& id) const;
    std::string roleOf(const std::string& id) const;
};

FrameGraph buildFrameGraph(const Frame& frame, double tRel,
                           const std::vector<Vec2>& velocities,
                           const PlayerDirectory& players, const AlgoConfig& cfg);

std::vector<FrameGraph> buildFrameGraphs(const std::vector<Frame>& frames,
                                         const std::vector<double>& tRel,
                                         const std::vector<std::vector<Vec2>>& velocities,
                                         const PlayerDirectory& players,
                                         const AlgoConfig& cfg);

struct PlayerSummary {
    double pressureN = 0.0;   // outgoing OPP_NEAR edges
    double minOppD = std::numeric_limits<double>::infinity();
    double supportN = 0.0;    // outgoing TEAM_NEAR edges
    double minTeamD = std::numeric_limits<double>::infinity();
    double ballD = 0.0;
};

using SummaryMap = std::unordered_map<std::string, PlayerSummary>;

SummaryMap summarizePressureSupport(const FrameGraph& graph);

} // namespace vp
