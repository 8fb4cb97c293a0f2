#include "vp/frame_graph.h"
#include <stdexcept>

namespace vp {

void FrameGraph::addNode(GraphNode node) {
    index_[node.playerId] = nodes.size();
    nodes.push_back(std::move(node));
}

const GraphNode* FrameGraph::findNode(const std::string& playerId) const {
    auto it = index_.find(playerId);
    if (it == index_.end()) return nullptr;
    return &nodes[it->second];
}

Team PlayerDirectory::teamOf(const std::string& id) const {
    auto it = team.find(id);
    return it == team.end() ? Team::A : it->second;
}

std::string PlayerDirectory::roleOf(const std::string& id) const {
    auto it = role.find(id);
    return it == role.end() ? std::string() : it->second;
}

FrameGraph buildFrameGraph(const Frame& frame, double tRel,
                           const std::vector<Vec2>& velocities,
                           const PlayerDirectory& players, const AlgoConfig& cfg) {
    if (velocities.size() != frame.players.size()) {
        throw std::invalid_argument("Velocity count does not match players at frame " +
                                    std::to_string(frame.frameIdx));
    }

    FrameGraph g;
    g.frameIdx = frame.frameIdx;
    g.ballPos = frame.ballPos;
    g.tRel = tRel;

    for (size_t i = 0; i < frame.players.size(); ++i) {
        const PlayerPos& p = frame.players[i];
        g.addNode({p.id, players.teamOf(p.id), players.roleOf(p.id), p.pos, velocities[i]});
    }

    // Every ordered pair, so each edge appears once per direction
    size_t n = g.nodes.size();
    for (size_t a = 0; a < n; ++a) {
        const GraphNode& na = g.nodes[a];
        for (size_t b = 0; b < n; ++b) {
            if (a == b) continue;
            const GraphNode& nb = g.nodes[b];

            double d = na.pos.distanceTo(nb.pos);
            if (na.team == nb.team) {
                if (d <= cfg.teammateRadius) {
                    g.edges.push_back({na.playerId, nb.playerId, EdgeType::TEAM_NEAR, d, {}});
                }
            } else if (d <= cfg.opponentRadius) {
                g.edges.push_back({na.playerId, nb.playerId, EdgeType::OPP_NEAR, d, {}});
            }
        }
    }

    for (auto& node : g.nodes) {
        double d = node.pos.distanceTo(frame.ballPos);
        g.edges.push_back({node.playerId, node.playerId, EdgeType::BALL_LINK, d, frame.ballPos});
    }

    return g;
}

std::vector<FrameGraph> buildFrameGraphs(const std::vector<Frame>& frames,
                                         const std::vector<double>& tRel,
                                         const std::vector<std::vector<Vec2>>& velocities,
                                         const PlayerDirectory& players,
                                         const AlgoConfig& cfg) {
    if (tRel.size() != frames.size() || velocities.size() != frames.size()) {
        throw std::invalid_argument("Pseudo-time and velocities must cover every frame");
    }

    std::vector<FrameGraph> graphs;
    graphs.reserve(frames.size());
    for (size_t i = 0; i < frames.size(); ++i) {
        graphs.push_back(buildFrameGraph(frames[i], tRel[i], velocities[i], players, cfg));
    }
    return graphs;
}

SummaryMap summarizePressureSupport(const FrameGraph& graph) {
    SummaryMap out;
    for (auto& node : graph.nodes) {
        PlayerSummary s;
        s.ballD = node.pos.distanceTo(graph.ballPos);
        out[node.playerId] = s;
    }

    for (auto& e : graph.edges) {
        auto it = out.find(e.src);
        if (it == out.end()) continue;
        PlayerSummary& s = it->second;

        switch (e.type) {
            case EdgeType::OPP_NEAR:
                s.pressureN += 1.0;
                if (e.distance < s.minOppD) s.minOppD = e.distance;
                break;
            case EdgeType::TEAM_NEAR:
                s.supportN += 1.0;
                if (e.distance < s.minTeamD) s.minTeamD = e.distance;
                break;
            case EdgeType::BALL_LINK:
                s.ballD = e.distance;
                break;
        }
    }

    return out;
}

} // namespace vp
