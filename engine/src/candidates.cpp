#include "vp/candidates.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace vp {

namespace {

// Distance from a point to the nearest player not on `team`
double clearance(const FrameGraph& graph, Vec2 point, Team team) {
    double best = std::numeric_limits<double>::infinity();
    for (auto& n : graph.nodes) {
        if (n.team == team) continue;
        double d = point.distanceTo(n.pos);
        if (d < best) best = d;
    }
    return best;
}

bool hasOpponent(const FrameGraph& graph, Team team) {
    for (auto& n : graph.nodes) {
        if (n.team != team) return true;
    }
    return false;
}

} // anonymous namespace

NearestOpponent nearestOpponent(const FrameGraph& graph, const GraphNode& player) {
    NearestOpponent best;
    for (auto& n : graph.nodes) {
        if (n.playerId == player.playerId || n.team == player.team) continue;
        double d = player.pos.distanceTo(n.pos);
        if (d < best.distance) {
            best.distance = d;
            best.node = &n;
        }
    }
    return best;
}

SupportChoice bestSupportTeammate(const FrameGraph& graph, const GraphNode& player,
                                  const AlgoConfig& cfg) {
    SupportChoice best;
    for (auto& n : graph.nodes) {
        if (n.playerId == player.playerId || n.team != player.team) continue;

        double d = player.pos.distanceTo(n.pos);
        double ahead = isAhead(n.pos, player.pos, cfg.attackDirection) ? 1.0 : 0.0;
        double cone = inForwardCone(player.pos, n.pos, cfg.attackDirection,
                                    cfg.supportConeCos) ? 1.0 : 0.0;

        double score = 2.0 * ahead + 1.0 * cone - 0.15 * d;
        if (score > best.score) {
            best.score = score;
            best.node = &n;
        }
    }
    return best;
}

std::vector<double> sampleAxis(double lo, double hi, double step) {
    std::vector<double> out;
    if (step <= 0.0 || hi < lo - 1e-6) return out;

    double steps = std::floor((hi - lo) / step + 1e-6);
    if (!(steps + 1.0 <= MAX_GRID_SAMPLES_PER_AXIS)) {
        throw std::invalid_argument("Grid step " + std::to_string(step) + " over [" +
                                    std::to_string(lo) + ", " + std::to_string(hi) +
                                    "] exceeds " + std::to_string(MAX_GRID_SAMPLES_PER_AXIS) +
                                    " samples");
    }
    int count = static_cast<int>(steps) + 1;
    out.reserve(count);
    for (int i = 0; i < count; ++i) {
        out.push_back(lo + i * step);
    }
    return out;
}

SpaceChoice bestOpenSpace(const FrameGraph& graph, const Pitch& pitch,
                          const GraphNode& player, const AlgoConfig& cfg) {
    SpaceChoice best;
    if (!hasOpponent(graph, player.team)) return best;

    Vec2 pos = player.pos;
    double reach = cfg.spaceWindowForward;
    double x0, x1;
    if (cfg.attackDirection > 0) {
        x0 = pos.x;
        x1 = std::min(pitch.length, pos.x + reach);
    } else {
        x0 = std::max(0.0, pos.x - reach);
        x1 = pos.x;
    }
    double y0 = std::max(0.0, pos.y - cfg.spaceWindowHalfWidth);
    double y1 = std::min(pitch.width, pos.y + cfg.spaceWindowHalfWidth);

    std::vector<double> ys = sampleAxis(y0, y1, cfg.spaceGridDy);
    for (double x : sampleAxis(x0, x1, cfg.spaceGridDx)) {
        for (double y : ys) {
            Vec2 anchor{x, y};
            ++best.sampled;

            double minOpp = clearance(graph, anchor, player.team);
            if (minOpp < cfg.minSpaceClearance) continue;

            double progress = anchor.x / pitch.length;
            if (cfg.attackDirection < 0) progress = 1.0 - progress;

            double value = 1.5 * minOpp + 8.0 * progress - 0.25 * anchor.distanceTo(pos);
            if (value > best.value) {
                best.value = value;
                best.anchor = anchor;
                best.found = true;
            }
        }
    }
    return best;
}

std::vector<CandidateEvent> generateCandidates(const FrameGraph& graph, const Pitch& pitch,
                                               const std::string& playerId,
                                               const SummaryMap& summaries,
                                               const AlgoConfig& cfg) {
    std::vector<CandidateEvent> out;
    const GraphNode* node = graph.findNode(playerId);
    if (!node) return out;

    PlayerSummary summary;
    auto sit = summaries.find(playerId);
    if (sit != summaries.end()) summary = sit->second;

    if (cfg.enableBallFocus) {
        CandidateEvent c;
        c.name = candidate::BALL_NEARBY;
        c.focus = {FocusTargetType::BALL, graph.ballPos, "", "ball"};
        c.features["ball_d"] = summary.ballD;
        out.push_back(std::move(c));
    }

    // Only an opponent inside opponentRadius exerts pressure
    if (cfg.enableMarkingThreats) {
        NearestOpponent opp = nearestOpponent(graph, *node);
        if (opp.node && opp.distance <= cfg.opponentRadius) {
            CandidateEvent c;
            c.name = candidate::OPP_PRESSURE;
            c.focus = {FocusTargetType::PLAYER, opp.node->pos, opp.node->playerId, "press"};
            c.features["opp_d"] = opp.distance;
            c.features["pressure_n"] = summary.pressureN;
            c.meta["opponent_id"] = opp.node->playerId;
            out.push_back(std::move(c));
        }
    }

    if (cfg.enablePassTargets) {
        SupportChoice mate = bestSupportTeammate(graph, *node, cfg);
        if (mate.node) {
            CandidateEvent c;
            c.name = candidate::TEAM_SUPPORT;
            c.focus = {FocusTargetType::PLAYER, mate.node->pos, mate.node->playerId, "support"};
            c.features["mate_score"] = mate.score;
            c.features["support_n"] = summary.supportN;
            c.meta["teammate_id"] = mate.node->playerId;
            out.push_back(std::move(c));
        }
    }

    if (cfg.enableSpaceTargets) {
        SpaceChoice space = bestOpenSpace(graph, pitch, *node, cfg);
        if (space.found) {
            CandidateEvent c;
            c.name = candidate::OPEN_SPACE;
            c.focus = {FocusTargetType::ZONE, space.anchor, "", "space"};
            c.features["space_value"] = space.value;
            out.push_back(std::move(c));
        }
    }

    if (cfg.enableGoalFocus) {
        Vec2 goal = attackingGoalCenter(pitch, cfg.attackDirection);
        CandidateEvent c;
        c.name = candidate::GOAL;
        c.focus = {FocusTargetType::GOAL, goal, "", "goal"};
        c.features["goal_d"] = node->pos.distanceTo(goal);
        out.push_back(std::move(c));
    }

    return out;
}

} // namespace vp
