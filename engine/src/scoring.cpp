#include "vp/scoring.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace vp {

namespace {

std::string formatReason(const char* fmt, double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), fmt, value);
    return buf;
}

std::string normalizeRole(const std::string& role) {
    size_t begin = role.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = role.find_last_not_of(" \t\r\n");
    std::string out = role.substr(begin, end - begin + 1);
    for (auto& ch : out) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return out;
}

double featureOr(const CandidateEvent& c, const char* key, double fallback) {
    auto it = c.features.find(key);
    return it == c.features.end() ? fallback : it->second;
}

} // anonymous namespace

double rolePrior(const std::vector<RolePrior>& table, const std::string& role,
                 const std::string& candidateName) {
    std::string r = normalizeRole(role);
    if (r.empty()) return 0.0;
    for (auto& entry : table) {
        if (entry.candidate == candidateName && normalizeRole(entry.role) == r) {
            return entry.bonus;
        }
    }
    return 0.0;
}

ScoredEvent scoreCandidate(const FrameGraph& graph, const GraphNode& player,
                           const CandidateEvent& cand, const PlayerSummary& summary,
                           const AlgoConfig& cfg) {
    double s = 0.0;
    std::vector<std::string> reasons;
    Vec2 pos = player.pos;
    double ballD = summary.ballD;

    double prior = rolePrior(cfg.rolePriors, player.role, cand.name);
    if (prior != 0.0) {
        s += cfg.wRolePrior * prior;
        reasons.push_back("role_prior(" + player.role + ")=" + formatReason("%+.2f", prior));
    }

    if (cand.name == candidate::BALL_NEARBY) {
        // wBallDistance is negative: nearer ball scores higher
        s += cfg.wBallDistance * ballD;
        reasons.push_back(formatReason("ball_d=%.2f", ballD));

        if (inForwardCone(pos, graph.ballPos, cfg.attackDirection, 0.0)) {
            s += cfg.wBallMotion * 0.6;
            reasons.push_back("ball_in_forward_half");
        }
    } else if (cand.name == candidate::OPP_PRESSURE) {
        double oppD = featureOr(cand, "opp_d", summary.minOppD);
        if (std::isfinite(oppD)) {
            s += cfg.wOpponentPressure * (1.0 / std::max(oppD, 0.5));
            reasons.push_back(formatReason("opp_d=%.2f", oppD));
        }
        s += cfg.wOpponentPressure * 0.2 * summary.pressureN;
        reasons.push_back(formatReason("pressure_n=%.0f", summary.pressureN));
    } else if (cand.name == candidate::TEAM_SUPPORT) {
        double mateScore = featureOr(cand, "mate_score", 0.0);
        s += cfg.wTeammateSupport * mateScore;
        reasons.push_back(formatReason("mate_score=%.2f", mateScore));
        s += cfg.wTeammateSupport * 0.1 * summary.supportN;
        reasons.push_back(formatReason("support_n=%.0f", summary.supportN));

        // Ball near the player makes a pass to support more likely
        if (ballD < 18.0) {
            s += cfg.wPassLikelihood * (1.0 - ballD / 18.0);
            reasons.push_back("ball_close_boost_for_pass");
        }
    } else if (cand.name == candidate::OPEN_SPACE) {
        double spaceValue = featureOr(cand, "space_value", 0.0);
        s += cfg.wSpaceValue * spaceValue;
        reasons.push_back(formatReason("space_value=%.2f", spaceValue));

        if (isAhead(cand.focus.anchor, pos, cfg.attackDirection)) {
            s += cfg.wSpaceValue * 0.5;
            reasons.push_back("space_ahead_bonus");
        }
    } else if (cand.name == candidate::GOAL) {
        double goalD = featureOr(cand, "goal_d", pos.distanceTo(cand.focus.anchor));
        s += cfg.wGoalProximity * (1.0 / std::max(goalD, 1.0));
        reasons.push_back(formatReason("goal_d=%.2f", goalD));

        // Ball within 25 units stands in for an attacking phase
        if (ballD < 25.0) {
            s += cfg.wGoalProximity * 0.4;
            reasons.push_back("ball_close_goal_bonus");
        }
    } else {
        reasons.push_back("unknown_candidate");
    }

    ScoredEvent ev;
    ev.name = cand.name;
    ev.score = cfg.clamp(s);
    ev.focus = cand.focus;
    ev.features = cand.features;
    ev.reasons = std::move(reasons);
    ev.meta = cand.meta;
    return ev;
}

void rankByScore(std::vector<ScoredEvent>& events) {
    std::stable_sort(events.begin(), events.end(),
                     [](const ScoredEvent& a, const ScoredEvent& b) { return a.score > b.score; });
}

std::vector<ScoredEvent> scoreCandidates(const FrameGraph& graph, const std::string& playerId,
                                         const std::vector<CandidateEvent>& candidates,
                                         const SummaryMap& summaries, const AlgoConfig& cfg) {
    std::vector<ScoredEvent> scored;
    const GraphNode* node = graph.findNode(playerId);
    if (!node) return scored;

    PlayerSummary summary;
    auto it = summaries.find(playerId);
    if (it != summaries.end()) summary = it->second;

    scored.reserve(candidates.size());
    for (auto& c : candidates) {
        scored.push_back(scoreCandidate(graph, *node, c, summary, cfg));
    }

    rankByScore(scored);
    return scored;
}

} // namespace vp
