#include "vp/policy.h"
#include "vp/candidates.h"
#include "vp/canonicalize.h"
#include "vp/scoring.h"
#include "vp/smoothing.h"
#include "vp/timebase.h"
#include <algorithm>
#include <stdexcept>

namespace vp {

const std::vector<PlayerFocusRecommendation>& FocusPlan::forPlayer(const std::string& id) const {
    auto it = byPlayer.find(id);
    if (it == byPlayer.end()) {
        throw std::out_of_range("No recommendations for player " + id);
    }
    return it->second;
}

PlayerFocusRecommendation fallbackRecommendation(const std::string& playerId,
                                                 const Frame& frame, double tRel) {
    PlayerFocusRecommendation rec;
    rec.playerId = playerId;
    rec.frameIdx = frame.frameIdx;
    rec.tRel = tRel;
    rec.primary = {FocusTargetType::BALL, frame.ballPos, "", "ball"};
    rec.primaryScore = 0.0;
    rec.rationale = {"fallback_ball"};
    return rec;
}

FocusPlan runBaselinePolicy(const std::vector<Frame>& frames, const Pitch& pitch,
                            const PlayerDirectory& players, const AlgoConfig& cfg) {
    validateConfig(cfg);

    PseudoTime pt = inferPseudoTime(frames, cfg);
    auto velocities = computeVelocities(frames, pt.dt);
    std::vector<FrameGraph> graphs = buildFrameGraphs(frames, pt.tRel, velocities, players, cfg);

    FocusPlan plan;
    plan.numFrames = static_cast<int>(frames.size());
    for (auto& p : frames[0].players) {
        plan.playerIds.push_back(p.id);
    }

    // [player][frame] -> ranked events
    std::vector<RankedFrames> scored(plan.playerIds.size(), RankedFrames(frames.size()));

    for (size_t f = 0; f < graphs.size(); ++f) {
        const FrameGraph& g = graphs[f];
        SummaryMap summaries = summarizePressureSupport(g);
        for (size_t p = 0; p < plan.playerIds.size(); ++p) {
            const std::string& pid = plan.playerIds[p];
            auto candidates = generateCandidates(g, pitch, pid, summaries, cfg);
            scored[p][f] = scoreCandidates(g, pid, candidates, summaries, cfg);
        }
    }

    size_t keep = static_cast<size_t>(std::max(1, cfg.topK));

    for (size_t p = 0; p < plan.playerIds.size(); ++p) {
        const std::string& pid = plan.playerIds[p];
        RankedFrames smoothed = applyTemporalSmoothing(scored[p], cfg);

        std::vector<PlayerFocusRecommendation>& recs = plan.byPlayer[pid];
        recs.reserve(frames.size());
        for (size_t f = 0; f < frames.size(); ++f) {
            const std::vector<ScoredEvent>& ranked = smoothed[f];
            if (ranked.empty()) {
                recs.push_back(fallbackRecommendation(pid, frames[f], pt.tRel[f]));
                continue;
            }

            PlayerFocusRecommendation rec;
            rec.playerId = pid;
            rec.frameIdx = frames[f].frameIdx;
            rec.tRel = pt.tRel[f];
            rec.primary = ranked.front().focus;
            rec.primaryScore = ranked.front().score;
            rec.rationale = ranked.front().reasons;
            rec.topK.assign(ranked.begin(), ranked.begin() + std::min(keep, ranked.size()));
            recs.push_back(std::move(rec));
        }
    }

    return plan;
}

FocusPlan recommendPlayerFocus(const Tactic& tactic, const AlgoConfig& cfg) {
    CanonicalFrames canon = canonicalizeFrames(tactic.frames);

    PlayerDirectory players;
    for (auto& pid : canon.playerIds) {
        const PlayerMeta* meta = tactic.meta.findPlayer(pid);
        players.team[pid] = meta ? meta->team : Team::A;
        players.role[pid] = meta ? meta->role : std::string();
    }

    return runBaselinePolicy(canon.frames, tactic.meta.pitch, players, cfg);
}

} // namespace vp
