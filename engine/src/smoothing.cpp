#include "vp/smoothing.h"
#include "vp/scoring.h"

namespace vp {

RankedFrames applyTemporalSmoothing(const RankedFrames& scoredByFrame, const AlgoConfig& cfg) {
    RankedFrames out;
    out.reserve(scoredByFrame.size());

    bool havePrev = false;
    FocusTarget prevPrimary;

    for (auto& events : scoredByFrame) {
        if (events.empty()) {
            out.emplace_back();
            continue;
        }

        if (!havePrev) {
            out.push_back(events);
            prevPrimary = events.front().focus;
            havePrev = true;
            continue;
        }

        std::vector<ScoredEvent> adjusted;
        adjusted.reserve(events.size());
        for (auto& ev : events) {
            ScoredEvent next = ev;
            if (sameFocus(ev.focus, prevPrimary)) {
                next.score = ev.score + cfg.persistenceBonus;
                next.reasons.push_back("persist_bonus");
            } else {
                next.score = ev.score - cfg.switchPenalty;
                next.reasons.push_back("switch_penalty");
            }
            adjusted.push_back(std::move(next));
        }

        // Rank before clamping so scores pinned at a bound keep the smoothed order
        rankByScore(adjusted);
        for (auto& ev : adjusted) {
            ev.score = cfg.clamp(ev.score);
        }
        prevPrimary = adjusted.front().focus;
        out.push_back(std::move(adjusted));
    }

    return out;
}

} // namespace vp
