#pragma once

#include "vp/config.h"
#include "vp/focus.h"
#include "vp/frame_graph.h"
#include "vp/tactic.h"
#include <map>
#include <string>
#include <vector>

namespace vp {

struct FocusPlan {
    std::vector<std::string> playerIds;  // frame-0 order
    std::map<std::string, std::vector<PlayerFocusRecommendation>> byPlayer;
    int numFrames = 0;

    const std::vector<PlayerFocusRecommendation>& forPlayer(const std::string& id) const;
};

// Fallback when a player has no candidates at a frame
PlayerFocusRecommendation fallbackRecommendation(const std::string& playerId,
                                                 const Frame& frame, double tRel);

// Pseudo-time, graphs, candidates, scoring and smoothing over canonical frames.
// One recommendation per player per frame.
FocusPlan runBaselinePolicy(const std::vector<Frame>& frames, const Pitch& pitch,
                            const PlayerDirectory& players, const AlgoConfig& cfg);

// Canonicalize a loaded tactic and run the baseline
FocusPlan recommendPlayerFocus(const Tactic& tactic, const AlgoConfig& cfg);

} // namespace vp
