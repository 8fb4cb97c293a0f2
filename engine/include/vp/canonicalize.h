#pragma once

#include "vp/tactic.h"
#include <string>
#include <vector>

namespace vp {

struct CanonicalFrames {
    std::vector<Frame> frames;
    std::vector<std::string> playerIds;  // frame-0 player set, in order
};

// Enforce the frame-0 player set on every frame.
// Missing players and a missing ball are forward-filled from the last frame
// that supplied them; players not in frame 0 are dropped.
// Throws std::invalid_argument for an empty list, a duplicate frame-0 id,
// a player with nothing to fill from, or a ball that was never resolved.
CanonicalFrames canonicalizeFrames(const std::vector<RawFrame>& rawFrames);

} // namespace vp
