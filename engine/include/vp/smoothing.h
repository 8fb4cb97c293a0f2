#pragma once

#include "vp/config.h"
#include "vp/focus.h"
#include <vector>

namespace vp {

using RankedFrames = std::vector<std::vector<ScoredEvent>>;  // [frame] -> ranked events

// Hysteresis over one player's frames. The previous frame's top event sets
// the reference: matching targets gain persistenceBonus, others lose
// switchPenalty, then each frame is re-ranked and its scores clamped. The
// first non-empty frame passes through unchanged; empty frames stay empty and
// keep the reference.
// Returns new events; the input is not modified.
RankedFrames applyTemporalSmoothing(const RankedFrames& scoredByFrame, const AlgoConfig& cfg);

} // namespace vp
