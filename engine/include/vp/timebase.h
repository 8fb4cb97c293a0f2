#pragma once

#include "vp/config.h"
#include "vp/tactic.h"
#include <vector>

namespace vp {

struct PseudoTime {
    std::vector<double> dt;    // dt[0] = 0
    std::vector<double> tRel;  // tRel[0] = 0
};

// Keyframes carry no timestamps. For i > 0:
//   dt_i = max(minDt, max_p |x_p(i) - x_p(i-1)| / maxPlayerSpeed)
//   tRel_i = tRel_{i-1} + dt_i
PseudoTime inferPseudoTime(const std::vector<Frame>& frames, const AlgoConfig& cfg);

// Finite-difference velocities indexed [frame][player], players in frame order.
// Frame 0 is all zero.
std::vector<std::vector<Vec2>> computeVelocities(const std::vector<Frame>& frames,
                                                 const std::vector<double>& dt);

} // namespace vp
