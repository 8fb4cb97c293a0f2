#include "vp/timebase.h"
#include <algorithm>
#include <stdexcept>

namespace vp {

PseudoTime inferPseudoTime(const std::vector<Frame>& frames, const AlgoConfig& cfg) {
    if (frames.empty()) {
        throw std::invalid_argument("No frames provided");
    }

    size_t n = frames.size();
    PseudoTime pt;
    pt.dt.assign(n, 0.0);
    pt.tRel.assign(n, 0.0);

    double speed = std::max(cfg.maxPlayerSpeed, 1e-6);
    for (size_t i = 1; i < n; ++i) {
        const Frame& prev = frames[i - 1];
        const Frame& cur = frames[i];

        double dmax = 0.0;
        for (size_t p = 0; p < cur.players.size(); ++p) {
            double d = cur.players[p].pos.distanceTo(prev.players[p].pos);
            if (d > dmax) dmax = d;
        }

        double dt = std::max(cfg.minDt, dmax / speed);
        pt.dt[i] = dt;
        pt.tRel[i] = pt.tRel[i - 1] + dt;
    }

    return pt;
}

std::vector<std::vector<Vec2>> computeVelocities(const std::vector<Frame>& frames,
                                                 const std::vector<double>& dt) {
    if (frames.size() != dt.size()) {
        throw std::invalid_argument("frames and dt must have the same length");
    }

    std::vector<std::vector<Vec2>> vel(frames.size());
    if (frames.empty()) return vel;

    vel[0].assign(frames[0].players.size(), Vec2{});

    for (size_t i = 1; i < frames.size(); ++i) {
        const Frame& prev = frames[i - 1];
        const Frame& cur = frames[i];
        double denom = std::max(dt[i], 1e-6);

        vel[i].reserve(cur.players.size());
        for (size_t p = 0; p < cur.players.size(); ++p) {
            vel[i].push_back((cur.players[p].pos - prev.players[p].pos) * (1.0 / denom));
        }
    }

    return vel;
}

} // namespace vp
