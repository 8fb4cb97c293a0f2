#include "vp/canonicalize.h"
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace vp {

CanonicalFrames canonicalizeFrames(const std::vector<RawFrame>& rawFrames) {
    if (rawFrames.empty()) {
        throw std::invalid_argument("No frames provided");
    }

    CanonicalFrames out;
    std::unordered_set<std::string> seen;
    for (auto& p : rawFrames[0].playerPos) {
        if (!seen.insert(p.id).second) {
            throw std::invalid_argument("Duplicate player " + p.id + " at frame 0");
        }
        out.playerIds.push_back(p.id);
    }

    std::unordered_map<std::string, Vec2> lastPos;
    bool haveBall = false;
    Vec2 lastBall;
    std::string lastOwner;

    out.frames.reserve(rawFrames.size());
    for (size_t idx = 0; idx < rawFrames.size(); ++idx) {
        const RawFrame& rf = rawFrames[idx];

        std::unordered_map<std::string, Vec2> supplied;
        for (auto& p : rf.playerPos) {
            supplied[p.id] = p.pos;
        }

        Frame frame;
        frame.frameIdx = static_cast<int>(idx);
        frame.note = rf.note;
        frame.players.reserve(out.playerIds.size());

        for (auto& pid : out.playerIds) {
            auto it = supplied.find(pid);
            if (it != supplied.end()) {
                lastPos[pid] = it->second;
                frame.players.push_back({pid, it->second});
                continue;
            }
            auto last = lastPos.find(pid);
            if (last == lastPos.end()) {
                throw std::invalid_argument("Player " + pid + " missing at frame " +
                                            std::to_string(idx) +
                                            " and no previous position to fill");
            }
            frame.players.push_back({pid, last->second});
        }

        if (rf.ball.isResolved()) {
            lastBall = {rf.ball.x, rf.ball.y};
            lastOwner = rf.ball.ownerId;
            haveBall = true;
        } else if (!haveBall) {
            throw std::invalid_argument("Ball position missing at frame " +
                                        std::to_string(idx) + " and cannot be inferred");
        }
        frame.ballPos = lastBall;
        frame.ballOwnerId = lastOwner;

        out.frames.push_back(std::move(frame));
    }

    return out;
}

} // namespace vp
