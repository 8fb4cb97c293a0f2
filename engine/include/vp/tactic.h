#pragma once

#include "vp/enums.h"
#include "vp/vec2.h"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace vp {

struct TeamMeta {
    std::string name;
    std::string color;  // hex string
};

struct PlayerMeta {
    std::string id;
    Team team = Team::A;
    std::string label;  // jersey number
    std::string role;   // GK, CB, ST, ...
};

struct TacticMeta {
    std::string tacticId;
    std::string title;
    Pitch pitch;
    std::map<Team, TeamMeta> teams;
    std::map<std::string, PlayerMeta> players;  // by player id
    bool hasLastModified = false;
    int64_t lastModified = 0;

    // nullptr if the player is not listed
    const PlayerMeta* findPlayer(const std::string& id) const;
};

struct PlayerPos {
    std::string id;
    Vec2 pos;
};

struct RawBall {
    double x = 0.0;
    double y = 0.0;
    bool hasX = false;
    bool hasY = false;
    std::string ownerId;  // empty = no owner

    bool isResolved() const { return hasX && hasY; }

    static RawBall at(double x, double y, std::string owner = "") {
        return RawBall{x, y, true, true, std::move(owner)};
    }

    static RawBall unknown() {
        return RawBall{};
    }
};

// A keyframe as authored. Its id is opaque; list order defines the frame index.
struct RawFrame {
    std::string id;
    std::vector<PlayerPos> playerPos;  // may omit players
    RawBall ball;
    std::string note;
};

// Canonical frame: exactly the frame-0 player set, in frame-0 order,
// with the ball always resolved.
struct Frame {
    int frameIdx = 0;
    std::vector<PlayerPos> players;
    Vec2 ballPos;
    std::string ballOwnerId;
    std::string note;

    // nullptr if id is not in the frame
    const Vec2* findPlayer(const std::string& id) const;
};

struct Tactic {
    TacticMeta meta;
    std::vector<RawFrame> frames;
};

} // namespace vp
