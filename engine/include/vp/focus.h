#pragma once

#include "vp/enums.h"
#include "vp/vec2.h"
#include <map>
#include <string>
#include <vector>

namespace vp {

// What a player should be cued to look at.
// BALL: ball position, PLAYER: a player's position,
// ZONE: a point in space, GOAL: the attacked goal center.
struct FocusTarget {
    FocusTargetType type = FocusTargetType::BALL;
    Vec2 anchor;
    std::string targetPlayerId;  // empty unless type == PLAYER
    std::string tag;             // short debug/UI label

    bool operator==(const FocusTarget& o) const {
        return type == o.type && anchor == o.anchor &&
               targetPlayerId == o.targetPlayerId && tag == o.tag;
    }
    bool operator!=(const FocusTarget& o) const { return !(*this == o); }
};

// Same type, same target player, anchors within tol on both axes.
// Used for frame-to-frame continuity.
bool sameFocus(const FocusTarget& a, const FocusTarget& b, double tol = 1e-3);

// Unscored proposal for one player at one frame
struct CandidateEvent {
    std::string name;
    FocusTarget focus;
    std::map<std::string, double> features;
    std::map<std::string, std::string> meta;

    bool operator==(const CandidateEvent& o) const {
        return name == o.name && focus == o.focus &&
               features == o.features && meta == o.meta;
    }
};

struct ScoredEvent {
    std::string name;
    double score = 0.0;
    FocusTarget focus;
    std::map<std::string, double> features;
    std::vector<std::string> reasons;  // in the order terms were applied
    std::map<std::string, std::string> meta;

    bool operator==(const ScoredEvent& o) const {
        return name == o.name && score == o.score && focus == o.focus &&
               features == o.features && reasons == o.reasons && meta == o.meta;
    }
    bool operator!=(const ScoredEvent& o) const { return !(*this == o); }
};

struct PlayerFocusRecommendation {
    std::string playerId;
    int frameIdx = 0;
    double tRel = 0.0;
    FocusTarget primary;
    double primaryScore = 0.0;
    std::vector<std::string> rationale;
    std::vector<ScoredEvent> topK;

    bool operator==(const PlayerFocusRecommendation& o) const {
        return playerId == o.playerId && frameIdx == o.frameIdx && tRel == o.tRel &&
               primary == o.primary && primaryScore == o.primaryScore &&
               rationale == o.rationale && topK == o.topK;
    }
};

} // namespace vp
