#include "vp/enums.h"
#include <stdexcept>

namespace vp {

const char* teamName(Team team) {
    return team == Team::A ? "A" : "B";
}

Team parseTeam(const std::string& name) {
    if (name == "A") return Team::A;
    if (name == "B") return Team::B;
    throw std::invalid_argument("Unknown team '" + name + "' (expected A or B)");
}

const char* focusTargetTypeName(FocusTargetType type) {
    switch (type) {
        case FocusTargetType::BALL:   return "BALL";
        case FocusTargetType::PLAYER: return "PLAYER";
        case FocusTargetType::ZONE:   return "ZONE";
        case FocusTargetType::GOAL:   return "GOAL";
    }
    return "BALL";
}

const char* edgeTypeName(EdgeType type) {
    switch (type) {
        case EdgeType::TEAM_NEAR: return "TEAM_NEAR";
        case EdgeType::OPP_NEAR:  return "OPP_NEAR";
        case EdgeType::BALL_LINK: return "BALL_LINK";
    }
    return "TEAM_NEAR";
}

} // namespace vp
