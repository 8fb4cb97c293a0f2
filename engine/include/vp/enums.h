#pragma once

#include <cstdint>
#include <string>

namespace vp {

// --- Team ---
enum class Team : uint8_t { A, B };

inline Team opponent(Team team) {
    return team == Team::A ? Team::B : Team::A;
}

const char* teamName(Team team);

// Parses "A" / "B". Throws std::invalid_argument otherwise.
Team parseTeam(const std::string& name);

// --- FocusTargetType ---
enum class FocusTargetType : uint8_t { BALL, PLAYER, ZONE, GOAL };

const char* focusTargetTypeName(FocusTargetType type);

// --- EdgeType ---
enum class EdgeType : uint8_t {
    TEAM_NEAR,   // teammate within teammateRadius
    OPP_NEAR,    // opponent within opponentRadius
    BALL_LINK    // self-edge carrying ball features, always present
};

const char* edgeTypeName(EdgeType type);

// --- Candidate vocabulary ---
namespace candidate {
constexpr const char* BALL_NEARBY = "BALL_NEARBY";
constexpr const char* OPP_PRESSURE = "OPP_PRESSURE";
constexpr const char* TEAM_SUPPORT = "TEAM_SUPPORT";
constexpr const char* OPEN_SPACE = "OPEN_SPACE";
constexpr const char* GOAL = "GOAL";
} // namespace candidate

} // namespace vp
