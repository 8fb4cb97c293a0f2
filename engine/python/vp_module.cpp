#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "vp/config.h"
#include "vp/config_io.h"
#include "vp/enums.h"
#include "vp/focus.h"
#include "vp/policy.h"
#include "vp/tactic_io.h"
#include "vp/vec2.h"

namespace py = pybind11;

PYBIND11_MODULE(vp_engine, m) {
    m.doc() = "Viewpoint focus recommendation engine - Python bindings";

    // --- Enums ---
    py::enum_<vp::FocusTargetType>(m, "FocusTargetType")
        .value("BALL", vp::FocusTargetType::BALL)
        .value("PLAYER", vp::FocusTargetType::PLAYER)
        .value("ZONE", vp::FocusTargetType::ZONE)
        .value("GOAL", vp::FocusTargetType::GOAL);

    // --- Vec2 ---
    py::class_<vp::Vec2>(m, "Vec2")
        .def(py::init<>())
        .def(py::init([](double x, double y) { return vp::Vec2{x, y}; }))
        .def_readwrite("x", &vp::Vec2::x)
        .def_readwrite("y", &vp::Vec2::y)
        .def("distance_to", &vp::Vec2::distanceTo)
        .def("__repr__", [](const vp::Vec2& v) {
            return "Vec2(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ")";
        })
        .def("__eq__", [](const vp::Vec2& a, const vp::Vec2& b) { return a == b; });

    // --- RolePrior ---
    py::class_<vp::RolePrior>(m, "RolePrior")
        .def(py::init<>())
        .def_readwrite("role", &vp::RolePrior::role)
        .def_readwrite("candidate", &vp::RolePrior::candidate)
        .def_readwrite("bonus", &vp::RolePrior::bonus);

    // --- AlgoConfig ---
    py::class_<vp::AlgoConfig>(m, "AlgoConfig")
        .def(py::init<>())
        .def_readwrite("top_k", &vp::AlgoConfig::topK)
        .def_readwrite("attack_direction", &vp::AlgoConfig::attackDirection)
        .def_readwrite("max_player_speed", &vp::AlgoConfig::maxPlayerSpeed)
        .def_readwrite("min_dt", &vp::AlgoConfig::minDt)
        .def_readwrite("teammate_radius", &vp::AlgoConfig::teammateRadius)
        .def_readwrite("opponent_radius", &vp::AlgoConfig::opponentRadius)
        .def_readwrite("enable_ball_focus", &vp::AlgoConfig::enableBallFocus)
        .def_readwrite("enable_marking_threats", &vp::AlgoConfig::enableMarkingThreats)
        .def_readwrite("enable_pass_targets", &vp::AlgoConfig::enablePassTargets)
        .def_readwrite("enable_space_targets", &vp::AlgoConfig::enableSpaceTargets)
        .def_readwrite("enable_goal_focus", &vp::AlgoConfig::enableGoalFocus)
        .def_readwrite("space_grid_dx", &vp::AlgoConfig::spaceGridDx)
        .def_readwrite("space_grid_dy", &vp::AlgoConfig::spaceGridDy)
        .def_readwrite("min_space_clearance", &vp::AlgoConfig::minSpaceClearance)
        .def_readwrite("space_window_forward", &vp::AlgoConfig::spaceWindowForward)
        .def_readwrite("space_window_half_width", &vp::AlgoConfig::spaceWindowHalfWidth)
        .def_readwrite("support_cone_cos", &vp::AlgoConfig::supportConeCos)
        .def_readwrite("w_ball_distance", &vp::AlgoConfig::wBallDistance)
        .def_readwrite("w_ball_motion", &vp::AlgoConfig::wBallMotion)
        .def_readwrite("w_pass_likelihood", &vp::AlgoConfig::wPassLikelihood)
        .def_readwrite("w_opponent_pressure", &vp::AlgoConfig::wOpponentPressure)
        .def_readwrite("w_teammate_support", &vp::AlgoConfig::wTeammateSupport)
        .def_readwrite("w_space_value", &vp::AlgoConfig::wSpaceValue)
        .def_readwrite("w_goal_proximity", &vp::AlgoConfig::wGoalProximity)
        .def_readwrite("w_role_prior", &vp::AlgoConfig::wRolePrior)
        .def_readwrite("role_priors", &vp::AlgoConfig::rolePriors)
        .def_readwrite("switch_penalty", &vp::AlgoConfig::switchPenalty)
        .def_readwrite("persistence_bonus", &vp::AlgoConfig::persistenceBonus)
        .def_readwrite("clamp_scores", &vp::AlgoConfig::clampScores)
        .def_readwrite("score_min", &vp::AlgoConfig::scoreMin)
        .def_readwrite("score_max", &vp::AlgoConfig::scoreMax)
        .def("as_dict", [](const vp::AlgoConfig& cfg) {
            return py::module_::import("json").attr("loads")(vp::configToJson(cfg).dump());
        });

    // --- FocusTarget ---
    py::class_<vp::FocusTarget>(m, "FocusTarget")
        .def_readonly("target_type", &vp::FocusTarget::type)
        .def_readonly("anchor", &vp::FocusTarget::anchor)
        .def_readonly("target_player_id", &vp::FocusTarget::targetPlayerId)
        .def_readonly("tag", &vp::FocusTarget::tag)
        .def("__eq__", [](const vp::FocusTarget& a, const vp::FocusTarget& b) { return a == b; });

    // --- ScoredEvent ---
    py::class_<vp::ScoredEvent>(m, "ScoredEvent")
        .def_readonly("name", &vp::ScoredEvent::name)
        .def_readonly("score", &vp::ScoredEvent::score)
        .def_readonly("focus", &vp::ScoredEvent::focus)
        .def_readonly("features", &vp::ScoredEvent::features)
        .def_readonly("reasons", &vp::ScoredEvent::reasons)
        .def_readonly("meta", &vp::ScoredEvent::meta);

    // --- PlayerFocusRecommendation ---
    py::class_<vp::PlayerFocusRecommendation>(m, "PlayerFocusRecommendation")
        .def_readonly("player_id", &vp::PlayerFocusRecommendation::playerId)
        .def_readonly("frame_idx", &vp::PlayerFocusRecommendation::frameIdx)
        .def_readonly("t_rel", &vp::PlayerFocusRecommendation::tRel)
        .def_readonly("primary", &vp::PlayerFocusRecommendation::primary)
        .def_readonly("primary_score", &vp::PlayerFocusRecommendation::primaryScore)
        .def_readonly("rationale", &vp::PlayerFocusRecommendation::rationale)
        .def_readonly("top_k", &vp::PlayerFocusRecommendation::topK);

    // --- Functions ---
    m.def("load_config", &vp::loadConfig, py::arg("path"));

    // Returns {player_id: [PlayerFocusRecommendation, ...]} in frame-0 player order
    m.def("recommend_player_focus", [](const std::string& tacticJson, const vp::AlgoConfig& cfg,
                                       const std::string& tacticId, int tacticIndex) {
        vp::FocusPlan plan = vp::recommendPlayerFocusJson(vp::Json::parse(tacticJson), cfg,
                                                          tacticId, tacticIndex);
        py::dict result;
        for (auto& pid : plan.playerIds) {
            result[py::str(pid)] = py::cast(plan.forPlayer(pid));
        }
        return result;
    }, py::arg("tactic_json"), py::arg("cfg") = vp::AlgoConfig(),
       py::arg("tactic_id") = "", py::arg("tactic_index") = 0);

    m.def("recommend_player_focus_json", [](const std::string& tacticJson, const vp::AlgoConfig& cfg,
                                            const std::string& tacticId, int tacticIndex) {
        vp::FocusPlan plan = vp::recommendPlayerFocusJson(vp::Json::parse(tacticJson), cfg,
                                                          tacticId, tacticIndex);
        return vp::focusPlanToJson(plan).dump();
    }, py::arg("tactic_json"), py::arg("cfg") = vp::AlgoConfig(),
       py::arg("tactic_id") = "", py::arg("tactic_index") = 0);
}
