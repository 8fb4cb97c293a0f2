#include <gtest/gtest.h>
#include "vp/policy.h"
#include <stdexcept>

using namespace vp;

namespace {

RawFrame makeRaw(const std::string& id, std::vector<PlayerPos> players, Vec2 ball) {
    RawFrame f;
    f.id = id;
    f.playerPos = std::move(players);
    f.ball = RawBall::at(ball.x, ball.y);
    return f;
}

void addPlayer(Tactic& t, const std::string& id, Team team, const std::string& role = "") {
    PlayerMeta p;
    p.id = id;
    p.team = team;
    p.role = role;
    t.meta.players[id] = p;
}

// Two teammates standing on the ball for three frames
Tactic ballCluster() {
    Tactic t;
    t.meta.tacticId = "cluster";
    addPlayer(t, "A1", Team::A);
    addPlayer(t, "A2", Team::A);
    for (int i = 0; i < 3; ++i) {
        t.frames.push_back(makeRaw("k" + std::to_string(i),
                                   {{"A1", {50, 34.3}}, {"A2", {50, 33.7}}}, {50, 34}));
    }
    return t;
}

// Opponent arrives next to A1 on the second frame
Tactic pressureArrives() {
    Tactic t;
    addPlayer(t, "A1", Team::A);
    addPlayer(t, "B1", Team::B);
    t.frames.push_back(makeRaw("k0", {{"A1", {40, 34}}, {"B1", {80, 10}}}, {41, 34}));
    t.frames.push_back(makeRaw("k1", {{"A1", {40, 34}}, {"B1", {40.5, 34}}}, {41, 34}));
    return t;
}

AlgoConfig ballFirstConfig() {
    AlgoConfig cfg;
    cfg.wPassLikelihood = 0.0;
    cfg.wGoalProximity = 1.0;
    return cfg;
}

} // anonymous namespace

TEST(Policy, BallClusterFocusesBall) {
    FocusPlan plan = recommendPlayerFocus(ballCluster(), ballFirstConfig());

    ASSERT_EQ(plan.numFrames, 3);
    ASSERT_EQ(plan.playerIds.size(), 2u);
    for (auto& pid : plan.playerIds) {
        auto& recs = plan.forPlayer(pid);
        ASSERT_EQ(recs.size(), 3u);
        for (size_t f = 0; f < recs.size(); ++f) {
            EXPECT_EQ(recs[f].frameIdx, static_cast<int>(f));
            EXPECT_EQ(recs[f].primary.type, FocusTargetType::BALL);
            EXPECT_EQ(recs[f].primary.anchor, (Vec2{50, 34}));
        }
    }
    EXPECT_NEAR(plan.forPlayer("A1")[0].primaryScore, 0.6, 1e-9);
}

TEST(Policy, StaticFramesUseMinimumStep) {
    FocusPlan plan = recommendPlayerFocus(ballCluster(), ballFirstConfig());
    auto& recs = plan.forPlayer("A1");
    EXPECT_DOUBLE_EQ(recs[0].tRel, 0.0);
    EXPECT_NEAR(recs[1].tRel, 0.2, 1e-12);
    EXPECT_NEAR(recs[2].tRel, 0.4, 1e-12);
}

TEST(Policy, PlayerOrderFollowsFrameZero) {
    Tactic t = ballCluster();
    for (auto& f : t.frames) {
        std::swap(f.playerPos[0], f.playerPos[1]);
    }
    FocusPlan plan = recommendPlayerFocus(t, ballFirstConfig());
    ASSERT_EQ(plan.playerIds.size(), 2u);
    EXPECT_EQ(plan.playerIds[0], "A2");
    EXPECT_EQ(plan.playerIds[1], "A1");
}

TEST(Policy, TopKSizeAndFloor) {
    AlgoConfig cfg = ballFirstConfig();
    cfg.topK = 3;
    FocusPlan plan = recommendPlayerFocus(ballCluster(), cfg);
    auto& first = plan.forPlayer("A1")[0];
    // BALL, GOAL, TEAM_SUPPORT; no opponents so no pressure or space
    ASSERT_EQ(first.topK.size(), 3u);
    EXPECT_EQ(first.topK[0].name, candidate::BALL_NEARBY);
    EXPECT_EQ(first.topK[1].name, candidate::GOAL);
    EXPECT_EQ(first.topK[2].name, candidate::TEAM_SUPPORT);
    EXPECT_EQ(first.rationale, first.topK[0].reasons);

    cfg.topK = 0;
    plan = recommendPlayerFocus(ballCluster(), cfg);
    EXPECT_EQ(plan.forPlayer("A1")[0].topK.size(), 1u);
}

TEST(Policy, SwitchesToArrivingOpponent) {
    AlgoConfig cfg;
    cfg.enableSpaceTargets = false;
    FocusPlan plan = recommendPlayerFocus(pressureArrives(), cfg);

    auto& recs = plan.forPlayer("A1");
    EXPECT_EQ(recs[0].primary.type, FocusTargetType::GOAL);
    EXPECT_EQ(recs[1].primary.type, FocusTargetType::PLAYER);
    EXPECT_EQ(recs[1].primary.targetPlayerId, "B1");
    EXPECT_NEAR(recs[1].primaryScore, 4.4 - 1.5, 1e-9);
    EXPECT_EQ(recs[1].rationale.back(), "switch_penalty");
}

TEST(Policy, LargeSwitchPenaltyHoldsFocus) {
    AlgoConfig cfg;
    cfg.enableSpaceTargets = false;
    cfg.switchPenalty = 100.0;
    FocusPlan plan = recommendPlayerFocus(pressureArrives(), cfg);

    auto& recs = plan.forPlayer("A1");
    EXPECT_EQ(recs[0].primary.type, FocusTargetType::GOAL);
    EXPECT_EQ(recs[1].primary.type, FocusTargetType::GOAL);
    EXPECT_EQ(recs[1].rationale.back(), "persist_bonus");
}

TEST(Policy, FallbackWhenNothingGenerated) {
    AlgoConfig cfg;
    cfg.enableBallFocus = false;
    cfg.enableMarkingThreats = false;
    cfg.enablePassTargets = false;
    cfg.enableSpaceTargets = false;
    cfg.enableGoalFocus = false;
    FocusPlan plan = recommendPlayerFocus(pressureArrives(), cfg);

    for (auto& pid : plan.playerIds) {
        for (auto& rec : plan.forPlayer(pid)) {
            EXPECT_EQ(rec.primary.type, FocusTargetType::BALL);
            EXPECT_EQ(rec.primary.anchor, (Vec2{41, 34}));
            EXPECT_EQ(rec.primaryScore, 0.0);
            ASSERT_EQ(rec.rationale.size(), 1u);
            EXPECT_EQ(rec.rationale[0], "fallback_ball");
            EXPECT_TRUE(rec.topK.empty());
        }
    }
}

TEST(Policy, Deterministic) {
    AlgoConfig cfg;
    cfg.topK = 5;
    FocusPlan a = recommendPlayerFocus(pressureArrives(), cfg);
    FocusPlan b = recommendPlayerFocus(pressureArrives(), cfg);
    EXPECT_EQ(a.playerIds, b.playerIds);
    EXPECT_TRUE(a.byPlayer == b.byPlayer);
}

TEST(Policy, UnlistedPlayersDefaultToTeamA) {
    Tactic t = pressureArrives();
    t.meta.players.clear();
    AlgoConfig cfg;
    cfg.enableSpaceTargets = false;
    FocusPlan plan = recommendPlayerFocus(t, cfg);

    // Both on team A: the arrival is a teammate, not pressure
    for (auto& rec : plan.forPlayer("A1")) {
        EXPECT_NE(rec.primary.tag, "press");
    }
}

TEST(Policy, InvalidConfigThrows) {
    AlgoConfig cfg;
    cfg.attackDirection = 0;
    EXPECT_THROW(recommendPlayerFocus(ballCluster(), cfg), std::invalid_argument);

    cfg = AlgoConfig();
    cfg.spaceGridDx = 0.0;
    EXPECT_THROW(recommendPlayerFocus(ballCluster(), cfg), std::invalid_argument);
}

TEST(Policy, EmptyTacticThrows) {
    Tactic t;
    EXPECT_THROW(recommendPlayerFocus(t, AlgoConfig()), std::invalid_argument);
}

TEST(Policy, UnknownPlayerLookupThrows) {
    FocusPlan plan = recommendPlayerFocus(ballCluster(), ballFirstConfig());
    EXPECT_THROW(plan.forPlayer("ZZ"), std::out_of_range);
}

TEST(Policy, FallbackRecommendationFields) {
    Frame f;
    f.frameIdx = 4;
    f.ballPos = {12, 20};
    PlayerFocusRecommendation rec = fallbackRecommendation("A9", f, 1.6);
    EXPECT_EQ(rec.playerId, "A9");
    EXPECT_EQ(rec.frameIdx, 4);
    EXPECT_DOUBLE_EQ(rec.tRel, 1.6);
    EXPECT_EQ(rec.primary.anchor, (Vec2{12, 20}));
    EXPECT_EQ(rec.primary.tag, "ball");
}
