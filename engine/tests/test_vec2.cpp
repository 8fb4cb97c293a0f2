#include <gtest/gtest.h>
#include "vp/vec2.h"

using namespace vp;

TEST(Vec2, Distance) {
    Vec2 a{0.0, 0.0};
    Vec2 b{3.0, 4.0};
    EXPECT_NEAR(a.distanceTo(b), 5.0, 1e-9);
    EXPECT_NEAR(b.distanceTo(a), 5.0, 1e-9);
}

TEST(Vec2, UnitOfZeroIsZero) {
    Vec2 z{0.0, 0.0};
    EXPECT_EQ(z.unit(), (Vec2{0.0, 0.0}));

    Vec2 u = Vec2{0.0, -2.0}.unit();
    EXPECT_NEAR(u.x, 0.0, 1e-12);
    EXPECT_NEAR(u.y, -1.0, 1e-12);
}

TEST(Vec2, GoalCenterFollowsAttackDirection) {
    Pitch pitch{105.0, 68.0};
    EXPECT_EQ(attackingGoalCenter(pitch, 1), (Vec2{105.0, 34.0}));
    EXPECT_EQ(attackingGoalCenter(pitch, -1), (Vec2{0.0, 34.0}));
}

TEST(Vec2, IsAheadIsStrict) {
    EXPECT_TRUE(isAhead({11.0, 0.0}, {10.0, 50.0}, 1));
    EXPECT_FALSE(isAhead({10.0, 0.0}, {10.0, 50.0}, 1));
    EXPECT_FALSE(isAhead({11.0, 0.0}, {10.0, 50.0}, -1));
    EXPECT_TRUE(isAhead({9.0, 0.0}, {10.0, 50.0}, -1));
}

TEST(Vec2, ForwardCone) {
    Vec2 origin{50.0, 34.0};
    // 45 degrees: cos = 0.707
    EXPECT_TRUE(inForwardCone(origin, {55.0, 39.0}, 1, 0.3));
    EXPECT_FALSE(inForwardCone(origin, {55.0, 39.0}, -1, 0.3));
    // Straight sideways: cos = 0
    EXPECT_FALSE(inForwardCone(origin, {50.0, 40.0}, 1, 0.3));
    EXPECT_TRUE(inForwardCone(origin, {50.0, 40.0}, 1, 0.0));
}

TEST(Vec2, ForwardConeSamePointCountsAsSideways) {
    Vec2 p{20.0, 20.0};
    EXPECT_TRUE(inForwardCone(p, p, 1, 0.0));
    EXPECT_FALSE(inForwardCone(p, p, 1, 0.3));
}
