#include <gtest/gtest.h>
#include "vp/canonicalize.h"
#include <stdexcept>
#include <string>

using namespace vp;

namespace {

RawFrame makeRaw(const std::string& id, std::vector<PlayerPos> players, RawBall ball) {
    RawFrame f;
    f.id = id;
    f.playerPos = std::move(players);
    f.ball = ball;
    return f;
}

} // anonymous namespace

TEST(Canonicalize, EmptyInputThrows) {
    EXPECT_THROW(canonicalizeFrames({}), std::invalid_argument);
}

TEST(Canonicalize, PlayerSetComesFromFrameZeroInOrder) {
    std::vector<RawFrame> raw = {
        makeRaw("f0", {{"B7", {10, 10}}, {"A1", {20, 20}}}, RawBall::at(50, 34)),
        makeRaw("f1", {{"A1", {21, 20}}, {"B7", {11, 10}}, {"C9", {0, 0}}}, RawBall::at(50, 34)),
    };
    CanonicalFrames out = canonicalizeFrames(raw);

    ASSERT_EQ(out.playerIds.size(), 2u);
    EXPECT_EQ(out.playerIds[0], "B7");
    EXPECT_EQ(out.playerIds[1], "A1");

    ASSERT_EQ(out.frames.size(), 2u);
    for (auto& f : out.frames) {
        ASSERT_EQ(f.players.size(), 2u);
        EXPECT_EQ(f.players[0].id, "B7");
        EXPECT_EQ(f.players[1].id, "A1");
        EXPECT_EQ(f.findPlayer("C9"), nullptr);
    }
    EXPECT_EQ(out.frames[1].players[1].pos, (Vec2{21, 20}));
}

TEST(Canonicalize, DuplicateFrameZeroIdThrows) {
    std::vector<RawFrame> raw = {
        makeRaw("f0", {{"A1", {10, 10}}, {"A2", {20, 20}}, {"A1", {11, 10}}}, RawBall::at(50, 34)),
    };
    EXPECT_THROW(canonicalizeFrames(raw), std::invalid_argument);
}

TEST(Canonicalize, DuplicateLaterIdIsNotAnError) {
    std::vector<RawFrame> raw = {
        makeRaw("f0", {{"A1", {10, 10}}}, RawBall::at(50, 34)),
        makeRaw("f1", {{"A1", {12, 10}}, {"A1", {13, 10}}}, RawBall::at(50, 34)),
    };
    CanonicalFrames out = canonicalizeFrames(raw);
    ASSERT_EQ(out.playerIds.size(), 1u);
    EXPECT_EQ(out.frames[1].players.size(), 1u);
}

TEST(Canonicalize, FrameIndexFollowsListOrderNotId) {
    std::vector<RawFrame> raw = {
        makeRaw("30", {{"A1", {0, 0}}}, RawBall::at(1, 1)),
        makeRaw("10", {{"A1", {1, 0}}}, RawBall::at(1, 1)),
        makeRaw("20", {{"A1", {2, 0}}}, RawBall::at(1, 1)),
    };
    CanonicalFrames out = canonicalizeFrames(raw);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(out.frames[i].frameIdx, i);
        EXPECT_NEAR(out.frames[i].players[0].pos.x, static_cast<double>(i), 1e-12);
    }
}

TEST(Canonicalize, MissingPlayerIsForwardFilled) {
    std::vector<RawFrame> raw = {
        makeRaw("f0", {{"A1", {10, 10}}, {"A2", {30, 30}}}, RawBall::at(50, 34)),
        makeRaw("f1", {{"A1", {12, 10}}, {"A2", {31, 30}}}, RawBall::at(50, 34)),
        makeRaw("f2", {{"A1", {14, 10}}}, RawBall::at(50, 34)),
        makeRaw("f3", {{"A1", {16, 10}}}, RawBall::at(50, 34)),
    };
    CanonicalFrames out = canonicalizeFrames(raw);

    EXPECT_EQ(*out.frames[2].findPlayer("A2"), *out.frames[1].findPlayer("A2"));
    EXPECT_EQ(*out.frames[3].findPlayer("A2"), (Vec2{31, 30}));
    EXPECT_EQ(*out.frames[3].findPlayer("A1"), (Vec2{16, 10}));
}

TEST(Canonicalize, BallIsCarriedForwardWithOwner) {
    std::vector<RawFrame> raw = {
        makeRaw("f0", {{"A1", {0, 0}}}, RawBall::at(40, 30, "A1")),
        makeRaw("f1", {{"A1", {1, 0}}}, RawBall::unknown()),
        makeRaw("f2", {{"A1", {2, 0}}}, RawBall::at(60, 20)),
    };
    RawBall halfKnown;
    halfKnown.x = 99.0;
    halfKnown.hasX = true;
    raw.push_back(makeRaw("f3", {{"A1", {3, 0}}}, halfKnown));

    CanonicalFrames out = canonicalizeFrames(raw);
    EXPECT_EQ(out.frames[1].ballPos, (Vec2{40, 30}));
    EXPECT_EQ(out.frames[1].ballOwnerId, "A1");
    EXPECT_EQ(out.frames[2].ballPos, (Vec2{60, 20}));
    EXPECT_EQ(out.frames[2].ballOwnerId, "");
    // x without y does not count as a fix
    EXPECT_EQ(out.frames[3].ballPos, (Vec2{60, 20}));
}

TEST(Canonicalize, BallMissingAtStartThrows) {
    std::vector<RawFrame> raw = {
        makeRaw("f0", {{"A1", {0, 0}}}, RawBall::unknown()),
        makeRaw("f1", {{"A1", {1, 0}}}, RawBall::at(50, 34)),
    };
    try {
        canonicalizeFrames(raw);
        FAIL() << "expected invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("frame 0"), std::string::npos);
    }
}

TEST(Canonicalize, FrameZeroPlayerWithoutPositionIsImpossible) {
    // Every frame-0 player has a frame-0 position, so later gaps always fill
    std::vector<RawFrame> raw = {
        makeRaw("f0", {{"A1", {0, 0}}}, RawBall::at(1, 1)),
        makeRaw("f1", {}, RawBall::unknown()),
    };
    CanonicalFrames out = canonicalizeFrames(raw);
    EXPECT_EQ(out.frames[1].players.size(), 1u);
    EXPECT_EQ(out.frames[1].ballPos, (Vec2{1, 1}));
}

TEST(Canonicalize, NoteIsKept) {
    RawFrame f = makeRaw("f0", {{"A1", {0, 0}}}, RawBall::at(1, 1));
    f.note = "press high";
    CanonicalFrames out = canonicalizeFrames({f});
    EXPECT_EQ(out.frames[0].note, "press high");
}
