// File: tests/core/types_test.cpp
#include "core/types.hpp"
#include <gtest/gtest.h>
#include <unordered_set>

namespace pitchsim {
namespace {

// ============================================================================
// Position Tests
// ============================================================================

TEST(PositionTest, DefaultIsOrigin) {
    Position p;
    EXPECT_FLOAT_EQ(0.0f, p.x);
    EXPECT_FLOAT_EQ(0.0f, p.y);
    EXPECT_FLOAT_EQ(0.0f, p.z);
}

TEST(PositionTest, DistanceIgnoresHeight) {
    Position a(0.0f, 0.0f, 5.0f);
    Position b(3.0f, 4.0f, 0.0f);
    EXPECT_FLOAT_EQ(5.0f, a.DistanceTo(b));
    EXPECT_FLOAT_EQ(5.0f, b.DistanceTo(a));
}

// ============================================================================
// EventType Tests
// ============================================================================

TEST(EventTypeTest, ParseKnownCodes) {
    EXPECT_EQ(EventType::PA, ParseEventType("PA"));
    EXPECT_EQ(EventType::SH, ParseEventType("SH"));
    EXPECT_EQ(EventType::CL, ParseEventType("CL"));
    EXPECT_EQ(EventType::BC, ParseEventType("BC"));
}

TEST(EventTypeTest, UnknownCodesMapToUnknown) {
    EXPECT_EQ(EventType::UNKNOWN, ParseEventType(""));
    EXPECT_EQ(EventType::UNKNOWN, ParseEventType("XX"));
    EXPECT_EQ(EventType::UNKNOWN, ParseEventType("pa"));
}

TEST(EventTypeTest, CodesRoundTrip) {
    for (size_t i = 1; i < static_cast<size_t>(EventType::COUNT); ++i) {
        EventType type = static_cast<EventType>(i);
        EXPECT_EQ(type, ParseEventType(ToString(type))) << ToString(type);
    }
}

TEST(EventTypeTest, Labels) {
    EXPECT_STREQ("Pass", EventTypeLabel(EventType::PA));
    EXPECT_STREQ("Shot", EventTypeLabel(EventType::SH));
    EXPECT_STREQ("Unknown", EventTypeLabel(EventType::UNKNOWN));
    EXPECT_STREQ("", ToString(EventType::UNKNOWN));
}

// ============================================================================
// Group Table Tests
// ============================================================================

TEST(EventGroupTest, SingleGroupTypes) {
    EXPECT_EQ(GROUP_PASSING, EventGroups(EventType::PA));
    EXPECT_EQ(GROUP_PASSING, EventGroups(EventType::CK));
    EXPECT_EQ(GROUP_SHOOTING, EventGroups(EventType::PK));
    EXPECT_EQ(GROUP_DEFENSIVE, EventGroups(EventType::CL));
    EXPECT_EQ(GROUP_DRIBBLING, EventGroups(EventType::DR));
}

TEST(EventGroupTest, MultiGroupTypes) {
    EXPECT_EQ(GROUP_CONTROL | GROUP_DRIBBLING, EventGroups(EventType::CA));
    EXPECT_EQ(GROUP_CONTROL | GROUP_DEFENSIVE, EventGroups(EventType::RE));
}

TEST(EventGroupTest, UngroupedTypes) {
    EXPECT_EQ(GROUP_NONE, EventGroups(EventType::UNKNOWN));
    EXPECT_EQ(GROUP_NONE, EventGroups(EventType::OG));
    EXPECT_EQ(GROUP_NONE, EventGroups(EventType::CH));
}

TEST(SetPieceTest, Labels) {
    EXPECT_EQ("Open Play", SetPieceLabel("O"));
    EXPECT_EQ("Corner", SetPieceLabel("C"));
    EXPECT_EQ("Free Kick", SetPieceLabel("F"));
    EXPECT_EQ("Z", SetPieceLabel("Z"));
    EXPECT_EQ("", SetPieceLabel(""));
}

// ============================================================================
// Key Tests
// ============================================================================

TEST(SequenceKeyTest, EqualityAndOrdering) {
    SequenceKey a("m1", 1);
    SequenceKey b("m1", 2);
    SequenceKey c("m2", 1);

    EXPECT_EQ(a, SequenceKey("m1", 1));
    EXPECT_NE(a, b);
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_FALSE(c < a);
}

TEST(SequenceKeyTest, ToString) {
    EXPECT_EQ("m1/3", SequenceKey("m1", 3).ToString());
    EXPECT_EQ("m1/3#2", EventKey(SequenceKey("m1", 3), 2).ToString());
}

TEST(SequenceKeyTest, HashDistinguishesKeys) {
    std::unordered_set<SequenceKey, SequenceKey::Hash> keys;
    keys.insert(SequenceKey("m1", 1));
    keys.insert(SequenceKey("m1", 2));
    keys.insert(SequenceKey("m1", 1));
    EXPECT_EQ(2u, keys.size());
}

TEST(EventKeyTest, Equality) {
    EventKey a(SequenceKey("m1", 1), 0);
    EXPECT_EQ(a, EventKey(SequenceKey("m1", 1), 0));
    EXPECT_NE(a, EventKey(SequenceKey("m1", 1), 1));
    EXPECT_NE(a, EventKey(SequenceKey("m2", 1), 0));
}

// ============================================================================
// Event Tests
// ============================================================================

TEST(EventTest, DefaultsAreSafe) {
    Event e;
    EXPECT_EQ(EventType::UNKNOWN, e.type);
    EXPECT_TRUE(e.type_code.empty());
    EXPECT_FALSE(e.has_ball_position);
    EXPECT_FALSE(e.is_goal);
    EXPECT_FALSE(e.IsPass());
    EXPECT_FALSE(e.IsShot());
}

TEST(EventTest, FindPlayerSearchesBothSides) {
    Event e;
    e.home_players.push_back(PlayerPosition{7, 7, Position(1.0f, 2.0f)});
    e.away_players.push_back(PlayerPosition{20, 4, Position(3.0f, 4.0f)});

    ASSERT_NE(nullptr, e.FindPlayer(7));
    EXPECT_FLOAT_EQ(1.0f, e.FindPlayer(7)->position.x);
    ASSERT_NE(nullptr, e.FindPlayer(20));
    EXPECT_FLOAT_EQ(3.0f, e.FindPlayer(20)->position.x);
    EXPECT_EQ(nullptr, e.FindPlayer(99));
    EXPECT_EQ(nullptr, e.FindPlayer(0));
}

TEST(EventTest, LightweightKeepsOnlyKeyPlayers) {
    Event e;
    e.type = EventType::PA;
    e.type_code = "PA";
    e.key_player_ids = {7, 20};
    e.home_players.push_back(PlayerPosition{7, 7, Position()});
    e.home_players.push_back(PlayerPosition{8, 8, Position()});
    e.away_players.push_back(PlayerPosition{20, 4, Position()});
    e.away_players.push_back(PlayerPosition{21, 5, Position()});

    Event light = LightweightEvent(e);
    ASSERT_EQ(1u, light.home_players.size());
    EXPECT_EQ(7, light.home_players[0].player_id);
    ASSERT_EQ(1u, light.away_players.size());
    EXPECT_EQ(20, light.away_players[0].player_id);
    EXPECT_EQ("PA", light.type_code);

    // Source untouched
    EXPECT_EQ(2u, e.home_players.size());
}

} // namespace
} // namespace pitchsim
