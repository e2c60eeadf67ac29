// File: tests/features/event_cost_test.cpp
#include "features/event_cost.hpp"
#include <gtest/gtest.h>

namespace pitchsim {
namespace {

FeatureRecord Record(EventType type, float x = 0.0f, float y = 0.0f) {
    FeatureRecord r;
    r.type = type;
    r.type_code = ToString(type);
    r.ball = Position(x, y);
    return r;
}

float TypePenalty(EventType a, EventType b) {
    return EventCost::EventTypePenalty(Record(a), Record(b));
}

// ============================================================================
// Total Cost Tests
// ============================================================================

TEST(EventCostTest, IdenticalPassesAtOriginCostZero) {
    EventCost cost;
    EXPECT_FLOAT_EQ(0.0f, cost.Compute(Record(EventType::PA), Record(EventType::PA)));
}

TEST(EventCostTest, Reflexive) {
    FeatureRecord r = Record(EventType::SH, 30.0f, -4.0f);
    r.near_players = {Position(31.0f, -4.0f), Position(28.0f, 2.0f)};
    r.pass_type = "S";
    r.pressure_type = "A";

    EventCost::Config config;
    config.features.pass_type = true;
    config.features.shot_type = true;
    config.features.pressure_type = true;

    EXPECT_FLOAT_EQ(0.0f, EventCost(config).Compute(r, r));
}

TEST(EventCostTest, Symmetric) {
    FeatureRecord a = Record(EventType::PA, 0.0f, 0.0f);
    a.near_players = {Position(1.0f, 1.0f)};
    FeatureRecord b = Record(EventType::CL, 10.0f, 5.0f);
    b.near_players = {Position(9.0f, 5.0f), Position(12.0f, 3.0f)};

    EventCost cost;
    EXPECT_FLOAT_EQ(cost.Compute(a, b), cost.Compute(b, a));
}

TEST(EventCostTest, BallDistanceIsEuclidean) {
    EventCost cost;
    EXPECT_FLOAT_EQ(5.0f, cost.Compute(Record(EventType::PA, 0.0f, 0.0f),
                                       Record(EventType::PA, 3.0f, 4.0f)));
}

TEST(EventCostTest, WeightsScaleComponents) {
    EventCost::Config config;
    config.weights.ball_position = 2.0f;
    config.weights.event_type = 0.5f;

    EventCost cost(config);
    // 2 * 5 (ball) + 0.5 * 2 (PA vs CR share passing)
    EXPECT_FLOAT_EQ(11.0f, cost.Compute(Record(EventType::PA, 0.0f, 0.0f),
                                        Record(EventType::CR, 3.0f, 4.0f)));
}

// ============================================================================
// Event Type Penalty Tests
// ============================================================================

TEST(EventCostTest, TypePenaltyIdentical) {
    EXPECT_FLOAT_EQ(0.0f, TypePenalty(EventType::PA, EventType::PA));
    EXPECT_FLOAT_EQ(0.0f, TypePenalty(EventType::OG, EventType::OG));
}

TEST(EventCostTest, TypePenaltySharedGroup) {
    EXPECT_FLOAT_EQ(2.0f, TypePenalty(EventType::PA, EventType::CR));
    EXPECT_FLOAT_EQ(2.0f, TypePenalty(EventType::SH, EventType::PK));
    EXPECT_FLOAT_EQ(2.0f, TypePenalty(EventType::CA, EventType::DR));   // dribbling
    EXPECT_FLOAT_EQ(2.0f, TypePenalty(EventType::CA, EventType::TO));   // control
    EXPECT_FLOAT_EQ(2.0f, TypePenalty(EventType::RE, EventType::CL));   // defensive
}

TEST(EventCostTest, TypePenaltyOppositeExtremes) {
    EXPECT_FLOAT_EQ(10.0f, TypePenalty(EventType::SH, EventType::CL));
    EXPECT_FLOAT_EQ(10.0f, TypePenalty(EventType::CL, EventType::PK));
    EXPECT_FLOAT_EQ(10.0f, TypePenalty(EventType::RE, EventType::SH));
}

TEST(EventCostTest, TypePenaltyUnrelated) {
    EXPECT_FLOAT_EQ(5.0f, TypePenalty(EventType::PA, EventType::SH));
    EXPECT_FLOAT_EQ(5.0f, TypePenalty(EventType::DR, EventType::CL));
    EXPECT_FLOAT_EQ(5.0f, TypePenalty(EventType::OG, EventType::CH));
}

TEST(EventCostTest, TypePenaltyEmptyOrUnknown) {
    FeatureRecord empty;
    EXPECT_FLOAT_EQ(5.0f, EventCost::EventTypePenalty(empty, Record(EventType::PA)));
    EXPECT_FLOAT_EQ(5.0f, EventCost::EventTypePenalty(Record(EventType::SH), empty));
    EXPECT_FLOAT_EQ(0.0f, EventCost::EventTypePenalty(empty, empty));

    FeatureRecord unknown_a;
    unknown_a.type_code = "ZZ";
    FeatureRecord unknown_b;
    unknown_b.type_code = "YY";
    EXPECT_FLOAT_EQ(0.0f, EventCost::EventTypePenalty(unknown_a, unknown_a));
    EXPECT_FLOAT_EQ(5.0f, EventCost::EventTypePenalty(unknown_a, unknown_b));
}

// ============================================================================
// Formation Tests
// ============================================================================

TEST(EventCostTest, FormationBothEmpty) {
    EXPECT_FLOAT_EQ(0.0f, EventCost::PlayerFormationDistance({}, {}));
}

TEST(EventCostTest, FormationOneSideEmpty) {
    std::vector<Position> one = {Position(1.0f, 0.0f)};
    EXPECT_FLOAT_EQ(10.0f, EventCost::PlayerFormationDistance({}, one));
    EXPECT_FLOAT_EQ(10.0f, EventCost::PlayerFormationDistance(one, {}));
}

TEST(EventCostTest, FormationAverageNearestNeighbour) {
    std::vector<Position> a = {Position(0.0f, 0.0f), Position(10.0f, 0.0f)};
    std::vector<Position> b = {Position(0.0f, 0.0f)};

    // a -> b: (0 + 10) / 2 = 5, b -> a: 0, mean 2.5
    EXPECT_FLOAT_EQ(2.5f, EventCost::PlayerFormationDistance(a, b));
    EXPECT_FLOAT_EQ(2.5f, EventCost::PlayerFormationDistance(b, a));
}

TEST(EventCostTest, FormationIsSymmetric) {
    std::vector<Position> a = {Position(1.0f, 2.0f), Position(-4.0f, 7.0f), Position(3.0f, 3.0f)};
    std::vector<Position> b = {Position(0.0f, 0.0f), Position(5.0f, -5.0f)};
    EXPECT_FLOAT_EQ(EventCost::PlayerFormationDistance(a, b),
                    EventCost::PlayerFormationDistance(b, a));
}

TEST(EventCostTest, EmptyVersusOneNearPlayerCostsPenalty) {
    FeatureRecord query = Record(EventType::PA);
    FeatureRecord candidate = Record(EventType::PA);
    candidate.near_players = {Position(2.0f, 0.0f)};

    EXPECT_FLOAT_EQ(EventCost::kEmptyFormationPenalty, EventCost().Compute(query, candidate));
}

// ============================================================================
// Optional Sub-cost Tests
// ============================================================================

TEST(EventCostTest, PassTypePenalty) {
    EXPECT_FLOAT_EQ(0.0f, EventCost::PassTypePenalty("S", "S"));
    EXPECT_FLOAT_EQ(3.0f, EventCost::PassTypePenalty("S", "L"));
    EXPECT_FLOAT_EQ(3.0f, EventCost::PassTypePenalty("L", "S"));
    EXPECT_FLOAT_EQ(1.5f, EventCost::PassTypePenalty("S", "T"));
    EXPECT_FLOAT_EQ(2.0f, EventCost::PassTypePenalty("", "S"));
}

TEST(EventCostTest, ShotTypePenalty) {
    EXPECT_FLOAT_EQ(0.0f, EventCost::ShotTypePenalty("H", "H"));
    EXPECT_FLOAT_EQ(2.0f, EventCost::ShotTypePenalty("H", "F"));
    EXPECT_FLOAT_EQ(2.0f, EventCost::ShotTypePenalty("", "F"));
}

TEST(EventCostTest, PressureTypePenalty) {
    EXPECT_FLOAT_EQ(0.0f, EventCost::PressureTypePenalty("N", "N"));
    EXPECT_FLOAT_EQ(3.0f, EventCost::PressureTypePenalty("N", "A"));
    EXPECT_FLOAT_EQ(1.5f, EventCost::PressureTypePenalty("N", "P"));
    EXPECT_FLOAT_EQ(1.0f, EventCost::PressureTypePenalty("", "A"));
}

TEST(EventCostTest, DisabledSubcostsContributeNothing) {
    FeatureRecord a = Record(EventType::PA);
    a.pass_type = "S";
    a.pressure_type = "N";
    FeatureRecord b = Record(EventType::PA);
    b.pass_type = "L";
    b.pressure_type = "A";

    EventCost::Config config;
    config.weights.pass_type = 100.0f;
    config.weights.pressure_type = 100.0f;
    EXPECT_FLOAT_EQ(0.0f, EventCost(config).Compute(a, b));
}

TEST(EventCostTest, EnabledSubcostsAreWeighted) {
    FeatureRecord a = Record(EventType::PA);
    a.pass_type = "S";
    a.pressure_type = "N";
    FeatureRecord b = Record(EventType::PA);
    b.pass_type = "L";
    b.pressure_type = "A";

    EventCost::Config config;
    config.features.pass_type = true;
    config.features.pressure_type = true;
    // 0.5 * 3 + 0.3 * 3
    EXPECT_NEAR(2.4f, EventCost(config).Compute(a, b), 1e-5f);
}

} // namespace
} // namespace pitchsim
