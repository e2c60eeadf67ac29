// File: src/features/feature_extractor.hpp
#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace pitchsim {

/// Per-event features compared by EventCost
struct FeatureRecord {
    Position ball;
    EventType type{EventType::UNKNOWN};
    std::string type_code;
    std::vector<Position> near_players;   // home and away, identity dropped

    std::string pass_type;
    std::string shot_type;
    std::string pressure_type;
};

/// Converts canonical events into FeatureRecords.
///
/// Near-ball players are all tracked players (either side) whose planar
/// distance to the ball is at most the configured radius.
class FeatureExtractor {
public:
    static constexpr float kDefaultNearBallRadius = 15.0f;

    /// @param near_ball_radius Radius for near-ball players (must be >= 0)
    /// @throws std::invalid_argument if the radius is negative
    explicit FeatureExtractor(float near_ball_radius = kDefaultNearBallRadius);

    /// Extract features from one event
    FeatureRecord Extract(const Event& event) const;

    /// Extract features from every event of a chain, in order
    std::vector<FeatureRecord> ExtractSequence(const std::vector<Event>& events) const;

    /// Players of `players` within the radius of `ball`
    std::vector<const PlayerPosition*> PlayersNear(
        const std::vector<PlayerPosition>& players,
        const Position& ball) const;

    float GetNearBallRadius() const { return near_ball_radius_; }

private:
    float near_ball_radius_;
};

} // namespace pitchsim
