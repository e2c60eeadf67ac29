// File: src/features/event_cost.hpp
#pragma once

#include "features/feature_extractor.hpp"
#include <string>
#include <vector>

namespace pitchsim {

/// Pairwise distance between two FeatureRecords.
///
/// Weighted sum of component costs:
/// - ball position: Euclidean distance between the two balls
/// - event type: 0 same type, 2 shared semantic group, 10 shooting vs
///   defensive, 5 otherwise or when either type is empty
/// - player formation: symmetric average nearest-neighbour distance
/// - pass / shot / pressure sub-types: only when enabled
///
/// The cost is reflexive (Cost(a, a) == 0) and symmetric.
class EventCost {
public:
    struct Weights {
        float ball_position{1.0f};
        float event_type{1.0f};
        float player_formation{1.0f};
        float pass_type{0.5f};
        float shot_type{0.5f};
        float pressure_type{0.3f};
    };

    /// Optional sub-costs; a disabled component contributes 0
    struct OptionalFeatures {
        bool pass_type{false};
        bool shot_type{false};
        bool pressure_type{false};
    };

    struct Config {
        Weights weights;
        OptionalFeatures features;
    };

    /// Cost charged when exactly one formation is empty
    static constexpr float kEmptyFormationPenalty = 10.0f;

    EventCost() = default;
    explicit EventCost(const Config& config) : config_(config) {}

    /// Total weighted cost between two events
    float Compute(const FeatureRecord& a, const FeatureRecord& b) const;

    const Config& GetConfig() const { return config_; }

    // Component costs (unweighted)

    static float BallDistance(const Position& a, const Position& b);
    static float EventTypePenalty(const FeatureRecord& a, const FeatureRecord& b);
    static float PlayerFormationDistance(const std::vector<Position>& a,
                                         const std::vector<Position>& b);
    static float PassTypePenalty(const std::string& a, const std::string& b);
    static float ShotTypePenalty(const std::string& a, const std::string& b);
    static float PressureTypePenalty(const std::string& a, const std::string& b);

private:
    Config config_;

    /// Mean over `source` of the distance to the nearest point of `target`
    static float AverageNearestDistance(const std::vector<Position>& source,
                                        const std::vector<Position>& target);
};

} // namespace pitchsim
