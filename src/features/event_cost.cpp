// File: src/features/event_cost.cpp
#include "features/event_cost.hpp"
#include <algorithm>
#include <limits>

namespace pitchsim {

float EventCost::Compute(const FeatureRecord& a, const FeatureRecord& b) const {
    const Weights& w = config_.weights;
    float total = 0.0f;

    total += w.ball_position * BallDistance(a.ball, b.ball);
    total += w.event_type * EventTypePenalty(a, b);
    total += w.player_formation * PlayerFormationDistance(a.near_players, b.near_players);

    if (config_.features.pass_type) {
        total += w.pass_type * PassTypePenalty(a.pass_type, b.pass_type);
    }
    if (config_.features.shot_type) {
        total += w.shot_type * ShotTypePenalty(a.shot_type, b.shot_type);
    }
    if (config_.features.pressure_type) {
        total += w.pressure_type * PressureTypePenalty(a.pressure_type, b.pressure_type);
    }

    return total;
}

float EventCost::BallDistance(const Position& a, const Position& b) {
    return a.DistanceTo(b);
}

float EventCost::EventTypePenalty(const FeatureRecord& a, const FeatureRecord& b) {
    if (a.type_code == b.type_code) {
        return 0.0f;
    }
    if (a.type_code.empty() || b.type_code.empty()) {
        return 5.0f;
    }

    uint8_t groups_a = EventGroups(a.type);
    uint8_t groups_b = EventGroups(b.type);

    if ((groups_a & groups_b) != 0) {
        return 2.0f;
    }

    bool opposite = ((groups_a & GROUP_SHOOTING) && (groups_b & GROUP_DEFENSIVE)) ||
                    ((groups_a & GROUP_DEFENSIVE) && (groups_b & GROUP_SHOOTING));
    if (opposite) {
        return 10.0f;
    }

    return 5.0f;
}

float EventCost::AverageNearestDistance(const std::vector<Position>& source,
                                        const std::vector<Position>& target) {
    float total = 0.0f;
    for (const auto& src : source) {
        float min_dist = std::numeric_limits<float>::infinity();
        for (const auto& tgt : target) {
            min_dist = std::min(min_dist, src.DistanceTo(tgt));
        }
        total += min_dist;
    }
    return total / static_cast<float>(source.size());
}

float EventCost::PlayerFormationDistance(const std::vector<Position>& a,
                                         const std::vector<Position>& b) {
    if (a.empty() && b.empty()) {
        return 0.0f;
    }
    if (a.empty() || b.empty()) {
        return kEmptyFormationPenalty;
    }

    float forward = AverageNearestDistance(a, b);
    float backward = AverageNearestDistance(b, a);
    return (forward + backward) / 2.0f;
}

float EventCost::PassTypePenalty(const std::string& a, const std::string& b) {
    if (a == b) {
        return 0.0f;
    }
    if (a.empty() || b.empty()) {
        return 2.0f;
    }
    if ((a == "S" && b == "L") || (a == "L" && b == "S")) {
        return 3.0f;
    }
    return 1.5f;
}

float EventCost::ShotTypePenalty(const std::string& a, const std::string& b) {
    return a == b ? 0.0f : 2.0f;
}

float EventCost::PressureTypePenalty(const std::string& a, const std::string& b) {
    if (a == b) {
        return 0.0f;
    }
    if (a.empty() || b.empty()) {
        return 1.0f;
    }
    if ((a == "N" && b == "A") || (a == "A" && b == "N")) {
        return 3.0f;
    }
    return 1.5f;
}

} // namespace pitchsim
