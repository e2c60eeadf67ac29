// File: src/features/feature_extractor.cpp
#include "features/feature_extractor.hpp"
#include <stdexcept>

namespace pitchsim {

FeatureExtractor::FeatureExtractor(float near_ball_radius)
    : near_ball_radius_(near_ball_radius) {
    if (near_ball_radius_ < 0.0f) {
        throw std::invalid_argument("Near-ball radius must be non-negative");
    }
}

FeatureRecord FeatureExtractor::Extract(const Event& event) const {
    FeatureRecord record;
    record.ball = Position(event.ball.x, event.ball.y);
    record.type = event.type;
    record.type_code = event.type_code;
    record.pass_type = event.pass_type;
    record.shot_type = event.shot_type;
    record.pressure_type = event.pressure_type;

    for (const auto* player : PlayersNear(event.home_players, record.ball)) {
        record.near_players.emplace_back(player->position.x, player->position.y);
    }
    for (const auto* player : PlayersNear(event.away_players, record.ball)) {
        record.near_players.emplace_back(player->position.x, player->position.y);
    }

    return record;
}

std::vector<FeatureRecord> FeatureExtractor::ExtractSequence(
    const std::vector<Event>& events) const {
    std::vector<FeatureRecord> records;
    records.reserve(events.size());
    for (const auto& event : events) {
        records.push_back(Extract(event));
    }
    return records;
}

std::vector<const PlayerPosition*> FeatureExtractor::PlayersNear(
    const std::vector<PlayerPosition>& players,
    const Position& ball) const {
    std::vector<const PlayerPosition*> near;
    for (const auto& player : players) {
        if (player.position.DistanceTo(ball) <= near_ball_radius_) {
            near.push_back(&player);
        }
    }
    return near;
}

} // namespace pitchsim
