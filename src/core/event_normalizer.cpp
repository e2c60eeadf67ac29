// File: src/core/event_normalizer.cpp
#include "core/event_normalizer.hpp"
#include <algorithm>

namespace pitchsim {

namespace {

std::string ResolveField(const std::optional<std::string>& primary,
                         const std::string& fallback) {
    if (primary.has_value()) {
        return *primary;
    }
    return fallback;
}

void AddUnique(std::vector<int64_t>& ids, int64_t id) {
    if (id == 0) {
        return;
    }
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
    }
}

} // namespace

Event NormalizeEvent(const RawEventRecord& raw) {
    Event event;
    event.event_id = raw.event_id;
    event.time = raw.time;
    event.period = raw.period;
    event.set_piece = raw.set_piece;
    event.team_id = raw.team_id;
    event.team_name = raw.team_name;
    event.player_id = raw.player_id;
    event.player_name = raw.player_name;
    event.secondary_player_id = raw.secondary_player_id;
    event.secondary_player_name = raw.secondary_player_name;

    if (raw.ball_position.has_value()) {
        event.ball = *raw.ball_position;
        event.has_ball_position = true;
    } else if (!raw.ball_samples.empty()) {
        event.ball = raw.ball_samples.front();
        event.has_ball_position = true;
    }

    event.type_code = ResolveField(raw.event_type, raw.possession.possession_event_type);
    event.type = ParseEventType(event.type_code);

    event.pass_type = ResolveField(raw.pass_type, raw.possession.pass_type);
    event.shot_type = ResolveField(raw.shot_type, raw.possession.shot_type);
    event.pressure_type = ResolveField(raw.pressure_type, raw.possession.pressure_type);

    event.home_players = raw.home_players;
    event.away_players = raw.away_players;

    event.outcome = raw.outcome;
    if (raw.is_goal.has_value()) {
        event.is_goal = *raw.is_goal;
    } else {
        event.is_goal = event.IsShot() && event.outcome == "G";
    }

    event.key_player_ids = raw.key_player_ids;
    AddUnique(event.key_player_ids, event.player_id);
    AddUnique(event.key_player_ids, event.secondary_player_id);

    return event;
}

Sequence NormalizeSequence(const SequenceKey& key,
                           const std::vector<RawEventRecord>& raw_events,
                           const std::string& set_piece) {
    Sequence sequence;
    sequence.key = key;
    sequence.events.reserve(raw_events.size());

    for (const auto& raw : raw_events) {
        sequence.events.push_back(NormalizeEvent(raw));
    }

    if (!sequence.events.empty()) {
        const Event& first = sequence.events.front();
        sequence.set_piece = set_piece.empty() ? first.set_piece : set_piece;
        sequence.time = first.time;
        sequence.team_id = first.team_id;
    } else {
        sequence.set_piece = set_piece;
    }

    return sequence;
}

} // namespace pitchsim
