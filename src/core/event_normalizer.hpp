// File: src/core/event_normalizer.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pitchsim {

/// Event record as delivered by an upstream feed, before normalization.
///
/// Two layouts reach the engine. The processed layout carries a structured
/// ball position and top-level type fields; the raw tracking layout carries a
/// list of ball samples and a nested possession-event classification. A
/// producer fills whichever layout it has; NormalizeEvent() resolves each
/// field once, primary layout first.
struct RawEventRecord {
    std::string event_id;
    std::string time;
    int period{1};
    std::string set_piece;

    std::string team_id;
    std::string team_name;
    int64_t player_id{0};
    std::string player_name;
    int64_t secondary_player_id{0};
    std::string secondary_player_name;
    std::vector<int64_t> key_player_ids;

    // Processed layout
    std::optional<Position> ball_position;
    std::optional<std::string> event_type;
    std::optional<std::string> pass_type;
    std::optional<std::string> shot_type;
    std::optional<std::string> pressure_type;

    // Raw layout
    std::vector<Position> ball_samples;
    struct PossessionEvents {
        std::string possession_event_type;
        std::string pass_type;
        std::string shot_type;
        std::string pressure_type;
    } possession;

    std::vector<PlayerPosition> home_players;
    std::vector<PlayerPosition> away_players;

    std::string outcome;
    std::optional<bool> is_goal;
};

/// Collapse a raw record into the canonical Event.
///
/// - Ball: structured position, else first ball sample, else (0,0) with
///   has_ball_position = false
/// - Type and sub-types: top-level field when present, else the nested
///   possession classification, else ""
/// - Goal flag: explicit value, else a shot with outcome "G"
/// - Key players always include the primary and secondary player
Event NormalizeEvent(const RawEventRecord& raw);

/// Normalize a whole possession chain
Sequence NormalizeSequence(const SequenceKey& key,
                           const std::vector<RawEventRecord>& raw_events,
                           const std::string& set_piece = "");

} // namespace pitchsim
