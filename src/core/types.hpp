// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace pitchsim {

// Pitch coordinates: origin at the centre spot, x along the 105 unit length,
// y along the 68 unit width.
struct Position {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};

    Position() = default;
    Position(float x_, float y_, float z_ = 0.0f) : x(x_), y(y_), z(z_) {}

    // Planar distance (z is ignored)
    float DistanceTo(const Position& other) const;

    bool operator==(const Position& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
};

// Tracked player location at the moment of an event
struct PlayerPosition {
    int64_t player_id{0};
    int jersey_number{0};
    Position position;
};

// EventType: possession event classification
enum class EventType : uint8_t {
    UNKNOWN = 0,
    PA,   // Pass
    SH,   // Shot
    IT,   // Initial touch
    RE,   // Recovery / rebound
    CR,   // Cross
    CA,   // Carry
    DR,   // Dribble
    CL,   // Clearance
    TO,   // Touch
    FK,   // Free kick
    CK,   // Corner kick
    TI,   // Throw-in
    GK,   // Goal kick
    PK,   // Penalty kick
    OG,   // Own goal
    CH,   // Challenge
    TC,   // Touch (tracking feed code)
    BC,   // Ball carry
    COUNT
};

// Convert EventType to its two-letter code ("" for UNKNOWN)
const char* ToString(EventType type);

// Human-readable label ("Pass", "Shot", ...)
const char* EventTypeLabel(EventType type);

// Parse a two-letter code; unrecognized codes map to UNKNOWN
EventType ParseEventType(const std::string& code);

// Semantic groups an event type can belong to (bit flags)
enum EventGroup : uint8_t {
    GROUP_NONE = 0,
    GROUP_PASSING = 1 << 0,
    GROUP_SHOOTING = 1 << 1,
    GROUP_CONTROL = 1 << 2,
    GROUP_DRIBBLING = 1 << 3,
    GROUP_DEFENSIVE = 1 << 4,
};

// Bitmask of the groups `type` belongs to
uint8_t EventGroups(EventType type);

// Set-piece label for a one-letter code ("O" -> "Open Play"); unknown codes
// are returned unchanged
std::string SetPieceLabel(const std::string& code);

// SequenceKey: (matchId, sequenceId) identifies a possession chain
struct SequenceKey {
    std::string match_id;
    int64_t sequence_id{0};

    SequenceKey() = default;
    SequenceKey(std::string match, int64_t sequence)
        : match_id(std::move(match)), sequence_id(sequence) {}

    bool operator==(const SequenceKey& other) const {
        return sequence_id == other.sequence_id && match_id == other.match_id;
    }
    bool operator!=(const SequenceKey& other) const { return !(*this == other); }
    bool operator<(const SequenceKey& other) const {
        if (match_id != other.match_id) return match_id < other.match_id;
        return sequence_id < other.sequence_id;
    }

    std::string ToString() const;

    struct Hash {
        size_t operator()(const SequenceKey& key) const {
            size_t h = std::hash<std::string>()(key.match_id);
            return h ^ (std::hash<int64_t>()(key.sequence_id) + 0x9e3779b9 + (h << 6) + (h >> 2));
        }
    };
};

// EventKey: (matchId, sequenceId, eventIndex) identifies one event
struct EventKey {
    SequenceKey sequence;
    size_t event_index{0};

    EventKey() = default;
    EventKey(SequenceKey seq, size_t index) : sequence(std::move(seq)), event_index(index) {}

    bool operator==(const EventKey& other) const {
        return event_index == other.event_index && sequence == other.sequence;
    }
    bool operator!=(const EventKey& other) const { return !(*this == other); }

    std::string ToString() const;
};

// Canonical event. Every field has a defined default so distance math never
// sees a missing value.
struct Event {
    std::string event_id;
    EventType type{EventType::UNKNOWN};
    std::string type_code;          // raw code, kept for unrecognized types
    std::string set_piece;          // one-letter set-piece code
    std::string time;               // formatted game clock
    int period{1};

    std::string team_id;
    std::string team_name;
    int64_t player_id{0};
    std::string player_name;
    int64_t secondary_player_id{0};
    std::string secondary_player_name;
    std::vector<int64_t> key_player_ids;

    bool has_ball_position{false};
    Position ball;

    std::vector<PlayerPosition> home_players;
    std::vector<PlayerPosition> away_players;

    std::string pass_type;          // S, L, T, C, F
    std::string shot_type;
    std::string pressure_type;      // N, P, A
    std::string outcome;
    bool is_goal{false};

    bool IsPass() const { return type == EventType::PA; }
    bool IsShot() const { return type == EventType::SH; }

    // Locate a tracked player by id on either side
    const PlayerPosition* FindPlayer(int64_t id) const;
};

// Ordered possession chain
struct Sequence {
    SequenceKey key;
    std::string set_piece;
    std::string time;
    std::string team_id;
    std::vector<Event> events;

    bool Empty() const { return events.empty(); }
    size_t Size() const { return events.size(); }
};

// Copy of `event` with player lists reduced to its key players
Event LightweightEvent(const Event& event);

} // namespace pitchsim
