// File: src/core/types.cpp
#include "core/types.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <sstream>

namespace pitchsim {

float Position::DistanceTo(const Position& other) const {
    float dx = other.x - x;
    float dy = other.y - y;
    return std::sqrt(dx * dx + dy * dy);
}

// Enum implementations

namespace {

struct EventTypeInfo {
    const char* code;
    const char* label;
    uint8_t groups;
};

// Indexed by EventType. CA belongs to both control and dribbling, RE to both
// control and defensive.
constexpr std::array<EventTypeInfo, static_cast<size_t>(EventType::COUNT)> kEventTypeTable{{
    {"", "Unknown", GROUP_NONE},
    {"PA", "Pass", GROUP_PASSING},
    {"SH", "Shot", GROUP_SHOOTING},
    {"IT", "Initial Touch", GROUP_CONTROL},
    {"RE", "Rebound", GROUP_CONTROL | GROUP_DEFENSIVE},
    {"CR", "Cross", GROUP_PASSING},
    {"CA", "Carry", GROUP_CONTROL | GROUP_DRIBBLING},
    {"DR", "Dribble", GROUP_DRIBBLING},
    {"CL", "Clearance", GROUP_DEFENSIVE},
    {"TO", "Touch", GROUP_CONTROL},
    {"FK", "Free Kick", GROUP_PASSING},
    {"CK", "Corner Kick", GROUP_PASSING},
    {"TI", "Throw-in", GROUP_PASSING},
    {"GK", "Goal Kick", GROUP_PASSING},
    {"PK", "Penalty Kick", GROUP_SHOOTING},
    {"OG", "Own Goal", GROUP_NONE},
    {"CH", "Challenge", GROUP_NONE},
    {"TC", "Touch", GROUP_NONE},
    {"BC", "Ball Carry", GROUP_NONE},
}};

} // namespace

const char* ToString(EventType type) {
    size_t index = static_cast<size_t>(type);
    if (index >= kEventTypeTable.size()) {
        return "";
    }
    return kEventTypeTable[index].code;
}

const char* EventTypeLabel(EventType type) {
    size_t index = static_cast<size_t>(type);
    if (index >= kEventTypeTable.size()) {
        return "Unknown";
    }
    return kEventTypeTable[index].label;
}

EventType ParseEventType(const std::string& code) {
    if (code.empty()) {
        return EventType::UNKNOWN;
    }
    for (size_t i = 1; i < kEventTypeTable.size(); ++i) {
        if (code == kEventTypeTable[i].code) {
            return static_cast<EventType>(i);
        }
    }
    return EventType::UNKNOWN;
}

uint8_t EventGroups(EventType type) {
    size_t index = static_cast<size_t>(type);
    if (index >= kEventTypeTable.size()) {
        return GROUP_NONE;
    }
    return kEventTypeTable[index].groups;
}

std::string SetPieceLabel(const std::string& code) {
    static const std::map<std::string, std::string> kLabels = {
        {"O", "Open Play"},
        {"T", "Throw-in"},
        {"C", "Corner"},
        {"K", "Kickoff"},
        {"P", "Penalty"},
        {"G", "Goal Kick"},
        {"F", "Free Kick"},
    };
    auto it = kLabels.find(code);
    return it != kLabels.end() ? it->second : code;
}

// Keys

std::string SequenceKey::ToString() const {
    std::ostringstream oss;
    oss << match_id << "/" << sequence_id;
    return oss.str();
}

std::string EventKey::ToString() const {
    std::ostringstream oss;
    oss << sequence.ToString() << "#" << event_index;
    return oss.str();
}

// Event

const PlayerPosition* Event::FindPlayer(int64_t id) const {
    if (id == 0) {
        return nullptr;
    }
    for (const auto& p : home_players) {
        if (p.player_id == id) return &p;
    }
    for (const auto& p : away_players) {
        if (p.player_id == id) return &p;
    }
    return nullptr;
}

Event LightweightEvent(const Event& event) {
    Event light = event;

    auto is_key = [&event](const PlayerPosition& p) {
        return std::find(event.key_player_ids.begin(), event.key_player_ids.end(),
                         p.player_id) != event.key_player_ids.end();
    };

    light.home_players.clear();
    light.away_players.clear();
    for (const auto& p : event.home_players) {
        if (is_key(p)) light.home_players.push_back(p);
    }
    for (const auto& p : event.away_players) {
        if (is_key(p)) light.away_players.push_back(p);
    }
    return light;
}

} // namespace pitchsim
