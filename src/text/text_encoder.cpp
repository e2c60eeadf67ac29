// File: src/text/text_encoder.cpp
#include "text/text_encoder.hpp"
#include "text/pitch_zone.hpp"
#include <algorithm>
#include <set>

namespace pitchsim {

TextEncoder::TextEncoder(float near_ball_radius)
    : extractor_(near_ball_radius) {}

std::vector<std::string> TextEncoder::EventTokens(const Event& event) const {
    std::vector<std::string> tokens;

    if (!event.type_code.empty()) {
        std::string type_token = "type_" + event.type_code;
        tokens.push_back(type_token);
        tokens.push_back(type_token);
    }

    if (!event.set_piece.empty()) {
        tokens.push_back(SetPieceToken(event.set_piece));
    }

    if (!event.outcome.empty()) {
        tokens.push_back("outcome_" + event.outcome);
    }

    const float ball_x = event.ball.x;
    const float ball_y = event.ball.y;

    if (event.has_ball_position) {
        std::string zone_token = "ballzone_" + PitchZone(ball_x, ball_y);
        tokens.push_back(zone_token);
        tokens.push_back(zone_token);
    }

    if (event.IsShot()) {
        if (!event.outcome.empty()) {
            std::string outcome_token = "shot_outcome_" + event.outcome;
            tokens.insert(tokens.end(), 3, outcome_token);
        }
        if (event.is_goal) {
            tokens.insert(tokens.end(), 3, std::string("is_goal"));
        }
    }

    if (event.IsPass()) {
        if (!event.pass_type.empty()) {
            tokens.push_back("passtype_" + event.pass_type);
        }

        const PlayerPosition* receiver = event.FindPlayer(event.secondary_player_id);
        if (receiver != nullptr && event.has_ball_position) {
            const Position& to = receiver->position;
            tokens.push_back("pass_to_" + PitchZone(to.x, to.y));

            if (to.x > ball_x + kDirectionalPassThreshold) {
                tokens.push_back("pass_forward");
            } else if (to.x < ball_x - kDirectionalPassThreshold) {
                tokens.push_back("pass_backward");
            }
        }
    }

    if (event.has_ball_position) {
        auto near_home = extractor_.PlayersNear(event.home_players, event.ball);
        auto near_away = extractor_.PlayersNear(event.away_players, event.ball);

        // One token per distinct occupied zone, in zone-name order
        std::set<std::string> home_zones;
        for (const auto* p : near_home) {
            home_zones.insert(PitchZone(p->position.x, p->position.y));
        }
        std::set<std::string> away_zones;
        for (const auto* p : near_away) {
            away_zones.insert(PitchZone(p->position.x, p->position.y));
        }

        for (const auto& zone : home_zones) {
            tokens.push_back("near_home_" + zone);
        }
        for (const auto& zone : away_zones) {
            tokens.push_back("near_away_" + zone);
        }

        tokens.push_back(std::string("pressure_") +
                         PressureLevel(near_home.size() + near_away.size()));
    }

    return tokens;
}

std::vector<std::string> TextEncoder::SequenceTokens(const std::vector<Event>& events) const {
    std::vector<std::string> tokens;
    if (events.empty()) {
        return tokens;
    }

    for (const auto& event : events) {
        if (!event.type_code.empty()) {
            tokens.push_back("type_" + event.type_code);
        }
    }

    const Event& first = events.front();
    const Event& last = events.back();

    if (!first.set_piece.empty()) {
        std::string set_piece_token = SetPieceToken(first.set_piece);
        tokens.push_back(set_piece_token);
        tokens.push_back(set_piece_token);
    }

    tokens.push_back(std::string("length_") + LengthCategory(events.size()));

    if (first.has_ball_position) {
        tokens.push_back("start_" + PitchZone(first.ball.x, first.ball.y));
    }
    if (last.has_ball_position) {
        tokens.push_back("end_" + PitchZone(last.ball.x, last.ball.y));
    }
    if (first.has_ball_position && last.has_ball_position) {
        tokens.push_back(std::string("progression_") +
                         ProgressionCategory(last.ball.x - first.ball.x));
    }

    size_t pass_count = std::count_if(events.begin(), events.end(),
                                      [](const Event& e) { return e.IsPass(); });
    if (pass_count > 0) {
        tokens.push_back("passes_" + std::to_string(std::min(pass_count, kMaxPassCount)));
    }

    bool has_shot = std::any_of(events.begin(), events.end(),
                                [](const Event& e) { return e.IsShot(); });
    if (has_shot) {
        tokens.insert(tokens.end(), 2, std::string("has_shot"));
    }

    bool has_goal = std::any_of(events.begin(), events.end(),
                                [](const Event& e) { return e.is_goal; });
    if (has_goal) {
        tokens.insert(tokens.end(), 3, std::string("has_goal"));
    }

    return tokens;
}

std::string TextEncoder::EncodeEvent(const Event& event) const {
    return Join(EventTokens(event));
}

std::string TextEncoder::EncodeSequence(const std::vector<Event>& events) const {
    return Join(SequenceTokens(events));
}

const char* TextEncoder::LengthCategory(size_t length) {
    if (length <= 3) return "short";
    if (length <= 8) return "medium";
    return "long";
}

const char* TextEncoder::ProgressionCategory(float x_displacement) {
    if (x_displacement > 20.0f) return "forward_strong";
    if (x_displacement > 5.0f) return "forward";
    if (x_displacement < -20.0f) return "backward_strong";
    if (x_displacement < -5.0f) return "backward";
    return "lateral";
}

const char* TextEncoder::PressureLevel(size_t near_players) {
    if (near_players <= 2) return "low";
    if (near_players <= 4) return "medium";
    return "high";
}

std::string TextEncoder::Join(const std::vector<std::string>& tokens) {
    std::string text;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            text += ' ';
        }
        text += tokens[i];
    }
    return text;
}

std::string TextEncoder::SetPieceToken(const std::string& code) {
    std::string label = SetPieceLabel(code);
    std::replace(label.begin(), label.end(), ' ', '_');
    return "setpiece_" + label;
}

} // namespace pitchsim
