// File: src/text/text_encoder.hpp
#pragma once

#include "core/types.hpp"
#include "features/feature_extractor.hpp"
#include <string>
#include <vector>

namespace pitchsim {

/// Deterministic tokenizer for events and possession chains.
///
/// Tokens are namespaced (type_PA, ballzone_mid_center, near_home_att_left,
/// ...). Repeating a token raises its term frequency, which is how the
/// encoder weights the more telling features.
class TextEncoder {
public:
    explicit TextEncoder(float near_ball_radius = FeatureExtractor::kDefaultNearBallRadius);

    /// Tokens of one event
    std::vector<std::string> EventTokens(const Event& event) const;

    /// Tokens of one possession chain
    std::vector<std::string> SequenceTokens(const std::vector<Event>& events) const;

    /// Space-separated EventTokens()
    std::string EncodeEvent(const Event& event) const;

    /// Space-separated SequenceTokens()
    std::string EncodeSequence(const std::vector<Event>& events) const;

    /// "short" (<= 3 events), "medium" (<= 8) or "long"
    static const char* LengthCategory(size_t length);

    /// Progression bucket for an x displacement
    static const char* ProgressionCategory(float x_displacement);

    /// "low" (<= 2 near-ball players), "medium" (<= 4) or "high"
    static const char* PressureLevel(size_t near_players);

    static constexpr size_t kMaxPassCount = 10;
    static constexpr float kDirectionalPassThreshold = 10.0f;

private:
    FeatureExtractor extractor_;

    static std::string Join(const std::vector<std::string>& tokens);
    static std::string SetPieceToken(const std::string& code);
};

} // namespace pitchsim
