// File: src/text/pitch_zone.hpp
#pragma once

#include <cstdint>
#include <string>

namespace pitchsim {

// Discretization of a 105 x 68 pitch centred on the origin. The thresholds
// are fixed and independent of any runtime configuration.

enum class LengthBand : uint8_t {
    OWN_BOX,      // x < -40
    DEF_DEEP,     // x < -25
    DEF,          // x < -10
    MID,          // x < 10
    ATT,          // x < 25
    ATT_DEEP,     // x < 40
    OPP_BOX,      // otherwise
};

enum class WidthBand : uint8_t {
    LEFT_WIDE,    // y < -20
    LEFT,         // y < -7
    CENTER,       // y < 7
    RIGHT,        // y < 20
    RIGHT_WIDE,   // otherwise
};

LengthBand ClassifyLength(float x);
WidthBand ClassifyWidth(float y);

const char* ToString(LengthBand band);
const char* ToString(WidthBand band);

/// Zone name for a point, e.g. "att_deep_right"
std::string PitchZone(float x, float y);

} // namespace pitchsim
