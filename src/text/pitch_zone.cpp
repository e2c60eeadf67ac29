// File: src/text/pitch_zone.cpp
#include "text/pitch_zone.hpp"

namespace pitchsim {

LengthBand ClassifyLength(float x) {
    if (x < -40.0f) return LengthBand::OWN_BOX;
    if (x < -25.0f) return LengthBand::DEF_DEEP;
    if (x < -10.0f) return LengthBand::DEF;
    if (x < 10.0f) return LengthBand::MID;
    if (x < 25.0f) return LengthBand::ATT;
    if (x < 40.0f) return LengthBand::ATT_DEEP;
    return LengthBand::OPP_BOX;
}

WidthBand ClassifyWidth(float y) {
    if (y < -20.0f) return WidthBand::LEFT_WIDE;
    if (y < -7.0f) return WidthBand::LEFT;
    if (y < 7.0f) return WidthBand::CENTER;
    if (y < 20.0f) return WidthBand::RIGHT;
    return WidthBand::RIGHT_WIDE;
}

const char* ToString(LengthBand band) {
    switch (band) {
        case LengthBand::OWN_BOX: return "own_box";
        case LengthBand::DEF_DEEP: return "def_deep";
        case LengthBand::DEF: return "def";
        case LengthBand::MID: return "mid";
        case LengthBand::ATT: return "att";
        case LengthBand::ATT_DEEP: return "att_deep";
        case LengthBand::OPP_BOX: return "opp_box";
        default: return "unknown";
    }
}

const char* ToString(WidthBand band) {
    switch (band) {
        case WidthBand::LEFT_WIDE: return "left_wide";
        case WidthBand::LEFT: return "left";
        case WidthBand::CENTER: return "center";
        case WidthBand::RIGHT: return "right";
        case WidthBand::RIGHT_WIDE: return "right_wide";
        default: return "unknown";
    }
}

std::string PitchZone(float x, float y) {
    std::string zone = ToString(ClassifyLength(x));
    zone += "_";
    zone += ToString(ClassifyWidth(y));
    return zone;
}

} // namespace pitchsim
