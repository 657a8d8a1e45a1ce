/**
 * Vision Module - color vision deficiency preview
 *
 * Fast approximation: a fixed 3x3 matrix applied straight to the
 * gamma-encoded RGB triple. Working in display space rather than linear
 * light is deliberate; every expected output depends on it.
 */

#ifndef CHROMA_VISION_HPP
#define CHROMA_VISION_HPP

#include <optional>
#include <string>

#include "convert.hpp"
#include "palette.hpp"

namespace chroma {
namespace vision {

enum class Mode {
    Normal,
    Protanopia,
    Deuteranopia,
    Tritanopia,
    Achromatopsia
};

constexpr Mode MODES[] = {
    Mode::Normal,
    Mode::Protanopia,
    Mode::Deuteranopia,
    Mode::Tritanopia,
    Mode::Achromatopsia
};

struct Matrix {
    double m[3][3];
};

inline const Matrix& matrix(Mode mode) {
    static constexpr Matrix NORMAL = {{
        {1, 0, 0},
        {0, 1, 0},
        {0, 0, 1},
    }};
    static constexpr Matrix PROTANOPIA = {{
        {0.567, 0.433, 0},
        {0.558, 0.442, 0},
        {0, 0.242, 0.758},
    }};
    static constexpr Matrix DEUTERANOPIA = {{
        {0.625, 0.375, 0},
        {0.7, 0.3, 0},
        {0, 0.3, 0.7},
    }};
    static constexpr Matrix TRITANOPIA = {{
        {0.95, 0.05, 0},
        {0, 0.433, 0.567},
        {0, 0.475, 0.525},
    }};
    // Rec. 601 luma in every row
    static constexpr Matrix ACHROMATOPSIA = {{
        {0.299, 0.587, 0.114},
        {0.299, 0.587, 0.114},
        {0.299, 0.587, 0.114},
    }};

    switch (mode) {
        case Mode::Normal: return NORMAL;
        case Mode::Protanopia: return PROTANOPIA;
        case Mode::Deuteranopia: return DEUTERANOPIA;
        case Mode::Tritanopia: return TRITANOPIA;
        case Mode::Achromatopsia: return ACHROMATOPSIA;
    }
    return NORMAL;
}

inline const char* name(Mode mode) {
    switch (mode) {
        case Mode::Normal: return "normal";
        case Mode::Protanopia: return "protanopia";
        case Mode::Deuteranopia: return "deuteranopia";
        case Mode::Tritanopia: return "tritanopia";
        case Mode::Achromatopsia: return "achromatopsia";
    }
    return "normal";
}

inline const char* label(Mode mode) {
    switch (mode) {
        case Mode::Normal: return "Normal";
        case Mode::Protanopia: return "Protanopia";
        case Mode::Deuteranopia: return "Deuteranopia";
        case Mode::Tritanopia: return "Tritanopia";
        case Mode::Achromatopsia: return "Achromatopsia";
    }
    return "Normal";
}

inline const char* description(Mode mode) {
    switch (mode) {
        case Mode::Normal: return "Normal vision";
        case Mode::Protanopia: return "Red-blind (~1% of males)";
        case Mode::Deuteranopia: return "Green-blind (~6% of males)";
        case Mode::Tritanopia: return "Blue-blind (rare)";
        case Mode::Achromatopsia: return "Complete color blindness";
    }
    return "Normal vision";
}

inline std::optional<Mode> parse(const std::string& text) {
    for (Mode mode : MODES) {
        if (text == name(mode)) return mode;
    }
    return std::nullopt;
}

// Normal hands the input back untouched, so it never picks up rounding
// or case changes.
inline std::string simulate(const std::string& hex, Mode mode) {
    if (mode == Mode::Normal) return hex;

    Rgb c = hex_to_rgb(hex);
    const auto& m = matrix(mode).m;
    double r = c.r * m[0][0] + c.g * m[0][1] + c.b * m[0][2];
    double g = c.r * m[1][0] + c.g * m[1][1] + c.b * m[1][2];
    double b = c.r * m[2][0] + c.g * m[2][1] + c.b * m[2][2];
    return rgb_to_hex(r, g, b);
}

inline palette::ThemeColors simulate(const palette::ThemeColors& colors, Mode mode) {
    palette::ThemeColors result = colors;
    for (palette::Role role : palette::ROLES) {
        palette::set(result, role, simulate(palette::get(colors, role), mode));
    }
    return result;
}

} // namespace vision
} // namespace chroma

#endif // CHROMA_VISION_HPP
