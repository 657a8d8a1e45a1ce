/**
 * Harmony Module - hue-rotation color schemes
 *
 * Each scheme rotates the base hue by a fixed set of offsets and keeps
 * saturation and lightness. An achromatic base (s = 0) has no hue to rotate,
 * so every member of its scheme comes out equal to the base.
 */

#ifndef CHROMA_HARMONY_HPP
#define CHROMA_HARMONY_HPP

#include <optional>
#include <string>
#include <vector>

#include "convert.hpp"

namespace chroma {
namespace harmony {

enum class Type {
    Complementary,
    Triadic,
    Tetradic,
    Analogous,
    SplitComplementary
};

constexpr Type TYPES[] = {
    Type::Complementary,
    Type::Triadic,
    Type::Tetradic,
    Type::Analogous,
    Type::SplitComplementary
};

inline const char* name(Type type) {
    switch (type) {
        case Type::Complementary: return "complementary";
        case Type::Triadic: return "triadic";
        case Type::Tetradic: return "tetradic";
        case Type::Analogous: return "analogous";
        case Type::SplitComplementary: return "split-complementary";
    }
    return "complementary";
}

inline std::optional<Type> parse(const std::string& text) {
    for (Type type : TYPES) {
        if (text == name(type)) return type;
    }
    return std::nullopt;
}

// Offsets in output order; 0 marks the slot the base color occupies.
inline std::vector<double> offsets(Type type) {
    switch (type) {
        case Type::Complementary: return {0, 180};
        case Type::Triadic: return {0, 120, 240};
        case Type::Tetradic: return {0, 90, 180, 270};
        case Type::Analogous: return {-30, 0, 30};
        case Type::SplitComplementary: return {0, 150, 210};
    }
    return {0};
}

inline std::string rotate(const std::string& hex, double degrees) {
    Hsl hsl = hex_to_hsl(hex);
    return hsl_to_hex(hsl.h + degrees, hsl.s, hsl.l);
}

/**
 * The base slot carries the caller's string through untouched so that a
 * scheme can be matched back against the swatch it was built from.
 */
inline std::vector<std::string> generate(const std::string& base, Type type) {
    Hsl hsl = hex_to_hsl(base);

    std::vector<std::string> scheme;
    for (double offset : offsets(type)) {
        if (offset == 0) {
            scheme.push_back(base);
        } else {
            scheme.push_back(hsl_to_hex(hsl.h + offset, hsl.s, hsl.l));
        }
    }
    return scheme;
}

} // namespace harmony
} // namespace chroma

#endif // CHROMA_HARMONY_HPP
