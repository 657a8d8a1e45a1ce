/**
 * WCAG Module - relative luminance and contrast classification
 *
 * Reference: https://www.w3.org/TR/WCAG21/#dfn-relative-luminance
 * L = 0.2126 * R + 0.7152 * G + 0.0722 * B on linearized sRGB channels.
 */

#ifndef CHROMA_WCAG_HPP
#define CHROMA_WCAG_HPP

#include <algorithm>
#include <cmath>
#include <string>

#include "convert.hpp"

namespace chroma {
namespace wcag2 {

// Minimum ratios (inclusive)
constexpr double AAA_RATIO = 7.0;
constexpr double AA_RATIO = 4.5;
constexpr double AA_LARGE_RATIO = 3.0;
constexpr double AAA_LARGE_RATIO = 4.5;

// Input is an sRGB channel in [0,255]. WCAG 2.1 still uses the 0.03928 knee.
inline double linearize(double channel) {
    double c = clamp_channel(channel) / 255.0;
    return c <= 0.03928 ? c / 12.92 : std::pow((c + 0.055) / 1.055, 2.4);
}

inline double luminance(double r, double g, double b) {
    return 0.2126 * linearize(r) + 0.7152 * linearize(g) + 0.0722 * linearize(b);
}

inline double luminance(const Rgb& c) { return luminance(c.r, c.g, c.b); }

inline double contrast_ratio(const Rgb& a, const Rgb& b) {
    double l1 = luminance(a);
    double l2 = luminance(b);
    double lighter = std::max(l1, l2);
    double darker = std::min(l1, l2);
    return (lighter + 0.05) / (darker + 0.05);
}

// Always >= 1, independent of argument order.
inline double contrast_ratio(const std::string& a, const std::string& b) {
    return contrast_ratio(hex_to_rgb(a), hex_to_rgb(b));
}

struct Compliance {
    std::string level;  // "AAA", "AA", "AA Large" or "Fail"
    bool aa;
    bool aaa;
    bool aa_large;
    bool aaa_large;
};

inline Compliance level(double ratio) {
    Compliance c;
    c.aa = ratio >= AA_RATIO;
    c.aaa = ratio >= AAA_RATIO;
    c.aa_large = ratio >= AA_LARGE_RATIO;
    c.aaa_large = ratio >= AAA_LARGE_RATIO;

    if (c.aaa) c.level = "AAA";
    else if (c.aa) c.level = "AA";
    else if (c.aa_large) c.level = "AA Large";
    else c.level = "Fail";
    return c;
}

struct Check {
    double ratio;
    Compliance compliance;
};

inline Check check(const std::string& foreground, const std::string& background) {
    double ratio = contrast_ratio(foreground, background);
    return {ratio, level(ratio)};
}

} // namespace wcag2
} // namespace chroma

#endif // CHROMA_WCAG_HPP
