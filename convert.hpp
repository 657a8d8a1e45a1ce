/**
 * Convert Module - hex / RGB / HSL conversions
 *
 * Every other module goes through these. Hex is the only serialized form:
 * "#rrggbb", lowercase. RGB channels are integers in [0,255], HSL is
 * hue in degrees [0,360) with saturation and lightness in percent [0,100].
 */

#ifndef CHROMA_CONVERT_HPP
#define CHROMA_CONVERT_HPP

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <optional>
#include <string>

namespace chroma {

struct Rgb {
    int r = 0, g = 0, b = 0;
};

inline bool operator==(const Rgb& a, const Rgb& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const Rgb& a, const Rgb& b) { return !(a == b); }

struct Hsl {
    double h = 0, s = 0, l = 0;
};

// =============================================================================
// Range helpers
// =============================================================================

inline double clamp_channel(double c) {
    if (std::isnan(c)) return 0.0;
    return std::max(0.0, std::min(255.0, c));
}

inline double clamp_percent(double p) {
    if (std::isnan(p)) return 0.0;
    return std::max(0.0, std::min(100.0, p));
}

// Wraps any angle (negative or > 360) into [0,360).
inline double normalize_hue(double h) {
    if (!std::isfinite(h)) return 0.0;
    double wrapped = std::fmod(h, 360.0);
    if (wrapped < 0.0) wrapped += 360.0;
    // fmod of a tiny negative value can round back up to exactly 360
    return wrapped >= 360.0 ? 0.0 : wrapped;
}

// =============================================================================
// Hex
// =============================================================================

namespace detail {

inline int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace detail

/**
 * Parse "#rrggbb" or "rrggbb" (either case). Anything else, including the
 * three-digit shorthand, is rejected with nullopt.
 */
inline std::optional<Rgb> parse_hex(const std::string& hex) {
    size_t start = (!hex.empty() && hex[0] == '#') ? 1 : 0;
    if (hex.size() - start != 6) return std::nullopt;

    int channels[3];
    for (int i = 0; i < 3; i++) {
        int hi = detail::hex_digit(hex[start + i * 2]);
        int lo = detail::hex_digit(hex[start + i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        channels[i] = hi * 16 + lo;
    }
    return Rgb{channels[0], channels[1], channels[2]};
}

inline bool is_valid_hex(const std::string& hex) { return parse_hex(hex).has_value(); }

// Picker-facing adapter: malformed input reads as black.
inline Rgb hex_to_rgb(const std::string& hex) {
    return parse_hex(hex).value_or(Rgb{0, 0, 0});
}

inline std::string rgb_to_hex(double r, double g, double b) {
    char buf[8];
    snprintf(buf, sizeof(buf), "#%02x%02x%02x",
             static_cast<int>(std::round(clamp_channel(r))),
             static_cast<int>(std::round(clamp_channel(g))),
             static_cast<int>(std::round(clamp_channel(b))));
    return buf;
}

inline std::string rgb_to_hex(const Rgb& c) { return rgb_to_hex(c.r, c.g, c.b); }

// =============================================================================
// HSL
// =============================================================================

inline Hsl rgb_to_hsl(double r, double g, double b) {
    r = clamp_channel(r) / 255.0;
    g = clamp_channel(g) / 255.0;
    b = clamp_channel(b) / 255.0;

    double max = std::max({r, g, b});
    double min = std::min({r, g, b});
    double h = 0.0, s = 0.0;
    double l = (max + min) / 2.0;

    if (max != min) {
        double d = max - min;
        s = l > 0.5 ? d / (2.0 - max - min) : d / (max + min);
        if (max == r) {
            h = ((g - b) / d + (g < b ? 6.0 : 0.0)) / 6.0;
        } else if (max == g) {
            h = ((b - r) / d + 2.0) / 6.0;
        } else {
            h = ((r - g) / d + 4.0) / 6.0;
        }
    }

    return {normalize_hue(h * 360.0), s * 100.0, l * 100.0};
}

inline Hsl rgb_to_hsl(const Rgb& c) { return rgb_to_hsl(c.r, c.g, c.b); }

namespace detail {

inline double hue_to_rgb(double p, double q, double t) {
    if (t < 0.0) t += 1.0;
    if (t > 1.0) t -= 1.0;
    if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
    if (t < 1.0 / 2.0) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
    return p;
}

} // namespace detail

inline Rgb hsl_to_rgb(double h, double s, double l) {
    h = normalize_hue(h) / 360.0;
    s = clamp_percent(s) / 100.0;
    l = clamp_percent(l) / 100.0;

    double r, g, b;
    if (s == 0.0) {
        r = g = b = l;
    } else {
        double q = l < 0.5 ? l * (1.0 + s) : l + s - l * s;
        double p = 2.0 * l - q;
        r = detail::hue_to_rgb(p, q, h + 1.0 / 3.0);
        g = detail::hue_to_rgb(p, q, h);
        b = detail::hue_to_rgb(p, q, h - 1.0 / 3.0);
    }

    return {static_cast<int>(std::round(r * 255.0)),
            static_cast<int>(std::round(g * 255.0)),
            static_cast<int>(std::round(b * 255.0))};
}

inline Rgb hsl_to_rgb(const Hsl& c) { return hsl_to_rgb(c.h, c.s, c.l); }

inline std::string hsl_to_hex(double h, double s, double l) {
    return rgb_to_hex(hsl_to_rgb(h, s, l));
}

inline std::string hsl_to_hex(const Hsl& c) { return hsl_to_hex(c.h, c.s, c.l); }

inline Hsl hex_to_hsl(const std::string& hex) { return rgb_to_hsl(hex_to_rgb(hex)); }

} // namespace chroma

#endif // CHROMA_CONVERT_HPP
