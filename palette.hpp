/**
 * Palette Module - theme palettes derived from a single seed color
 *
 * A ThemeColors record holds the eleven roles a theme is styled with.
 * from_primary() builds a light palette around the seed hue; dark_mode()
 * re-derives every role from the light primary's hue and saturation.
 */

#ifndef CHROMA_PALETTE_HPP
#define CHROMA_PALETTE_HPP

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "convert.hpp"
#include "wcag.hpp"

namespace chroma {
namespace palette {

struct ThemeColors {
    std::string primary;
    std::string secondary;
    std::string accent;
    std::string background;
    std::string surface;
    std::string text;
    std::string text_muted;
    std::string border;
    std::string success;
    std::string warning;
    std::string error;
};

enum class Role {
    Primary,
    Secondary,
    Accent,
    Background,
    Surface,
    Text,
    TextMuted,
    Border,
    Success,
    Warning,
    Error
};

constexpr Role ROLES[] = {
    Role::Primary, Role::Secondary, Role::Accent, Role::Background,
    Role::Surface, Role::Text, Role::TextMuted, Role::Border,
    Role::Success, Role::Warning, Role::Error
};

// Serialized role keys, as the persistence layer stores them.
inline const char* role_name(Role role) {
    switch (role) {
        case Role::Primary: return "primary";
        case Role::Secondary: return "secondary";
        case Role::Accent: return "accent";
        case Role::Background: return "background";
        case Role::Surface: return "surface";
        case Role::Text: return "text";
        case Role::TextMuted: return "textMuted";
        case Role::Border: return "border";
        case Role::Success: return "success";
        case Role::Warning: return "warning";
        case Role::Error: return "error";
    }
    return "primary";
}

// Field holding a role, usable on both const and mutable records.
inline std::string ThemeColors::*member(Role role) {
    switch (role) {
        case Role::Primary: return &ThemeColors::primary;
        case Role::Secondary: return &ThemeColors::secondary;
        case Role::Accent: return &ThemeColors::accent;
        case Role::Background: return &ThemeColors::background;
        case Role::Surface: return &ThemeColors::surface;
        case Role::Text: return &ThemeColors::text;
        case Role::TextMuted: return &ThemeColors::text_muted;
        case Role::Border: return &ThemeColors::border;
        case Role::Success: return &ThemeColors::success;
        case Role::Warning: return &ThemeColors::warning;
        case Role::Error: return &ThemeColors::error;
    }
    return &ThemeColors::primary;
}

inline std::string& get(ThemeColors& colors, Role role) { return colors.*member(role); }

inline const std::string& get(const ThemeColors& colors, Role role) { return colors.*member(role); }

inline void set(ThemeColors& colors, Role role, const std::string& hex) {
    get(colors, role) = hex;
}

inline bool operator==(const ThemeColors& a, const ThemeColors& b) {
    for (Role role : ROLES) {
        if (get(a, role) != get(b, role)) return false;
    }
    return true;
}

inline bool operator!=(const ThemeColors& a, const ThemeColors& b) { return !(a == b); }

// =============================================================================
// Semantic brand colors (seed independent)
// =============================================================================

constexpr const char* LIGHT_SURFACE = "#FFFFFF";
constexpr const char* LIGHT_SUCCESS = "#10B981";
constexpr const char* LIGHT_WARNING = "#F59E0B";
constexpr const char* LIGHT_ERROR = "#EF4444";

constexpr const char* DARK_SUCCESS = "#34D399";
constexpr const char* DARK_WARNING = "#FBBF24";
constexpr const char* DARK_ERROR = "#F87171";

// =============================================================================
// Derivation
// =============================================================================

inline ThemeColors from_primary(const std::string& primary) {
    Hsl seed = hex_to_hsl(primary);
    double h = seed.h, s = seed.s, l = seed.l;

    ThemeColors colors;
    colors.primary = primary;
    colors.secondary = hsl_to_hex(h + 30, std::max(s - 10, 0.0), l);
    colors.accent = hsl_to_hex(h + 180, std::min(s + 10, 100.0), l);
    colors.background = hsl_to_hex(h, 5, 98);
    colors.surface = LIGHT_SURFACE;
    colors.text = hsl_to_hex(h, 10, 15);
    colors.text_muted = hsl_to_hex(h, 5, 45);
    colors.border = hsl_to_hex(h, 10, 88);
    colors.success = LIGHT_SUCCESS;
    colors.warning = LIGHT_WARNING;
    colors.error = LIGHT_ERROR;
    return colors;
}

/**
 * Only the hue and saturation of light.primary survive; every lightness is
 * fixed for a dark surface. Not an involution: feeding the result back in
 * does not recover the light palette.
 */
inline ThemeColors dark_mode(const ThemeColors& light) {
    Hsl seed = hex_to_hsl(light.primary);
    double h = seed.h, s = seed.s;

    ThemeColors colors;
    colors.primary = hsl_to_hex(h, std::min(s + 10, 100.0), 60);
    colors.secondary = hsl_to_hex(h + 30, std::min(s, 80.0), 55);
    colors.accent = hsl_to_hex(h + 180, std::min(s + 15, 100.0), 65);
    colors.background = hsl_to_hex(h, 15, 10);
    colors.surface = hsl_to_hex(h, 12, 15);
    colors.text = hsl_to_hex(h, 5, 95);
    colors.text_muted = hsl_to_hex(h, 5, 60);
    colors.border = hsl_to_hex(h, 10, 25);
    colors.success = DARK_SUCCESS;
    colors.warning = DARK_WARNING;
    colors.error = DARK_ERROR;
    return colors;
}

// Seed suggestion: any hue, moderately saturated, mid lightness.
inline std::string random_primary(std::mt19937& rng) {
    std::uniform_int_distribution<int> hue(0, 359);
    std::uniform_int_distribution<int> sat(50, 89);
    std::uniform_int_distribution<int> light(40, 59);
    int h = hue(rng);
    int s = sat(rng);
    int l = light(rng);
    return hsl_to_hex(h, s, l);
}

// =============================================================================
// Contrast audit
// =============================================================================

struct RoleContrast {
    Role foreground;
    Role background;
    wcag2::Check check;
};

// Reading pairs a theme is judged on: body, muted and link text on both
// page background and card surface.
inline std::vector<RoleContrast> audit(const ThemeColors& colors) {
    static constexpr Role FOREGROUNDS[] = {Role::Text, Role::TextMuted, Role::Primary};
    static constexpr Role BACKGROUNDS[] = {Role::Background, Role::Surface};

    std::vector<RoleContrast> results;
    for (Role bg : BACKGROUNDS) {
        for (Role fg : FOREGROUNDS) {
            results.push_back({fg, bg, wcag2::check(get(colors, fg), get(colors, bg))});
        }
    }
    return results;
}

} // namespace palette
} // namespace chroma

#endif // CHROMA_PALETTE_HPP
