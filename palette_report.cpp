/**
 * palette_report - print a derived theme palette with its WCAG audit,
 * a harmony scheme and color vision previews.
 *
 * Usage: palette_report <hex> [--dark] [--harmony <type>] [--vision <mode>]
 */

#include <cstdio>
#include <cstring>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "chroma.hpp"
#include "report.hpp"

struct Options {
    std::string primary;
    bool dark = false;
    chroma::harmony::Type harmony = chroma::harmony::Type::Complementary;
    std::optional<chroma::vision::Mode> vision;  // all modes when unset
};

static void usage(const char* argv0) {
    fprintf(stderr, "Usage: %s <hex> [--dark] [--harmony <type>] [--vision <mode>]\n", argv0);
    fprintf(stderr, "  harmony types:");
    for (auto type : chroma::harmony::TYPES) fprintf(stderr, " %s", chroma::harmony::name(type));
    fprintf(stderr, "\n  vision modes:");
    for (auto mode : chroma::vision::MODES) fprintf(stderr, " %s", chroma::vision::name(mode));
    fprintf(stderr, "\n");
}

static bool parse_args(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--dark") == 0) {
            opts.dark = true;
        } else if (strcmp(argv[i], "--harmony") == 0 && i + 1 < argc) {
            auto type = chroma::harmony::parse(argv[++i]);
            if (!type) {
                fprintf(stderr, "Unknown harmony type: %s\n", argv[i]);
                return false;
            }
            opts.harmony = *type;
        } else if (strcmp(argv[i], "--vision") == 0 && i + 1 < argc) {
            auto mode = chroma::vision::parse(argv[++i]);
            if (!mode) {
                fprintf(stderr, "Unknown vision mode: %s\n", argv[i]);
                return false;
            }
            opts.vision = *mode;
        } else if (argv[i][0] != '-' && opts.primary.empty()) {
            opts.primary = argv[i];
        } else {
            fprintf(stderr, "Unexpected argument: %s\n", argv[i]);
            return false;
        }
    }

    if (opts.primary.empty()) {
        fprintf(stderr, "Missing primary color\n");
        return false;
    }
    if (!chroma::is_valid_hex(opts.primary)) {
        fprintf(stderr, "Invalid hex color: %s (expected #rrggbb)\n", opts.primary.c_str());
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        usage(argv[0]);
        return 1;
    }

    chroma::palette::ThemeColors colors = chroma::palette::from_primary(opts.primary);
    const char* title = "Light Palette";
    if (opts.dark) {
        colors = chroma::palette::dark_mode(colors);
        title = "Dark Palette";
    }

    report::print_theme(title, colors);
    report::print(report::make_harmony_block(colors.primary, opts.harmony));

    std::vector<chroma::vision::Mode> modes;
    if (opts.vision) {
        modes.push_back(*opts.vision);
    } else {
        modes.assign(std::begin(chroma::vision::MODES), std::end(chroma::vision::MODES));
    }
    report::print(report::make_vision_table(colors, modes));

    return 0;
}
