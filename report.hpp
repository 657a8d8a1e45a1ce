/**
 * Report Module - FTXUI-based terminal rendering of theme palettes
 */

#ifndef CHROMA_REPORT_HPP
#define CHROMA_REPORT_HPP

#include <cstdio>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <ftxui/screen/color.hpp>

#include "chroma.hpp"

namespace report {

inline ftxui::Color to_color(const std::string& hex) {
    chroma::Rgb c = chroma::hex_to_rgb(hex);
    return ftxui::Color::RGB(c.r, c.g, c.b);
}

// WCAG levels:
// >= 7:   AAA body text
// >= 4.5: AA body text
// >= 3:   AA large text only
// < 3:    Fail
inline ftxui::Color wcag_status_color(const chroma::wcag2::Compliance& c) {
    if (c.aaa) return ftxui::Color::Cyan;
    if (c.aa) return ftxui::Color::Green;
    if (c.aa_large) return ftxui::Color::Yellow;
    return ftxui::Color::Red;
}

inline const char* wcag_status_symbol(const chroma::wcag2::Compliance& c) {
    if (c.aaa) return "★";
    if (c.aa) return "✓";
    if (c.aa_large) return "~";
    return "✗";
}

inline ftxui::Element ratio_cell(const std::string& fg, const std::string& bg) {
    namespace f = ftxui;
    chroma::wcag2::Check check = chroma::wcag2::check(fg, bg);

    char ratio_str[24];
    snprintf(ratio_str, sizeof(ratio_str), "%s%6.2f", wcag_status_symbol(check.compliance), check.ratio);
    return f::text(ratio_str) | f::color(to_color(fg)) | f::bgcolor(to_color(bg));
}

inline ftxui::Element with_title(const std::string& title, ftxui::Element body) {
    namespace f = ftxui;
    return f::vbox({
        f::text(title) | f::bold,
        f::separator(),
        body
    });
}

inline ftxui::Element make_palette_table(const std::string& title,
                                         const chroma::palette::ThemeColors& colors) {
    namespace f = ftxui;
    using chroma::palette::Role;

    std::vector<std::vector<f::Element>> rows;
    rows.push_back({
        f::text(" Role ") | f::bold,
        f::text("  ") | f::bold,
        f::text(" Hex ") | f::bold,
        f::text(" on background ") | f::bold,
        f::text(" on surface ") | f::bold
    });

    const std::string& background = chroma::palette::get(colors, Role::Background);
    const std::string& surface = chroma::palette::get(colors, Role::Surface);

    for (Role role : chroma::palette::ROLES) {
        const std::string& hex = chroma::palette::get(colors, role);
        rows.push_back({
            f::text(std::string(" ") + chroma::palette::role_name(role) + " "),
            f::text("    ") | f::bgcolor(to_color(hex)),
            f::text(" " + chroma::rgb_to_hex(chroma::hex_to_rgb(hex)) + " "),
            role == Role::Background ? f::text("  ---  ") : ratio_cell(hex, background),
            role == Role::Surface ? f::text("  ---  ") : ratio_cell(hex, surface)
        });
    }

    auto table = f::Table(rows);
    table.SelectAll().SeparatorVertical(f::LIGHT);
    table.SelectRow(0).BorderBottom(f::LIGHT);

    return with_title(title, table.Render());
}

inline ftxui::Element make_audit_table(const chroma::palette::ThemeColors& colors) {
    namespace f = ftxui;

    std::vector<std::vector<f::Element>> rows;
    rows.push_back({
        f::text(" Pair ") | f::bold,
        f::text(" Ratio ") | f::bold,
        f::text(" Level ") | f::bold
    });

    for (const auto& entry : chroma::palette::audit(colors)) {
        const std::string& fg = chroma::palette::get(colors, entry.foreground);
        const std::string& bg = chroma::palette::get(colors, entry.background);
        std::string pair_label = std::string(" ") + chroma::palette::role_name(entry.foreground) +
                                 " on " + chroma::palette::role_name(entry.background) + " ";

        char ratio_str[16];
        snprintf(ratio_str, sizeof(ratio_str), " %5.2f:1 ", entry.check.ratio);

        rows.push_back({
            f::text(pair_label) | f::color(to_color(fg)) | f::bgcolor(to_color(bg)),
            f::text(ratio_str),
            f::text(" " + entry.check.compliance.level + " ") |
                f::color(wcag_status_color(entry.check.compliance))
        });
    }

    auto table = f::Table(rows);
    table.SelectAll().SeparatorVertical(f::LIGHT);
    table.SelectRow(0).BorderBottom(f::LIGHT);

    return with_title("WCAG Audit", table.Render());
}

inline ftxui::Element make_swatch_row(const std::vector<std::string>& swatches) {
    namespace f = ftxui;

    std::vector<f::Element> cells;
    for (const auto& hex : swatches) {
        cells.push_back(f::vbox({
            f::text("         ") | f::bgcolor(to_color(hex)),
            f::text(" " + hex + " ")
        }));
        cells.push_back(f::text(" "));
    }
    return f::hbox(std::move(cells));
}

inline ftxui::Element make_harmony_block(const std::string& base, chroma::harmony::Type type) {
    std::string title = std::string("Harmony: ") + chroma::harmony::name(type);
    return with_title(title, make_swatch_row(chroma::harmony::generate(base, type)));
}

// One row per simulated vision mode, one column per role.
inline ftxui::Element make_vision_table(const chroma::palette::ThemeColors& colors,
                                        const std::vector<chroma::vision::Mode>& modes) {
    namespace f = ftxui;
    using chroma::palette::Role;

    std::vector<std::vector<f::Element>> rows;

    std::vector<f::Element> header = {f::text(" Mode ") | f::bold};
    for (Role role : chroma::palette::ROLES) {
        header.push_back(f::text(std::string(" ") + chroma::palette::role_name(role) + " ") | f::bold);
    }
    rows.push_back(header);

    for (auto mode : modes) {
        chroma::palette::ThemeColors seen = chroma::vision::simulate(colors, mode);
        std::vector<f::Element> row = {f::text(std::string(" ") + chroma::vision::label(mode) + " ")};
        for (Role role : chroma::palette::ROLES) {
            row.push_back(f::text("  ") | f::bgcolor(to_color(chroma::palette::get(seen, role))));
        }
        rows.push_back(row);
    }

    auto table = f::Table(rows);
    table.SelectAll().SeparatorVertical(f::LIGHT);
    table.SelectRow(0).BorderBottom(f::LIGHT);
    table.SelectColumn(0).BorderRight(f::LIGHT);

    return with_title("Color Vision Preview", table.Render());
}

inline void print(ftxui::Element element) {
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
    ftxui::Render(screen, element);
    screen.Print();
    std::cout << std::endl;
}

inline void print_theme(const std::string& title, const chroma::palette::ThemeColors& colors) {
    namespace f = ftxui;

    auto layout = f::hbox({
        make_palette_table(title, colors),
        f::text("  "),
        make_audit_table(colors)
    });
    print(layout);

    // WCAG legend
    std::cout << "WCAG: \033[36m★\033[0m≥7(AAA) \033[32m✓\033[0m≥4.5(AA) \033[33m~\033[0m≥3(large) \033[31m✗\033[0m<3" << std::endl;
}

} // namespace report

#endif // CHROMA_REPORT_HPP
