// src/core/color_alignment.cpp
// 三种对齐方式：水平渐变、垂直渐变、自定义调色板替换

#include "color_alignment.h"
#include "canvas_metrics.h"
#include "line_state.h"
#include "placeholder_scanner.h"
#include "recolor_error.h"
#include "utils/GraphemeUtils.h"

#include <stdexcept>
#include <vector>

namespace { // Anonymous namespace for internal helpers

const string& neutralColor(TerminalTheme theme) {
    return theme == TerminalTheme::LIGHT ? ANSI_NEUTRAL_LIGHT_THEME : ANSI_NEUTRAL_DARK_THEME;
}

string fillStartingOrThrow(std::string_view asc) {
    try {
        return fillStarting(asc);
    } catch (const RecolorError& e) {
        throw e.withContext("failed to fill in starting color codes");
    }
}

ColorProfile spreadOrThrow(const ColorProfile& profile, int length) {
    try {
        return profile.spreadTo(static_cast<size_t>(length));
    } catch (const RecolorError& e) {
        throw e.withContext("failed to spread color profile to length " + std::to_string(length));
    }
}

// Replacements that leave every token in place except `slot`.
PlaceholderReplacements replaceOnly(int slot, const string& replacement) {
    const PlaceholderScanner& scanner = PlaceholderScanner::instance();
    PlaceholderReplacements replacements = scanner.patterns();
    replacements[static_cast<size_t>(slot - 1)] = replacement;
    return replacements;
}

string appendResetToLines(const string& asc) {
    vector<string> lines = splitLines(asc);
    for (auto& line : lines) {
        line += ANSI_RESET_FG_BG;
    }
    return joinLines(lines);
}

string recolorHorizontalForeBack(std::string_view asc, const ForeBackPair& foreBack, const ColorProfile& profile,
                                 AnsiMode colorMode, TerminalTheme theme) {
    const PlaceholderScanner& scanner = PlaceholderScanner::instance();
    string art = fillStartingOrThrow(asc);

    // Measured before any escape is inserted, escapes are not placeholders
    const int height = asciiSize(art).height;

    // Foreground slot becomes the neutral color; only literal tokens are matched.
    art = scanner.replaceAll(art, replaceOnly(foreBack.fore, neutralColor(theme)));

    const ColorProfile rows = spreadOrThrow(profile, height);

    vector<string> lines = splitLines(art);
    for (size_t i = 0; i < lines.size(); ++i) {
        // "background" in the ascii art, but foreground text in the terminal
        const string rowColor = rows.colorAt(i).toAnsiString(colorMode, ForegroundBackground::FOREGROUND);
        lines[i] = scanner.replaceAll(lines[i], replaceOnly(foreBack.back, rowColor)) + ANSI_RESET_FG_BG;
    }

    // Slots other than fore/back disappear
    return scanner.strip(joinLines(lines));
}

// Gradient colors for the display columns [column, column + width).
ColorProfile columnSlice(const ColorProfile& columns, size_t column, size_t width) {
    ColorProfile slice = columns.slice(column, column + width);
    if (slice.empty() && !columns.empty()) {
        slice = columns.slice(columns.length() - 1, columns.length());
    }
    return slice;
}

string recolorVerticalForeBack(std::string_view asc, const ForeBackPair& foreBack, const ColorProfile& profile,
                               AnsiMode colorMode, TerminalTheme theme) {
    const PlaceholderScanner& scanner = PlaceholderScanner::instance();
    const string art = fillStartingOrThrow(asc);

    const int width = asciiSize(art).width;
    const ColorProfile columns = width > 0 ? spreadOrThrow(profile, width) : ColorProfile();

    vector<string> lines = splitLines(art);
    for (size_t lineIdx = 0; lineIdx < lines.size(); ++lineIdx) {
        const string& line = lines[lineIdx];
        const vector<PlaceholderMatch> matches = scanner.findAll(line);
        if (matches.empty()) {
            throw std::logic_error("line " + std::to_string(lineIdx + 1) +
                                   " has no color code after fillStarting");
        }

        // Spaces in front of the first code keep their columns but stay uncolored.
        string dst = line.substr(0, matches.front().start);
        size_t column = GraphemeUtils::count(dst);

        for (size_t m = 0; m < matches.size(); ++m) {
            const size_t spanStart = matches[m].end;
            const size_t spanEnd = (m + 1 < matches.size()) ? matches[m + 1].start : line.size();
            const string txt = line.substr(spanStart, spanEnd - spanStart);
            const size_t txtWidth = GraphemeUtils::count(txt);
            const int slot = matches[m].slot;

            if (slot == foreBack.fore) {
                dst += neutralColor(theme) + txt + ANSI_RESET_FG_BG;
            } else if (slot == foreBack.back) {
                dst += columnSlice(columns, column, txtWidth)
                           .colorText(txt, colorMode, ForegroundBackground::FOREGROUND, false);
            } else {
                dst += txt;
            }
            column += txtWidth;
        }
        lines[lineIdx] = dst;
    }
    return joinLines(lines);
}

string recolorHorizontal(std::string_view asc, const ColorProfile& profile, AnsiMode colorMode) {
    const string art = PlaceholderScanner::instance().strip(asc);
    const ColorProfile rows = spreadOrThrow(profile, asciiSize(art).height);

    vector<string> lines = splitLines(art);
    for (size_t i = 0; i < lines.size(); ++i) {
        lines[i] = rows.colorAt(i).toAnsiString(colorMode, ForegroundBackground::FOREGROUND) + lines[i] + ANSI_RESET_FG_BG;
    }
    return joinLines(lines);
}

string recolorVertical(std::string_view asc, const ColorProfile& profile, AnsiMode colorMode) {
    const string art = PlaceholderScanner::instance().strip(asc);
    asciiSize(art); // rejects oversized art before any coloring

    vector<string> lines = splitLines(art);
    for (auto& line : lines) {
        try {
            line = profile.colorText(line, colorMode, ForegroundBackground::FOREGROUND, false);
        } catch (const RecolorError& e) {
            throw e.withContext("failed to color text using color profile");
        }
    }
    return joinLines(lines);
}

string recolorCustom(std::string_view asc, const std::map<int, int>& customColors, const ColorProfile& profile,
                     AnsiMode colorMode) {
    const ColorProfile palette = profile.uniqueColors();

    PlaceholderReplacements replacements{};
    for (const auto& entry : customColors) {
        const int slot = entry.first;
        const int paletteIdx = entry.second;
        if (paletteIdx < 0 || static_cast<size_t>(paletteIdx) >= palette.length()) {
            throw RecolorError(RecolorErrc::INVALID_COLOR_INDEX,
                               "color slot " + std::to_string(slot) + " refers to palette index " +
                               std::to_string(paletteIdx) + ", but the palette has " +
                               std::to_string(palette.length()) + " unique color(s)");
        }
        // slots are 1-indexed, palette entries 0-indexed
        replacements[static_cast<size_t>(slot - 1)] =
            palette.colorAt(static_cast<size_t>(paletteIdx)).toAnsiString(colorMode, ForegroundBackground::FOREGROUND);
    }

    const string art = fillStartingOrThrow(asc);
    const string replaced = PlaceholderScanner::instance().replaceAll(art, replacements);

    // Reset at the end of each line so the last color does not bleed
    return appendResetToLines(replaced);
}

struct RecolorVisitor {
    std::string_view asc;
    const ColorProfile& profile;
    AnsiMode colorMode;
    TerminalTheme theme;

    string operator()(const ColorAlignment::Horizontal& h) const {
        if (h.foreBack) return recolorHorizontalForeBack(asc, *h.foreBack, profile, colorMode, theme);
        return recolorHorizontal(asc, profile, colorMode);
    }
    string operator()(const ColorAlignment::Vertical& v) const {
        if (v.foreBack) return recolorVerticalForeBack(asc, *v.foreBack, profile, colorMode, theme);
        return recolorVertical(asc, profile, colorMode);
    }
    string operator()(const ColorAlignment::Custom& c) const {
        return recolorCustom(asc, c.colors, profile, colorMode);
    }
};

struct ModeVisitor {
    AlignmentMode operator()(const ColorAlignment::Horizontal&) const { return AlignmentMode::HORIZONTAL; }
    AlignmentMode operator()(const ColorAlignment::Vertical&) const { return AlignmentMode::VERTICAL; }
    AlignmentMode operator()(const ColorAlignment::Custom&) const { return AlignmentMode::CUSTOM; }
};

} // end anonymous namespace

ColorAlignment ColorAlignment::horizontal(std::optional<ForeBackPair> foreBack) {
    return ColorAlignment(Horizontal{foreBack});
}

ColorAlignment ColorAlignment::vertical(std::optional<ForeBackPair> foreBack) {
    return ColorAlignment(Vertical{foreBack});
}

ColorAlignment ColorAlignment::custom(std::map<int, int> colors) {
    for (const auto& entry : colors) {
        PlaceholderScanner::instance().token(entry.first); // validates the slot
    }
    return ColorAlignment(Custom{std::move(colors)});
}

ColorAlignment ColorAlignment::fromSpec(const AlignmentSpec& spec, std::optional<ForeBackPair> foreBack) {
    switch (spec.mode) {
        case AlignmentMode::HORIZONTAL: return horizontal(foreBack);
        case AlignmentMode::VERTICAL:   return vertical(foreBack);
        case AlignmentMode::CUSTOM:     return custom(spec.customColors);
    }
    throw std::logic_error("unhandled alignment mode");
}

AlignmentMode ColorAlignment::mode() const {
    return std::visit(ModeVisitor{}, m_value);
}

std::string ColorAlignment::name() const {
    return alignmentModeToString(mode());
}

std::string ColorAlignment::recolorAscii(std::string_view asc,
                                         const ColorProfile& profile,
                                         AnsiMode colorMode,
                                         TerminalTheme theme) const {
    if (profile.empty()) {
        throw RecolorError(RecolorErrc::PROFILE_SPREAD_FAILURE,
                           "cannot recolor ascii (" + name() + "): color profile is empty");
    }
    return std::visit(RecolorVisitor{asc, profile, colorMode, theme}, m_value);
}
