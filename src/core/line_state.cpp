// src/core/line_state.cpp

#include "line_state.h"
#include "placeholder_scanner.h"
#include "recolor_error.h"

#include <vector>

std::string fillStarting(std::string_view asc) {
    const PlaceholderScanner& scanner = PlaceholderScanner::instance();

    std::string_view last; // token carried over from previous lines
    std::vector<std::string> lines = splitLines(asc);

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string original = lines[i];
        const std::vector<PlaceholderMatch> matches = scanner.findAll(original);

        const bool started = !matches.empty() &&
            original.find_first_not_of(' ') == matches.front().start;
        if (!started) {
            if (last.empty()) {
                throw RecolorError(RecolorErrc::MISSING_COLOR_STATE,
                                   "line " + std::to_string(i + 1) +
                                   " has no starting color code and no previous line set one");
            }
            lines[i] = std::string(last) + original;
        }

        if (!matches.empty()) {
            last = scanner.token(matches.back().slot);
        }
    }
    return joinLines(lines);
}
