// src/core/canvas_metrics.cpp
// 计算 ascii 图的显示宽度和高度，并将每一行补齐到相同宽度

#include "canvas_metrics.h"
#include "placeholder_scanner.h"
#include "recolor_error.h"
#include "utils/GraphemeUtils.h"

#include <algorithm>
#include <vector>

namespace {

size_t lineWidth(std::string_view line) {
    return GraphemeUtils::count(PlaceholderScanner::instance().strip(line));
}

} // end anonymous namespace

AsciiSize asciiSize(std::string_view asc) {
    const std::string stripped = PlaceholderScanner::instance().strip(asc);
    const std::vector<std::string> lines = splitLines(stripped);

    size_t width = 0;
    for (const auto& line : lines) {
        width = std::max(width, GraphemeUtils::count(line));
    }
    const size_t height = lines.size();

    if (width > static_cast<size_t>(MAX_ASCII_DIMENSION)) {
        throw RecolorError(RecolorErrc::DIMENSION_OVERFLOW,
                           "ascii width " + std::to_string(width) + " exceeds " + std::to_string(MAX_ASCII_DIMENSION));
    }
    if (height > static_cast<size_t>(MAX_ASCII_DIMENSION)) {
        throw RecolorError(RecolorErrc::DIMENSION_OVERFLOW,
                           "ascii height " + std::to_string(height) + " exceeds " + std::to_string(MAX_ASCII_DIMENSION));
    }
    return AsciiSize{static_cast<int>(width), static_cast<int>(height)};
}

std::string normalizeAscii(std::string_view asc) {
    const int width = asciiSize(asc).width;

    std::vector<std::string> lines = splitLines(asc);
    for (auto& line : lines) {
        const size_t w = lineWidth(line);
        if (w < static_cast<size_t>(width)) {
            line.append(static_cast<size_t>(width) - w, ' ');
        }
    }
    return joinLines(lines);
}
