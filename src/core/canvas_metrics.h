// src/core/canvas_metrics.h
#ifndef CANVAS_METRICS_H
#define CANVAS_METRICS_H

#include <string>
#include <string_view>

struct AsciiSize {
    int width = 0;   // display columns, placeholders excluded
    int height = 0;  // number of lines
};

// Measures ascii art ignoring color placeholders. Width counts grapheme clusters.
// Throws RecolorError(DIMENSION_OVERFLOW) if either side exceeds MAX_ASCII_DIMENSION.
AsciiSize asciiSize(std::string_view asc);

// Pads every line with trailing spaces to the art's width.
std::string normalizeAscii(std::string_view asc);

#endif // CANVAS_METRICS_H
