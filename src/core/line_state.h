// src/core/line_state.h
#ifndef LINE_STATE_H
#define LINE_STATE_H

#include <string>
#include <string_view>

// Fills in the missing starting placeholders, carrying the last placeholder of
// the previous lines forward.
//
// e.g. "${c1}...\n..." -> "${c1}...\n${c1}..."
//
// A line counts as already started when its first placeholder is preceded only
// by spaces. Throws RecolorError(MISSING_COLOR_STATE) when a line needs a
// carried placeholder and no earlier line provided one.
std::string fillStarting(std::string_view asc);

#endif // LINE_STATE_H
