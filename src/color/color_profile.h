// src/color/color_profile.h
#ifndef COLOR_PROFILE_H
#define COLOR_PROFILE_H

#include "common_types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct RgbColor {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    // Accepts "#RRGGBB", "RRGGBB", "#RGB" and "RGB".
    static std::optional<RgbColor> fromHex(const std::string& hex);
    string toHex() const;

    // Nearest xterm-256 index over the 6x6x6 cube and the grayscale ramp.
    int toAnsi256() const;

    // Escape prefix selecting this color, without a trailing reset.
    string toAnsiString(AnsiMode mode, ForegroundBackground role) const;

    bool operator==(const RgbColor& other) const { return r == other.r && g == other.g && b == other.b; }
    bool operator!=(const RgbColor& other) const { return !(*this == other); }
};

// An ordered gradient of colors, e.g. the stripes of a flag.
class ColorProfile {
public:
    ColorProfile() = default;
    explicit ColorProfile(vector<RgbColor> colors);

    size_t length() const { return m_colors.size(); }
    bool empty() const { return m_colors.empty(); }
    const vector<RgbColor>& colors() const { return m_colors; }

    // Throws std::out_of_range when i >= length().
    const RgbColor& colorAt(size_t i) const { return m_colors.at(i); }

    // Repeats color i weights[i] times. weights must have length() entries.
    ColorProfile withWeights(const vector<size_t>& weights) const;

    // Spreads the profile to exactly `length` colors, widening the center and
    // the borders first. Throws RecolorError(PROFILE_SPREAD_FAILURE) when the
    // profile is empty or length is 0.
    ColorProfile spreadTo(size_t length) const;

    // Removes duplicated colors, keeping the first occurrence of each.
    ColorProfile uniqueColors() const;

    // Colors [begin, end) clamped to the profile bounds.
    ColorProfile slice(size_t begin, size_t end) const;

    // Colors the text as a left-to-right gradient, one color per grapheme,
    // ending with a full reset. With spaceOnly only spaces receive color.
    string colorText(const string& text, AnsiMode mode, ForegroundBackground role, bool spaceOnly = false) const;

private:
    vector<RgbColor> m_colors;
};

#endif // COLOR_PROFILE_H
