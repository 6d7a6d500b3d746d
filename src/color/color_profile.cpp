// src/color/color_profile.cpp

#include "color_profile.h"
#include "core/recolor_error.h"
#include "utils/GraphemeUtils.h"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace { // Anonymous namespace for internal helpers

const int CUBE_LEVELS[6] = {0, 95, 135, 175, 215, 255};

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

int nearestCubeLevel(int v) {
    int best = 0;
    for (int i = 1; i < 6; ++i) {
        if (std::abs(CUBE_LEVELS[i] - v) < std::abs(CUBE_LEVELS[best] - v)) best = i;
    }
    return best;
}

int distance2(int r1, int g1, int b1, int r2, int g2, int b2) {
    const int dr = r1 - r2;
    const int dg = g1 - g2;
    const int db = b1 - b2;
    return dr * dr + dg * dg + db * db;
}

} // end anonymous namespace

// --- RgbColor ---

std::optional<RgbColor> RgbColor::fromHex(const string& hex) {
    string digits = hex;
    if (!digits.empty() && digits[0] == '#') digits.erase(0, 1);

    if (digits.size() == 3) {
        string expanded;
        for (char c : digits) {
            expanded += c;
            expanded += c;
        }
        digits = expanded;
    }
    if (digits.size() != 6) return std::nullopt;

    int channels[3];
    for (int i = 0; i < 3; ++i) {
        const int hi = hexDigit(digits[static_cast<size_t>(i * 2)]);
        const int lo = hexDigit(digits[static_cast<size_t>(i * 2 + 1)]);
        if (hi < 0 || lo < 0) return std::nullopt;
        channels[i] = hi * 16 + lo;
    }
    return RgbColor{static_cast<std::uint8_t>(channels[0]),
                    static_cast<std::uint8_t>(channels[1]),
                    static_cast<std::uint8_t>(channels[2])};
}

string RgbColor::toHex() const {
    std::stringstream ss;
    ss << "#" << std::hex << std::setfill('0')
       << std::setw(2) << static_cast<int>(r)
       << std::setw(2) << static_cast<int>(g)
       << std::setw(2) << static_cast<int>(b);
    return ss.str();
}

int RgbColor::toAnsi256() const {
    // Candidate 1: 6x6x6 cube
    const int ri = nearestCubeLevel(r);
    const int gi = nearestCubeLevel(g);
    const int bi = nearestCubeLevel(b);
    int bestIdx = 16 + 36 * ri + 6 * gi + bi;
    int bestD2 = distance2(r, g, b, CUBE_LEVELS[ri], CUBE_LEVELS[gi], CUBE_LEVELS[bi]);

    // Candidate 2: grayscale ramp, entries are 8 + 10*k for k = 0..23
    const int avg = (static_cast<int>(r) + g + b + 1) / 3;
    const int k = std::clamp((avg - 8 + 5) / 10, 0, 23);
    const int shade = 8 + 10 * k;
    const int grayD2 = distance2(r, g, b, shade, shade, shade);
    if (grayD2 < bestD2) {
        bestIdx = 232 + k;
        bestD2 = grayD2;
    }
    return bestIdx;
}

string RgbColor::toAnsiString(AnsiMode mode, ForegroundBackground role) const {
    const string kind = (role == ForegroundBackground::FOREGROUND) ? "38" : "48";
    switch (mode) {
        case AnsiMode::ANSI_256:
            return "\033[" + kind + ";5;" + std::to_string(toAnsi256()) + "m";
        case AnsiMode::RGB:
        default:
            return "\033[" + kind + ";2;" + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m";
    }
}

// --- ColorProfile ---

ColorProfile::ColorProfile(vector<RgbColor> colors) : m_colors(std::move(colors)) {}

ColorProfile ColorProfile::withWeights(const vector<size_t>& weights) const {
    if (weights.size() != m_colors.size()) {
        throw RecolorError(RecolorErrc::PROFILE_SPREAD_FAILURE,
                           "expected " + std::to_string(m_colors.size()) + " weights, got " + std::to_string(weights.size()));
    }
    vector<RgbColor> weighted;
    for (size_t i = 0; i < m_colors.size(); ++i) {
        weighted.insert(weighted.end(), weights[i], m_colors[i]);
    }
    return ColorProfile(std::move(weighted));
}

ColorProfile ColorProfile::spreadTo(size_t length) const {
    if (m_colors.empty()) {
        throw RecolorError(RecolorErrc::PROFILE_SPREAD_FAILURE, "cannot spread an empty color profile");
    }
    if (length == 0) {
        throw RecolorError(RecolorErrc::PROFILE_SPREAD_FAILURE, "cannot spread a color profile to length 0");
    }

    const size_t origLen = m_colors.size();
    const size_t centerIdx = origLen / 2;

    // 每种颜色至少重复多少次
    vector<size_t> weights(origLen, length / origLen);
    size_t extras = length % origLen;

    // An odd extra space widens the center stripe
    if (extras % 2 == 1) {
        --extras;
        ++weights[centerIdx];
    }

    // Remaining pairs go to the borders, outermost first
    size_t borderIdx = 0;
    while (extras > 0) {
        extras -= 2;
        ++weights[borderIdx];
        ++weights[origLen - borderIdx - 1];
        ++borderIdx;
    }

    return withWeights(weights);
}

ColorProfile ColorProfile::uniqueColors() const {
    vector<RgbColor> unique;
    for (const auto& color : m_colors) {
        if (std::find(unique.begin(), unique.end(), color) == unique.end()) {
            unique.push_back(color);
        }
    }
    return ColorProfile(std::move(unique));
}

ColorProfile ColorProfile::slice(size_t begin, size_t end) const {
    end = std::min(end, m_colors.size());
    begin = std::min(begin, end);
    return ColorProfile(vector<RgbColor>(m_colors.begin() + static_cast<std::ptrdiff_t>(begin),
                                         m_colors.begin() + static_cast<std::ptrdiff_t>(end)));
}

string ColorProfile::colorText(const string& text, AnsiMode mode, ForegroundBackground role, bool spaceOnly) const {
    const vector<string> graphemes = GraphemeUtils::split(text);
    if (graphemes.empty()) return "";

    const ColorProfile spread = spreadTo(graphemes.size());
    const vector<RgbColor>& colors = spread.colors();

    string result;
    for (size_t i = 0; i < graphemes.size(); ++i) {
        const string& gr = graphemes[i];
        if (spaceOnly && gr != " ") {
            if (i > 0 && graphemes[i - 1] == " ") {
                result += "\033[39;49m";
            }
            result += gr;
        } else {
            // Only emit a color when it differs from the previous grapheme's
            if (i == 0 || colors[i] != colors[i - 1] || (spaceOnly && graphemes[i - 1] != " ")) {
                result += colors[i].toAnsiString(mode, role);
            }
            result += gr;
        }
    }
    result += ANSI_RESET_ALL;
    return result;
}
