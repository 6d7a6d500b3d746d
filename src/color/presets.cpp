// src/color/presets.cpp

#include "presets.h"
#include "core/recolor_error.h"

#include <utility>

namespace {

// 按名称排列的预设颜色，顺序即条纹从上到下的顺序
const std::vector<std::pair<std::string, std::vector<std::string>>> g_presetTable = {
    {"rainbow",      {"#E50000", "#FF8D00", "#FFEE00", "#028121", "#004CFF", "#770088"}},
    {"transgender",  {"#55CDFD", "#F6AAB7", "#FFFFFF", "#F6AAB7", "#55CDFD"}},
    {"nonbinary",    {"#FCF431", "#FCFCFC", "#9D59D2", "#282828"}},
    {"agender",      {"#000000", "#BABABA", "#FFFFFF", "#BAF484", "#FFFFFF", "#BABABA", "#000000"}},
    {"asexual",      {"#000000", "#A4A4A4", "#FFFFFF", "#810081"}},
    {"bisexual",     {"#D60270", "#9B4F96", "#0038A8"}},
    {"pansexual",    {"#FF218C", "#FFD800", "#21B1FF"}},
    {"lesbian",      {"#D62800", "#FF9B56", "#FFFFFF", "#D462A6", "#A40062"}},
    {"gay-men",      {"#078D70", "#98E8C1", "#FFFFFF", "#7BADE2", "#3D1A78"}},
    {"genderfluid",  {"#FE76A2", "#FFFFFF", "#BF12D7", "#000000", "#303CBE"}},
};

ColorProfile profileFromHex(const std::vector<std::string>& hexColors, const std::string& source) {
    vector<RgbColor> colors;
    colors.reserve(hexColors.size());
    for (const auto& hex : hexColors) {
        auto color = RgbColor::fromHex(hex);
        if (!color) {
            throw RecolorError(RecolorErrc::CONFIG_ERROR,
                               "invalid hex color '" + hex + "' in " + source);
        }
        colors.push_back(*color);
    }
    return ColorProfile(std::move(colors));
}

} // end anonymous namespace

std::optional<ColorProfile> findPreset(const std::string& name) {
    const std::string lowerName = toLower(name);
    for (const auto& entry : g_presetTable) {
        if (entry.first == lowerName) {
            return profileFromHex(entry.second, "preset '" + entry.first + "'");
        }
    }
    return std::nullopt;
}

std::vector<std::string> presetNames() {
    std::vector<std::string> names;
    for (const auto& entry : g_presetTable) {
        names.push_back(entry.first);
    }
    return names;
}

ColorProfile buildColorProfile(const Config& config) {
    if (!config.customHexColors.empty()) {
        return profileFromHex(config.customHexColors, "'colors'");
    }
    auto preset = findPreset(config.presetName);
    if (!preset) {
        throw RecolorError(RecolorErrc::CONFIG_ERROR, "unknown preset '" + config.presetName + "'");
    }
    return *preset;
}
