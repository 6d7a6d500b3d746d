// src/color/presets.h
#ifndef PRESETS_H
#define PRESETS_H

#include "color_profile.h"
#include <optional>
#include <string>
#include <vector>

// Built-in flag palettes, looked up case-insensitively by name.
std::optional<ColorProfile> findPreset(const std::string& name);

std::vector<std::string> presetNames();

// Builds the profile a config asks for: explicit hex colors win over the preset.
// Throws RecolorError(CONFIG_ERROR) for an unknown preset or a malformed color.
ColorProfile buildColorProfile(const Config& config);

#endif // PRESETS_H
