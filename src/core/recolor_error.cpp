// src/core/recolor_error.cpp

#include "recolor_error.h"

RecolorError::RecolorError(RecolorErrc code, const std::string& message)
    : std::runtime_error(message), m_code(code) {}

RecolorError RecolorError::withContext(const std::string& context) const {
    return RecolorError(m_code, context + ": " + what());
}

std::string recolorErrcToString(RecolorErrc code) {
    switch (code) {
        case RecolorErrc::INVALID_PLACEHOLDER:    return "InvalidPlaceholder";
        case RecolorErrc::MISSING_COLOR_STATE:    return "MissingColorState";
        case RecolorErrc::PROFILE_SPREAD_FAILURE: return "ProfileSpreadFailure";
        case RecolorErrc::DIMENSION_OVERFLOW:     return "DimensionOverflow";
        case RecolorErrc::INVALID_COLOR_INDEX:    return "InvalidColorIndex";
        case RecolorErrc::CONFIG_ERROR:           return "ConfigError";
        default:                                  return "UnknownError";
    }
}
