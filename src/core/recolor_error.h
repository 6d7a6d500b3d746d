// src/core/recolor_error.h
#ifndef RECOLOR_ERROR_H
#define RECOLOR_ERROR_H

#include <stdexcept>
#include <string>

enum class RecolorErrc {
    INVALID_PLACEHOLDER,    // token text does not parse to a slot in [1,6]
    MISSING_COLOR_STATE,    // a line needs a carried color but none exists yet
    PROFILE_SPREAD_FAILURE, // empty profile or zero-length spread
    DIMENSION_OVERFLOW,     // width/height above MAX_ASCII_DIMENSION
    INVALID_COLOR_INDEX,    // custom mapping points outside the palette
    CONFIG_ERROR,           // invalid profile/alignment settings
};

std::string recolorErrcToString(RecolorErrc code);

// All recoloring failures are deterministic, so callers either abort or fall
// back to uncolored output. The message carries the failing operation.
class RecolorError : public std::runtime_error {
public:
    RecolorError(RecolorErrc code, const std::string& message);

    RecolorErrc code() const noexcept { return m_code; }

    // Returns a copy whose message is prefixed with "<context>: ".
    RecolorError withContext(const std::string& context) const;

private:
    RecolorErrc m_code;
};

#endif // RECOLOR_ERROR_H
