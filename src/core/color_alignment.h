// src/core/color_alignment.h
#ifndef COLOR_ALIGNMENT_H
#define COLOR_ALIGNMENT_H

#include "common_types.h"
#include "color/color_profile.h"
#include "core/fore_back_table.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// How a gradient profile is laid onto ascii art.
class ColorAlignment {
public:
    // One gradient color per row.
    struct Horizontal {
        std::optional<ForeBackPair> foreBack;
    };
    // One gradient color per column.
    struct Vertical {
        std::optional<ForeBackPair> foreBack;
    };
    // Fixed placeholder slot (1..6) -> index into the deduplicated profile.
    struct Custom {
        std::map<int, int> colors;
    };

    using Value = std::variant<Horizontal, Vertical, Custom>;

    static ColorAlignment horizontal(std::optional<ForeBackPair> foreBack = std::nullopt);
    static ColorAlignment vertical(std::optional<ForeBackPair> foreBack = std::nullopt);
    // Throws RecolorError(INVALID_PLACEHOLDER) if a key is not a slot in [1,6].
    static ColorAlignment custom(std::map<int, int> colors);

    // Builds the alignment a config entry describes. foreBack is only used by
    // the horizontal and vertical modes.
    static ColorAlignment fromSpec(const AlignmentSpec& spec, std::optional<ForeBackPair> foreBack);

    AlignmentMode mode() const;
    std::string name() const;
    const Value& value() const { return m_value; }

    // Recolors ascii art containing ${c1}..${c6} placeholders. Either returns
    // the complete colored text or throws RecolorError, never partial output.
    std::string recolorAscii(std::string_view asc,
                             const ColorProfile& profile,
                             AnsiMode colorMode,
                             TerminalTheme theme) const;

private:
    explicit ColorAlignment(Value value) : m_value(std::move(value)) {}

    Value m_value;
};

#endif // COLOR_ALIGNMENT_H
