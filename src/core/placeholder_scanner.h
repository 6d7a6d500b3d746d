// src/core/placeholder_scanner.h
#ifndef PLACEHOLDER_SCANNER_H
#define PLACEHOLDER_SCANNER_H

#include "common_types.h"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// One occurrence of a color placeholder (`${c1}` .. `${c6}`) inside a line.
// start/end are byte offsets into the scanned text, end is exclusive.
struct PlaceholderMatch {
    int slot = 0;
    size_t start = 0;
    size_t end = 0;

    size_t length() const { return end - start; }
};

using PlaceholderReplacements = std::array<std::string, NUM_PLACEHOLDER_SLOTS>;

// Multi-pattern scanner over the six neofetch color tokens.
// Built once and never mutated afterwards, so it can be shared between threads.
class PlaceholderScanner {
public:
    static const PlaceholderScanner& instance();

    // The six literal tokens, index i holds the token for slot i + 1.
    const std::array<std::string, NUM_PLACEHOLDER_SLOTS>& patterns() const { return m_patterns; }

    // Literal token text for a slot, throws RecolorError(INVALID_PLACEHOLDER) outside [1,6].
    const std::string& token(int slot) const;

    // Parses the slot number out of a token such as "${c3}".
    static int parseSlot(std::string_view token);

    std::optional<PlaceholderMatch> findNext(std::string_view text, size_t from = 0) const;
    std::vector<PlaceholderMatch> findAll(std::string_view text) const;

    // Replaces every token with replacements[slot - 1] in a single pass.
    std::string replaceAll(std::string_view text, const PlaceholderReplacements& replacements) const;

    // Removes every token.
    std::string strip(std::string_view text) const;

    PlaceholderScanner(const PlaceholderScanner&) = delete;
    PlaceholderScanner& operator=(const PlaceholderScanner&) = delete;

private:
    PlaceholderScanner();

    std::array<std::string, NUM_PLACEHOLDER_SLOTS> m_patterns;
    size_t m_tokenLength = 0;
};

// Splits text on '\n'. A trailing '\n' yields a trailing empty line.
std::vector<std::string> splitLines(std::string_view text);

std::string joinLines(const std::vector<std::string>& lines);

#endif // PLACEHOLDER_SCANNER_H
