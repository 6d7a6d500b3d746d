// src/core/placeholder_scanner.cpp

#include "placeholder_scanner.h"
#include "recolor_error.h"

namespace {

// Every token has the shape "${c" <digit> "}".
const std::string_view TOKEN_PREFIX = "${c";
const char TOKEN_SUFFIX = '}';

} // end anonymous namespace

const PlaceholderScanner& PlaceholderScanner::instance() {
    // C++11 保证局部静态变量的初始化是线程安全的
    static const PlaceholderScanner scanner;
    return scanner;
}

PlaceholderScanner::PlaceholderScanner() {
    for (int i = 0; i < NUM_PLACEHOLDER_SLOTS; ++i) {
        m_patterns[static_cast<size_t>(i)] = std::string(TOKEN_PREFIX) + std::to_string(i + 1) + TOKEN_SUFFIX;
    }
    m_tokenLength = m_patterns[0].size();
}

const std::string& PlaceholderScanner::token(int slot) const {
    if (slot < 1 || slot > NUM_PLACEHOLDER_SLOTS) {
        throw RecolorError(RecolorErrc::INVALID_PLACEHOLDER,
                           "color slot " + std::to_string(slot) + " is outside [1, 6]");
    }
    return m_patterns[static_cast<size_t>(slot - 1)];
}

int PlaceholderScanner::parseSlot(std::string_view token) {
    if (token.size() != TOKEN_PREFIX.size() + 2 ||
        token.substr(0, TOKEN_PREFIX.size()) != TOKEN_PREFIX ||
        token.back() != TOKEN_SUFFIX) {
        throw RecolorError(RecolorErrc::INVALID_PLACEHOLDER,
                           "'" + std::string(token) + "' is not a color placeholder");
    }
    const char digit = token[TOKEN_PREFIX.size()];
    if (digit < '1' || digit > '0' + NUM_PLACEHOLDER_SLOTS) {
        throw RecolorError(RecolorErrc::INVALID_PLACEHOLDER,
                           "'" + std::string(token) + "' does not name a slot in [1, 6]");
    }
    return digit - '0';
}

std::optional<PlaceholderMatch> PlaceholderScanner::findNext(std::string_view text, size_t from) const {
    size_t pos = from;
    while (pos < text.size()) {
        pos = text.find(TOKEN_PREFIX, pos);
        if (pos == std::string_view::npos || pos + m_tokenLength > text.size()) {
            return std::nullopt;
        }
        const char digit = text[pos + TOKEN_PREFIX.size()];
        if (digit >= '1' && digit <= '0' + NUM_PLACEHOLDER_SLOTS &&
            text[pos + m_tokenLength - 1] == TOKEN_SUFFIX) {
            PlaceholderMatch match;
            match.start = pos;
            match.end = pos + m_tokenLength;
            match.slot = parseSlot(text.substr(pos, m_tokenLength));
            return match;
        }
        ++pos;
    }
    return std::nullopt;
}

std::vector<PlaceholderMatch> PlaceholderScanner::findAll(std::string_view text) const {
    std::vector<PlaceholderMatch> matches;
    size_t pos = 0;
    while (auto match = findNext(text, pos)) {
        pos = match->end;
        matches.push_back(*match);
    }
    return matches;
}

std::string PlaceholderScanner::replaceAll(std::string_view text, const PlaceholderReplacements& replacements) const {
    std::string result;
    result.reserve(text.size());
    size_t copied = 0;
    while (auto match = findNext(text, copied)) {
        result.append(text.substr(copied, match->start - copied));
        result.append(replacements[static_cast<size_t>(match->slot - 1)]);
        copied = match->end;
    }
    result.append(text.substr(copied));
    return result;
}

std::string PlaceholderScanner::strip(std::string_view text) const {
    static const PlaceholderReplacements EMPTY{};
    return replaceAll(text, EMPTY);
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    size_t begin = 0;
    for (;;) {
        const size_t newline = text.find('\n', begin);
        if (newline == std::string_view::npos) {
            lines.emplace_back(text.substr(begin));
            break;
        }
        lines.emplace_back(text.substr(begin, newline - begin));
        begin = newline + 1;
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) result += '\n';
        result += lines[i];
    }
    return result;
}
