#include "GraphemeUtils.h"

#include <memory>
#include <stdexcept>

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/unistr.h>
#include <unicode/ustring.h>

namespace GraphemeUtils {

namespace {

// BreakIterator 不是线程安全的，所以每个线程持有自己的一份。
icu::BreakIterator& characterIterator() {
    thread_local std::unique_ptr<icu::BreakIterator> iterator;
    if (!iterator) {
        UErrorCode status = U_ZERO_ERROR;
        iterator.reset(icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
        if (U_FAILURE(status) || !iterator) {
            throw std::runtime_error(std::string("Failed to create ICU character break iterator: ") + u_errorName(status));
        }
    }
    return *iterator;
}

bool isAscii(std::string_view s) {
    for (unsigned char c : s) {
        if (c >= 0x80) return false;
    }
    return true;
}

} // end anonymous namespace

std::vector<std::string> split(std::string_view utf8) {
    std::vector<std::string> graphemes;
    if (utf8.empty()) return graphemes;

    // Fast path: plain ASCII without CR is one cluster per byte.
    if (isAscii(utf8) && utf8.find('\r') == std::string_view::npos) {
        graphemes.reserve(utf8.size());
        for (char c : utf8) graphemes.emplace_back(1, c);
        return graphemes;
    }

    const icu::UnicodeString text = icu::UnicodeString::fromUTF8(
        icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
    icu::BreakIterator& it = characterIterator();
    it.setText(text);

    int32_t start = it.first();
    for (int32_t end = it.next(); end != icu::BreakIterator::DONE; start = end, end = it.next()) {
        std::string cluster;
        text.tempSubStringBetween(start, end).toUTF8String(cluster);
        graphemes.push_back(std::move(cluster));
    }
    return graphemes;
}

size_t count(std::string_view utf8) {
    if (isAscii(utf8) && utf8.find('\r') == std::string_view::npos) {
        return utf8.size();
    }
    return split(utf8).size();
}

bool isValidUtf8(std::string_view bytes) {
    if (isAscii(bytes)) return true;

    // UTF-16 never needs more code units than UTF-8 has bytes
    std::vector<UChar> buffer(bytes.size());
    int32_t length = 0;
    UErrorCode status = U_ZERO_ERROR;
    u_strFromUTF8(buffer.data(), static_cast<int32_t>(buffer.size()), &length,
                  bytes.data(), static_cast<int32_t>(bytes.size()), &status);
    return U_SUCCESS(status);
}

} // namespace GraphemeUtils
