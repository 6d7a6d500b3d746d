#ifndef GRAPHEME_UTILS_H
#define GRAPHEME_UTILS_H

#include <string>
#include <string_view>
#include <vector>

// Extended grapheme cluster helpers backed by ICU.
// One cluster is one display column for the purposes of ascii art measurement.
// Input must be valid UTF-8: split() and count() turn ill-formed bytes into U+FFFD.
namespace GraphemeUtils {
    std::vector<std::string> split(std::string_view utf8);
    size_t count(std::string_view utf8);

    // True if the bytes are well-formed UTF-8.
    bool isValidUtf8(std::string_view bytes);
}

#endif // GRAPHEME_UTILS_H
