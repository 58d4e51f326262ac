#pragma once
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

// Character helpers shared by the markup sources. Not installed.
//
// Whitespace is Unicode whitespace in UTF-8: the ASCII controls \t \n \v \f
// \r and 0x1C-0x1F, the space, U+0085, U+00A0, U+1680, U+2000-U+200A,
// U+2028, U+2029, U+202F, U+205F and U+3000.
namespace speakml::markup {

inline unsigned char uchar(char c) {
    return static_cast<unsigned char>(c);
}

// Byte length of the whitespace character starting at `pos`, or 0.
inline size_t space_width(std::string_view text, size_t pos) {
    if (pos >= text.size()) return 0;
    unsigned char c = uchar(text[pos]);
    if ((c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x20)) return 1;
    if (c < 0x80) return 0;

    auto at = [&text, pos](size_t i) -> unsigned char {
        return pos + i < text.size() ? uchar(text[pos + i]) : 0;
    };
    if (c == 0xC2) {
        return (at(1) == 0x85 || at(1) == 0xA0) ? 2 : 0;
    }
    if (c == 0xE1) {
        return (at(1) == 0x9A && at(2) == 0x80) ? 3 : 0;
    }
    if (c == 0xE2) {
        if (at(1) == 0x80) {
            unsigned char last = at(2);
            bool space = (last >= 0x80 && last <= 0x8A) || last == 0xA8 ||
                         last == 0xA9 || last == 0xAF;
            return space ? 3 : 0;
        }
        return (at(1) == 0x81 && at(2) == 0x9F) ? 3 : 0;
    }
    if (c == 0xE3) {
        return (at(1) == 0x80 && at(2) == 0x80) ? 3 : 0;
    }
    return 0;
}

// Byte length of the whitespace character ending just before `end`, or 0.
inline size_t space_width_before(std::string_view text, size_t end) {
    for (size_t width = 1; width <= 3 && width <= end; ++width) {
        if (space_width(text, end - width) == width) return width;
    }
    return 0;
}

inline size_t skip_spaces(std::string_view text, size_t pos) {
    while (size_t width = space_width(text, pos)) pos += width;
    return pos;
}

// First position at or after `pos` that starts a whitespace character.
inline size_t skip_non_spaces(std::string_view text, size_t pos) {
    while (pos < text.size() && space_width(text, pos) == 0) ++pos;
    return pos;
}

inline std::string_view trim_view(std::string_view text) {
    size_t start = skip_spaces(text, 0);
    size_t end = text.size();
    while (end > start) {
        size_t width = space_width_before(text, end);
        if (width == 0) break;
        end -= width;
    }
    return text.substr(start, end - start);
}

inline bool is_blank(std::string_view text) {
    return skip_spaces(text, 0) == text.size();
}

inline std::string trim(std::string_view text) {
    return std::string(trim_view(text));
}

} // namespace speakml::markup
