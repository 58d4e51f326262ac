#include <speakml/markup/attribute_parser.h>
#include <speakml/markup/parse_error.h>
#include "text_util.h"
#include <vector>

namespace speakml::markup {
namespace {

// ASCII letters, digits, '_', ':' and '-'.
bool is_key_char(char c) {
    return (uchar(c) < 0x80 && std::isalnum(uchar(c)) != 0) ||
           c == '_' || c == ':' || c == '-';
}

// The whole UTF-8 character starting at `pos`, for error messages.
std::string character_at(std::string_view text, size_t pos) {
    unsigned char lead = uchar(text[pos]);
    size_t length = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : lead >= 0xC0 ? 2 : 1;
    return std::string(text.substr(pos, length));
}

struct AttributeMatch {
    size_t begin = 0;
    size_t end = 0;  // one past the closing quote
    std::string_view key;
    std::string_view value;
};

// Tries to match key\s*=\s*"[^"]*" starting exactly at `pos`. On failure
// `resume` receives the first position worth trying next.
bool match_attribute_at(std::string_view text, size_t pos, AttributeMatch& match,
                        size_t& resume) {
    resume = pos + 1;
    if (!is_key_char(text[pos])) return false;

    size_t key_end = pos;
    while (key_end < text.size() && is_key_char(text[key_end])) ++key_end;
    // A match cannot start anywhere else inside this key run either.
    resume = key_end;

    size_t cursor = skip_spaces(text, key_end);
    if (cursor >= text.size() || text[cursor] != '=') return false;
    cursor = skip_spaces(text, cursor + 1);
    if (cursor >= text.size() || text[cursor] != '"') return false;

    size_t close = text.find('"', cursor + 1);
    if (close == std::string_view::npos) return false;

    match.begin = pos;
    match.end = close + 1;
    match.key = text.substr(pos, key_end - pos);
    match.value = text.substr(cursor + 1, close - cursor - 1);
    return true;
}

std::vector<AttributeMatch> find_attribute_matches(std::string_view text) {
    std::vector<AttributeMatch> matches;
    size_t pos = 0;
    while (pos < text.size()) {
        AttributeMatch match;
        size_t resume = pos + 1;
        if (match_attribute_at(text, pos, match, resume)) {
            matches.push_back(match);
            pos = match.end;
        } else {
            pos = resume;
        }
    }
    return matches;
}

} // namespace

std::string parse_tag_name(std::string_view tag_interior) {
    size_t start = skip_spaces(tag_interior, 0);
    size_t end = skip_non_spaces(tag_interior, start);
    return std::string(tag_interior.substr(start, end - start));
}

AttributeMap parse_attributes(std::string_view tag_interior, size_t base_offset) {
    size_t quote = tag_interior.find('\'');
    if (quote != std::string_view::npos) {
        throw ParseError(ParseErrorKind::MalformedAttributeSyntax, base_offset + quote,
                         "single-quoted attribute values are not supported");
    }

    size_t name_start = skip_spaces(tag_interior, 0);
    size_t name_end = skip_non_spaces(tag_interior, name_start);
    if (name_end == name_start) {
        throw ParseError(ParseErrorKind::MissingTagName, base_offset, "tag has no name");
    }

    AttributeMap attributes;
    std::string_view attr_text = tag_interior.substr(name_end);
    if (is_blank(attr_text)) {
        return attributes;
    }

    auto matches = find_attribute_matches(attr_text);

    std::vector<bool> covered(attr_text.size(), false);
    for (const auto& match : matches) {
        for (size_t i = match.begin; i < match.end; ++i) {
            covered[i] = true;
        }
    }
    size_t i = 0;
    while (i < attr_text.size()) {
        if (covered[i]) {
            ++i;
        } else if (size_t width = space_width(attr_text, i)) {
            i += width;
        } else {
            throw ParseError(ParseErrorKind::MalformedAttributeSyntax,
                             base_offset + name_end + i,
                             "unexpected '" + character_at(attr_text, i) +
                                 "' in attribute list");
        }
    }

    for (const auto& match : matches) {
        attributes.set(std::string(match.key), std::string(match.value));
    }
    return attributes;
}

} // namespace speakml::markup
