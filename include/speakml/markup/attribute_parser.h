#pragma once
#include <speakml/markup/attribute_map.h>
#include <cstddef>
#include <string>
#include <string_view>

namespace speakml::markup {

// First whitespace-delimited token of a tag interior ("break time=..." ->
// "break"). Empty when the interior is blank.
std::string parse_tag_name(std::string_view tag_interior);

// Parses the attributes following the tag name in `tag_interior`.
//
// Attribute text is scanned for non-overlapping key="value" pairs, where a
// key is made of letters, digits, '_', ':' and '-', and whitespace may
// surround the '='. Every non-whitespace character must lie inside one of
// those pairs; anything left over (unquoted values, stray tokens, an
// unterminated quote) is rejected. A single quote anywhere in the interior
// is rejected as well. Later duplicates overwrite earlier values.
//
// Throws ParseError (MalformedAttributeSyntax, or MissingTagName for a blank
// interior). Reported offsets are `base_offset` plus the position inside
// `tag_interior`.
AttributeMap parse_attributes(std::string_view tag_interior, size_t base_offset = 0);

} // namespace speakml::markup
