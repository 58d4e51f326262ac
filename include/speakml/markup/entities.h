#pragma once
#include <string>
#include <string_view>

namespace speakml::markup {

// Only &lt; &gt; and &amp; are recognized. Anything else that starts with
// '&' is kept as written.

// Resolves entity references in a single left-to-right pass, so decoded
// output is never decoded again ("&amp;lt;" becomes "&lt;").
std::string decode_entities(std::string_view text);

// Escapes '&', '<' and '>'. Ampersands in the input are escaped, never the
// ones this function introduces.
std::string encode_entities(std::string_view text);

} // namespace speakml::markup
