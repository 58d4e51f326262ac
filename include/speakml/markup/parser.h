#pragma once
#include <speakml/markup/node.h>
#include <speakml/markup/parse_error.h>
#include <memory>
#include <optional>
#include <string_view>

namespace speakml::core {
class DiagnosticEmitter;
} // namespace speakml::core

namespace speakml::markup {

struct ParseResult {
    std::unique_ptr<Node> root;
    std::optional<ParseError> error;

    bool ok() const { return root != nullptr; }
};

// Parses a complete document in one left-to-right pass. The result is the
// <speak> root element. Throws ParseError on the first problem found; no
// partial tree is returned.
std::unique_ptr<Node> parse(std::string_view markup);

// Same as parse(), but reports the failure in the result instead of
// throwing. Progress and failures go to `diagnostics` when given.
ParseResult parse_with_diagnostics(std::string_view markup,
                                   core::DiagnosticEmitter* diagnostics = nullptr);

} // namespace speakml::markup
