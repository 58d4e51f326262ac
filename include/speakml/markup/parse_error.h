#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace speakml::markup {

enum class ParseErrorKind {
    UnterminatedTag,          // '<' with no '>' before end of input
    UnmatchedClosingTag,      // closing tag with nothing open
    MismatchedClosingTag,     // closing name differs from innermost open tag
    MultipleTopLevelRoots,    // second element at depth zero
    SelfClosingOutsideRoot,   // self-closing tag with nothing open
    TextOutsideRoot,          // non-blank text with nothing open
    UnclosedTags,             // input ended with tags still open
    MissingRoot,              // no element was ever closed at depth zero
    WrongRootName,            // root element is not <speak>
    MalformedAttributeSyntax, // single quote, or text outside key="value" pairs
    MissingTagName,           // opening or self-closing tag with no name
};

const char* parse_error_kind_name(ParseErrorKind kind);

class ParseError : public std::runtime_error {
public:
    ParseError(ParseErrorKind kind, size_t offset, const std::string& detail);

    ParseErrorKind kind() const { return kind_; }
    size_t offset() const { return offset_; }
    const std::string& detail() const { return detail_; }

private:
    ParseErrorKind kind_;
    size_t offset_;
    std::string detail_;
};

} // namespace speakml::markup
