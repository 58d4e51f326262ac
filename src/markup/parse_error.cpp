#include <speakml/markup/parse_error.h>

namespace speakml::markup {
namespace {

std::string format_message(ParseErrorKind kind, size_t offset, const std::string& detail) {
    return std::string(parse_error_kind_name(kind)) + " at offset " +
           std::to_string(offset) + ": " + detail;
}

} // namespace

const char* parse_error_kind_name(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::UnterminatedTag:          return "unterminated-tag";
        case ParseErrorKind::UnmatchedClosingTag:      return "unmatched-closing-tag";
        case ParseErrorKind::MismatchedClosingTag:     return "mismatched-closing-tag";
        case ParseErrorKind::MultipleTopLevelRoots:    return "multiple-top-level-roots";
        case ParseErrorKind::SelfClosingOutsideRoot:   return "self-closing-outside-root";
        case ParseErrorKind::TextOutsideRoot:          return "text-outside-root";
        case ParseErrorKind::UnclosedTags:             return "unclosed-tags";
        case ParseErrorKind::MissingRoot:              return "missing-root";
        case ParseErrorKind::WrongRootName:            return "wrong-root-name";
        case ParseErrorKind::MalformedAttributeSyntax: return "malformed-attribute-syntax";
        case ParseErrorKind::MissingTagName:           return "missing-tag-name";
    }
    return "unknown";
}

ParseError::ParseError(ParseErrorKind kind, size_t offset, const std::string& detail)
    : std::runtime_error(format_message(kind, offset, detail)),
      kind_(kind),
      offset_(offset),
      detail_(detail) {}

} // namespace speakml::markup
