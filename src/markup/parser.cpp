#include <speakml/markup/parser.h>
#include <speakml/markup/attribute_parser.h>
#include <speakml/markup/entities.h>
#include <speakml/core/config.h>
#include <speakml/core/diagnostics.h>
#include "text_util.h"
#include <utility>
#include <vector>

namespace speakml::markup {
namespace {

constexpr char kModule[] = "parser";

struct OpenTag {
    std::unique_ptr<Node> node;
    size_t offset;
};

class Scanner {
public:
    explicit Scanner(std::string_view input) : input_(input) {}

    std::unique_ptr<Node> run() {
        while (pos_ < input_.size()) {
            if (input_[pos_] == '<') {
                consume_tag();
            } else {
                consume_text();
            }
        }
        return finish();
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
    std::vector<OpenTag> open_;
    std::unique_ptr<Node> root_;
    size_t root_offset_ = 0;

    void consume_text() {
        size_t end = input_.find('<', pos_);
        if (end == std::string_view::npos) end = input_.size();
        std::string_view run = input_.substr(pos_, end - pos_);

        if (!is_blank(run)) {
            if (open_.empty()) {
                throw ParseError(ParseErrorKind::TextOutsideRoot,
                                 pos_ + skip_spaces(run, 0),
                                 "text must be inside the <speak> element");
            }
            open_.back().node->append_child(make_text(decode_entities(run)));
        }
        pos_ = end;
    }

    void consume_tag() {
        size_t start = pos_;
        size_t close = input_.find('>', start);
        if (close == std::string_view::npos) {
            throw ParseError(ParseErrorKind::UnterminatedTag, start, "missing '>'");
        }

        // Trimmed interior and where it begins in the input
        std::string_view raw = input_.substr(start + 1, close - start - 1);
        std::string_view content = trim_view(raw);
        size_t content_offset = start + 1 + static_cast<size_t>(content.data() - raw.data());

        if (!content.empty() && content.front() == '/') {
            close_tag(trim(content.substr(1)), start);
        } else if (!content.empty() && content.back() == '/') {
            self_closing_tag(content.substr(0, content.size() - 1), content_offset, start);
        } else {
            open_tag(content, content_offset, start);
        }
        pos_ = close + 1;
    }

    void close_tag(const std::string& name, size_t offset) {
        if (open_.empty()) {
            throw ParseError(ParseErrorKind::UnmatchedClosingTag, offset,
                             "</" + name + "> has no matching opening tag");
        }

        OpenTag top = std::move(open_.back());
        open_.pop_back();
        if (top.node->name != name) {
            throw ParseError(ParseErrorKind::MismatchedClosingTag, offset,
                             "expected </" + top.node->name + "> but found </" + name + ">");
        }

        if (!open_.empty()) {
            open_.back().node->append_child(std::move(top.node));
            return;
        }
        if (root_) {
            throw ParseError(ParseErrorKind::MultipleTopLevelRoots, top.offset,
                             "second top-level <" + name + "> element");
        }
        root_ = std::move(top.node);
        root_offset_ = top.offset;
    }

    void self_closing_tag(std::string_view interior, size_t interior_offset, size_t offset) {
        if (open_.empty()) {
            throw ParseError(ParseErrorKind::SelfClosingOutsideRoot, offset,
                             "self-closing tag cannot be the root element");
        }
        std::string name = parse_tag_name(interior);
        AttributeMap attributes = parse_attributes(interior, interior_offset);
        open_.back().node->append_child(make_tag(std::move(name), std::move(attributes)));
    }

    void open_tag(std::string_view content, size_t content_offset, size_t offset) {
        std::string name = parse_tag_name(content);
        AttributeMap attributes = parse_attributes(content, content_offset);
        if (open_.empty() && root_) {
            throw ParseError(ParseErrorKind::MultipleTopLevelRoots, offset,
                             "second top-level <" + name + "> element");
        }
        open_.push_back({make_tag(std::move(name), std::move(attributes)), offset});
    }

    std::unique_ptr<Node> finish() {
        if (!open_.empty()) {
            throw ParseError(ParseErrorKind::UnclosedTags, input_.size(),
                             "<" + open_.back().node->name + "> is never closed");
        }
        if (!root_) {
            throw ParseError(ParseErrorKind::MissingRoot, input_.size(),
                             "document has no root element");
        }
        if (root_->name != core::config::kRootTagName) {
            throw ParseError(ParseErrorKind::WrongRootName, root_offset_,
                             "root element must be <" + std::string(core::config::kRootTagName) +
                                 ">, found <" + root_->name + ">");
        }
        return std::move(root_);
    }
};

} // namespace

std::unique_ptr<Node> parse(std::string_view markup) {
    Scanner scanner(markup);
    return scanner.run();
}

ParseResult parse_with_diagnostics(std::string_view markup,
                                   core::DiagnosticEmitter* diagnostics) {
    if (diagnostics) {
        diagnostics->emit(core::Severity::Info, kModule, "scan",
                          "parsing " + std::to_string(markup.size()) + " bytes");
    }

    ParseResult result;
    try {
        result.root = parse(markup);
    } catch (const ParseError& e) {
        if (diagnostics) {
            diagnostics->emit(core::Severity::Error, kModule, "scan", e.what(), e.offset());
        }
        result.error = e;
        return result;
    }

    if (diagnostics) {
        diagnostics->emit(core::Severity::Info, kModule, "finish",
                          "root <" + result.root->name + "> with " +
                              std::to_string(result.root->children.size()) + " children");
    }
    return result;
}

} // namespace speakml::markup
