#include <speakml/markup/serializer.h>
#include <speakml/markup/entities.h>
#include <vector>

namespace speakml::markup {
namespace {

// A tag renders to nothing only through empty text children; such a tag
// still uses the short form.
bool renders_childless(const Node& tag) {
    for (const auto& child : tag.children) {
        if (!child->is_text() || !child->text.empty()) {
            return false;
        }
    }
    return true;
}

void write_start(const Node& tag, std::string& out) {
    out += '<';
    out += tag.name;
    for (const auto& attr : tag.attributes) {
        out += ' ';
        out += attr.name;
        out += "=\"";
        out += attr.value;
        out += '"';
    }
}

struct OpenFrame {
    const Node* tag;
    size_t next_child;
};

} // namespace

std::string render(const Node& node) {
    std::string out;
    if (node.is_text()) {
        out += encode_entities(node.text);
        return out;
    }

    std::vector<OpenFrame> open;
    auto enter = [&out, &open](const Node& tag) {
        write_start(tag, out);
        if (renders_childless(tag)) {
            out += "/>";
            return;
        }
        out += '>';
        open.push_back({&tag, 0});
    };

    enter(node);
    while (!open.empty()) {
        OpenFrame& frame = open.back();
        if (frame.next_child == frame.tag->children.size()) {
            out += "</";
            out += frame.tag->name;
            out += '>';
            open.pop_back();
            continue;
        }

        const Node& child = *frame.tag->children[frame.next_child++];
        if (child.is_text()) {
            out += encode_entities(child.text);
        } else {
            enter(child);
        }
    }
    return out;
}

} // namespace speakml::markup
