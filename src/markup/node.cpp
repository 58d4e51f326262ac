#include <speakml/markup/node.h>
#include "text_util.h"
#include <utility>

namespace speakml::markup {

Node::~Node() {
    // Detach descendants onto a worklist so each one is destroyed childless.
    std::vector<std::unique_ptr<Node>> pending;
    pending.swap(children);
    while (!pending.empty()) {
        std::unique_ptr<Node> node = std::move(pending.back());
        pending.pop_back();
        for (auto& child : node->children) {
            pending.push_back(std::move(child));
        }
        node->children.clear();
    }
}

Node* Node::append_child(std::unique_ptr<Node> child) {
    children.push_back(std::move(child));
    return children.back().get();
}

std::unique_ptr<Node> Node::clone() const {
    auto shallow_copy = [](const Node& source) {
        auto copy = std::make_unique<Node>(source.type);
        copy->name = source.name;
        copy->attributes = source.attributes;
        copy->text = source.text;
        copy->children.reserve(source.children.size());
        return copy;
    };

    auto root = shallow_copy(*this);
    std::vector<std::pair<const Node*, Node*>> work{{this, root.get()}};
    while (!work.empty()) {
        auto [source, target] = work.back();
        work.pop_back();
        for (const auto& child : source->children) {
            Node* copy = target->append_child(shallow_copy(*child));
            work.emplace_back(child.get(), copy);
        }
    }
    return root;
}

std::unique_ptr<Node> make_text(std::string text) {
    auto node = std::make_unique<Node>(NodeType::Text);
    node->text = std::move(text);
    return node;
}

std::unique_ptr<Node> make_tag(std::string name, AttributeMap attributes) {
    auto node = std::make_unique<Node>(NodeType::Tag);
    node->name = trim(name);
    node->attributes = std::move(attributes);
    return node;
}

bool operator==(const Node& a, const Node& b) {
    std::vector<std::pair<const Node*, const Node*>> work{{&a, &b}};
    while (!work.empty()) {
        auto [left, right] = work.back();
        work.pop_back();

        if (left->type != right->type) {
            return false;
        }
        if (left->type == NodeType::Text) {
            if (left->text != right->text) return false;
            continue;
        }
        if (left->name != right->name || left->attributes != right->attributes ||
            left->children.size() != right->children.size()) {
            return false;
        }
        for (size_t i = 0; i < left->children.size(); ++i) {
            work.emplace_back(left->children[i].get(), right->children[i].get());
        }
    }
    return true;
}

bool operator!=(const Node& a, const Node& b) {
    return !(a == b);
}

} // namespace speakml::markup
