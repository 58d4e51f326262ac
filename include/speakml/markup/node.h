#pragma once
#include <speakml/markup/attribute_map.h>
#include <memory>
#include <string>
#include <vector>

namespace speakml::markup {

enum class NodeType {
    Tag,
    Text,
};

// A markup node. Text nodes carry decoded text in `text`; tag nodes carry
// `name`, `attributes` and `children`. A tag owns its children.
//
// Nesting depth is unbounded, so nothing that walks a tree (destruction,
// clone, comparison, rendering, queries) recurses per level.
struct Node {
    NodeType type = NodeType::Tag;
    std::string name;
    AttributeMap attributes;
    std::string text;
    std::vector<std::unique_ptr<Node>> children;

    Node() = default;
    explicit Node(NodeType node_type) : type(node_type) {}
    ~Node();

    Node(Node&&) = default;
    Node& operator=(Node&&) = default;

    bool is_tag() const { return type == NodeType::Tag; }
    bool is_text() const { return type == NodeType::Text; }

    Node* append_child(std::unique_ptr<Node> child);

    // Deep copy
    std::unique_ptr<Node> clone() const;
};

std::unique_ptr<Node> make_text(std::string text);
std::unique_ptr<Node> make_tag(std::string name, AttributeMap attributes = {});

// Structural equality: same variant; tags compare name, attributes (as a
// mapping) and children in order; text nodes compare their payload.
bool operator==(const Node& a, const Node& b);
bool operator!=(const Node& a, const Node& b);

} // namespace speakml::markup
