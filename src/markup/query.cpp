#include <speakml/markup/query.h>

namespace speakml::markup {
namespace {

// Pre-order walk in document order with an explicit stack. `visit` returns
// false to stop early.
template <typename Visit>
void walk(const Node& root, Visit visit) {
    std::vector<const Node*> pending{&root};
    while (!pending.empty()) {
        const Node* node = pending.back();
        pending.pop_back();
        if (!visit(*node)) {
            return;
        }
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            pending.push_back(it->get());
        }
    }
}

const Node* find_first_by_tag(const Node& root, const std::string& name) {
    const Node* found = nullptr;
    walk(root, [&](const Node& node) {
        if (node.is_tag() && node.name == name) {
            found = &node;
            return false;
        }
        return true;
    });
    return found;
}

} // namespace

std::vector<const Node*> query_all_by_tag(const Node& root, const std::string& name) {
    std::vector<const Node*> result;
    walk(root, [&](const Node& node) {
        if (node.is_tag() && node.name == name) {
            result.push_back(&node);
        }
        return true;
    });
    return result;
}

std::vector<Node*> query_all_by_tag(Node& root, const std::string& name) {
    std::vector<Node*> result;
    const std::vector<const Node*> matches = query_all_by_tag(static_cast<const Node&>(root), name);
    result.reserve(matches.size());
    for (const Node* match : matches) {
        result.push_back(const_cast<Node*>(match));
    }
    return result;
}

const Node* query_first_by_tag(const Node& root, const std::string& name) {
    return find_first_by_tag(root, name);
}

Node* query_first_by_tag(Node& root, const std::string& name) {
    return const_cast<Node*>(find_first_by_tag(root, name));
}

std::vector<const Node*> query_all_by_attr(const Node& root, const std::string& attr,
                                           const std::string& value) {
    std::vector<const Node*> result;
    walk(root, [&](const Node& node) {
        if (node.is_tag()) {
            auto found = node.attributes.get(attr);
            if (found && *found == value) {
                result.push_back(&node);
            }
        }
        return true;
    });
    return result;
}

std::string inner_text(const Node& root) {
    std::string output;
    walk(root, [&output](const Node& node) {
        if (node.is_text()) {
            output += node.text;
        }
        return true;
    });
    return output;
}

} // namespace speakml::markup
