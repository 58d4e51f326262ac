#pragma once
#include <speakml/markup/node.h>
#include <string>
#include <vector>

namespace speakml::markup {

// Depth-first, document order. `root` itself is included when it matches.
std::vector<Node*> query_all_by_tag(Node& root, const std::string& name);
std::vector<const Node*> query_all_by_tag(const Node& root, const std::string& name);
Node* query_first_by_tag(Node& root, const std::string& name);
const Node* query_first_by_tag(const Node& root, const std::string& name);

std::vector<const Node*> query_all_by_attr(const Node& root, const std::string& attr,
                                           const std::string& value);

// Decoded text of every text node below `root`, concatenated.
std::string inner_text(const Node& root);

} // namespace speakml::markup
