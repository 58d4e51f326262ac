#pragma once
#include <speakml/markup/node.h>
#include <string>

namespace speakml::markup {

// Canonical markup for a node and its subtree. Text is escaped, attributes
// are written as key="value" in insertion order, and childless tags use the
// self-closing form (<break/>, <break time="1s"/>).
std::string render(const Node& node);

} // namespace speakml::markup
