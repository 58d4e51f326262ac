#include <speakml/markup/attribute_map.h>
#include <algorithm>

namespace speakml::markup {

AttributeMap::AttributeMap(std::initializer_list<Attribute> attributes) {
    for (const auto& attr : attributes) {
        set(attr.name, attr.value);
    }
}

std::vector<Attribute>::iterator AttributeMap::find(const std::string& name) {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&name](const Attribute& a) { return a.name == name; });
}

std::vector<Attribute>::const_iterator AttributeMap::find(const std::string& name) const {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&name](const Attribute& a) { return a.name == name; });
}

void AttributeMap::set(const std::string& name, const std::string& value) {
    auto it = find(name);
    if (it != entries_.end()) {
        it->value = value;
        return;
    }
    entries_.push_back({name, value});
}

std::optional<std::string> AttributeMap::get(const std::string& name) const {
    auto it = find(name);
    if (it != entries_.end()) {
        return it->value;
    }
    return std::nullopt;
}

bool AttributeMap::has(const std::string& name) const {
    return find(name) != entries_.end();
}

void AttributeMap::remove(const std::string& name) {
    auto it = find(name);
    if (it != entries_.end()) {
        entries_.erase(it);
    }
}

size_t AttributeMap::size() const {
    return entries_.size();
}

bool AttributeMap::empty() const {
    return entries_.empty();
}

void AttributeMap::clear() {
    entries_.clear();
}

AttributeMap::iterator AttributeMap::begin() const {
    return entries_.begin();
}

AttributeMap::iterator AttributeMap::end() const {
    return entries_.end();
}

bool AttributeMap::operator==(const AttributeMap& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto& attr : entries_) {
        auto value = other.get(attr.name);
        if (!value || *value != attr.value) {
            return false;
        }
    }
    return true;
}

} // namespace speakml::markup
