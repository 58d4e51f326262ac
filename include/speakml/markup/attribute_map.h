#pragma once
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace speakml::markup {

struct Attribute {
    std::string name;
    std::string value;
};

// Attribute storage that keeps insertion order. Keys are unique; set() on an
// existing key replaces the value in place and keeps the original position.
class AttributeMap {
public:
    AttributeMap() = default;
    AttributeMap(std::initializer_list<Attribute> attributes);

    void set(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);
    size_t size() const;
    bool empty() const;
    void clear();

    // Iteration in insertion order
    using iterator = std::vector<Attribute>::const_iterator;
    iterator begin() const;
    iterator end() const;

    // Mapping equality: same keys with same values, order ignored.
    bool operator==(const AttributeMap& other) const;
    bool operator!=(const AttributeMap& other) const { return !(*this == other); }

private:
    std::vector<Attribute> entries_;

    std::vector<Attribute>::iterator find(const std::string& name);
    std::vector<Attribute>::const_iterator find(const std::string& name) const;
};

} // namespace speakml::markup
