#pragma once
#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace speakml::cache {

// Fixed-capacity key/value store that evicts the least recently used entry
// when a new key is inserted at capacity. has(), get() and set() all count
// as a use. A capacity of zero stores nothing. Not thread-safe.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
public:
    explicit LruCache(std::size_t capacity) : capacity_(capacity) {}

    bool has(const Key& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) return false;
        touch(it->second);
        return true;
    }

    std::optional<Value> get(const Key& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        touch(it->second);
        return it->second->second;
    }

    void set(const Key& key, Value value) {
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second->second = std::move(value);
            touch(it->second);
            return;
        }
        if (capacity_ == 0) return;

        if (entries_.size() >= capacity_) {
            // Back of the list is the least recently used entry
            entries_.erase(lru_.back().first);
            lru_.pop_back();
        }
        lru_.emplace_front(key, std::move(value));
        entries_.emplace(key, lru_.begin());
    }

    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return entries_.empty(); }

    void clear() {
        entries_.clear();
        lru_.clear();
    }

private:
    // Front = most recently used
    using LruList = std::list<std::pair<Key, Value>>;

    std::size_t capacity_;
    LruList lru_;
    std::unordered_map<Key, typename LruList::iterator, Hash> entries_;

    void touch(typename LruList::iterator it) {
        lru_.splice(lru_.begin(), lru_, it);
    }
};

} // namespace speakml::cache
