#pragma once
#include <speakml/cache/lru_cache.h>
#include <speakml/core/config.h>
#include <speakml/markup/parse_error.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace speakml::core {
class DiagnosticEmitter;
} // namespace speakml::core

namespace speakml::markup {

struct NormalizeResult {
    bool ok = false;
    std::string output;
    std::optional<ParseError> error;
    bool from_cache = false;
};

// Parses and re-renders documents into canonical markup, remembering the
// most recent successful results. Failed inputs are not remembered.
class Normalizer {
public:
    explicit Normalizer(std::size_t cache_capacity = core::config::kDefaultCacheCapacity,
                        core::DiagnosticEmitter* diagnostics = nullptr);

    NormalizeResult normalize(std::string_view markup);

    std::size_t cache_hits() const { return hits_; }
    std::size_t cache_misses() const { return misses_; }
    std::size_t cached_entries() const { return cache_.size(); }

private:
    cache::LruCache<std::string, std::string> cache_;
    core::DiagnosticEmitter* diagnostics_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

} // namespace speakml::markup
