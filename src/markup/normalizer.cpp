#include <speakml/markup/normalizer.h>
#include <speakml/core/diagnostics.h>
#include <speakml/markup/parser.h>
#include <speakml/markup/serializer.h>

namespace speakml::markup {
namespace {

constexpr char kModule[] = "normalizer";

} // namespace

Normalizer::Normalizer(std::size_t cache_capacity, core::DiagnosticEmitter* diagnostics)
    : cache_(cache_capacity), diagnostics_(diagnostics) {}

NormalizeResult Normalizer::normalize(std::string_view markup) {
    NormalizeResult result;
    std::string key(markup);

    if (auto cached = cache_.get(key)) {
        ++hits_;
        if (diagnostics_) {
            diagnostics_->emit(core::Severity::Info, kModule, "cache", "hit");
        }
        result.ok = true;
        result.output = std::move(*cached);
        result.from_cache = true;
        return result;
    }

    ++misses_;
    if (diagnostics_) {
        diagnostics_->emit(core::Severity::Info, kModule, "cache", "miss");
    }

    ParseResult parsed = parse_with_diagnostics(markup, diagnostics_);
    if (!parsed.ok()) {
        result.error = std::move(parsed.error);
        return result;
    }

    result.ok = true;
    result.output = render(*parsed.root);
    cache_.set(key, result.output);
    return result;
}

} // namespace speakml::markup
