#pragma once

#include <combopanel/draw_surface.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "core/lru_cache.hpp"

namespace combopanel
{

// Bounded memo of text extents, owned by one drawing surface.
// Keyed by family, size, weight, slant and the text itself.
class FontMetricsCache
{
   public:
    using MeasureFn = std::function<TextExtents(std::string_view, const TextStyle&)>;

    static constexpr size_t DEFAULT_CAPACITY = 256;

    // Advance per character as a fraction of the font size
    static constexpr float PROPORTIONAL_ADVANCE = 0.55f;
    static constexpr float MONOSPACE_ADVANCE    = 0.6f;
    static constexpr float BOLD_WIDENING        = 1.05f;

    explicit FontMetricsCache(size_t capacity = DEFAULT_CAPACITY, MeasureFn measure = approximate_extents);

    TextExtents measure(std::string_view text, const TextStyle& style);

    size_t   size() const { return cache_.size(); }
    size_t   capacity() const { return cache_.capacity(); }
    uint64_t hits() const { return cache_.hits(); }
    uint64_t misses() const { return cache_.misses(); }
    void     clear() { cache_.clear(); }

    // Estimate used when no font backend is available
    static TextExtents approximate_extents(std::string_view text, const TextStyle& style);

    static bool is_monospace(std::string_view family);

   private:
    static std::string make_key(std::string_view text, const TextStyle& style);

    MeasureFn                          measure_;
    LruCache<std::string, TextExtents> cache_;
};

// Number of UTF-8 code points in `text`
size_t utf8_length(std::string_view text);

}   // namespace combopanel
