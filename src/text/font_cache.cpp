#include "font_cache.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace combopanel
{

FontMetricsCache::FontMetricsCache(size_t capacity, MeasureFn measure)
    : measure_(measure ? std::move(measure) : MeasureFn(approximate_extents)), cache_(capacity)
{
}

TextExtents FontMetricsCache::measure(std::string_view text, const TextStyle& style)
{
    if (text.empty())
        return TextExtents{0.0f, style.size};

    std::string key = make_key(text, style);
    if (const TextExtents* hit = cache_.get(key))
        return *hit;

    TextExtents extents = measure_(text, style);
    cache_.put(key, extents);
    return extents;
}

TextExtents FontMetricsCache::approximate_extents(std::string_view text, const TextStyle& style)
{
    float advance = is_monospace(style.family) ? MONOSPACE_ADVANCE : PROPORTIONAL_ADVANCE;
    if (style.bold)
        advance *= BOLD_WIDENING;

    const float size = std::max(style.size, 0.0f);
    return TextExtents{static_cast<float>(utf8_length(text)) * size * advance, size};
}

bool FontMetricsCache::is_monospace(std::string_view family)
{
    std::string lower(family);
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("mono") != std::string::npos || lower.find("courier") != std::string::npos
           || lower.find("terminal") != std::string::npos;
}

std::string FontMetricsCache::make_key(std::string_view text, const TextStyle& style)
{
    char prefix[48];
    std::snprintf(prefix,
                  sizeof(prefix),
                  "|%.2f|%d%d|",
                  static_cast<double>(style.size),
                  style.bold ? 1 : 0,
                  style.italic ? 1 : 0);

    std::string key;
    key.reserve(style.family.size() + text.size() + 16);
    key += style.family;
    key += prefix;
    key += text;
    return key;
}

size_t utf8_length(std::string_view text)
{
    size_t count = 0;
    for (char c : text)
    {
        // Continuation bytes are 10xxxxxx
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

}   // namespace combopanel
