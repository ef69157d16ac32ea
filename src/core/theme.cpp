#include <algorithm>
#include <cmath>
#include <combopanel/logger.hpp>
#include <combopanel/theme.hpp>

namespace combopanel
{

Color resolve_color(const ColorSource& source, const Theme& theme)
{
    if (!source.is_theme())
        return source.color;

    if (source.index < 1 || source.index > static_cast<int>(THEME_COLOR_COUNT))
    {
        COMBOPANEL_LOG_TRACE("theme", "Color index {} out of range, using fallback", source.index);
        return FALLBACK_COLOR;
    }

    Color c = theme.colors[static_cast<size_t>(source.index - 1)];
    if (source.alpha_override)
        c.a = std::clamp(*source.alpha_override, 0.0f, 1.0f);
    return c;
}

FontSpec resolve_font(const FontSource& source, const Theme& theme)
{
    if (!source.is_theme())
        return source.font;

    if (source.index < 1 || source.index > static_cast<int>(THEME_FONT_COUNT))
    {
        COMBOPANEL_LOG_TRACE("theme", "Font slot {} out of range, using fallback", source.index);
        return FontSpec{};
    }

    FontSpec f = theme.fonts[static_cast<size_t>(source.index - 1)];
    if (source.size_override && *source.size_override > 0.0f)
        f.size = *source.size_override;
    return f;
}

ResolvedGradient resolve_gradient(const Gradient& gradient, const Theme& theme)
{
    ResolvedGradient out;
    out.angle = gradient.angle;
    out.stops.reserve(gradient.stops.size());
    for (const auto& stop : gradient.stops)
        out.stops.push_back({stop.position, resolve_color(stop.color, theme)});
    return out;
}

Color sample_gradient(std::span<const ResolvedStop> stops, float position)
{
    if (stops.empty())
        return FALLBACK_COLOR;
    if (stops.size() == 1)
        return stops.front().color;

    std::vector<ResolvedStop> sorted(stops.begin(), stops.end());
    std::stable_sort(sorted.begin(),
                     sorted.end(),
                     [](const ResolvedStop& a, const ResolvedStop& b)
                     { return a.position < b.position; });

    float t = std::isnan(position) ? 0.0f : std::clamp(position, 0.0f, 1.0f);

    if (t <= sorted.front().position)
        return sorted.front().color;
    if (t >= sorted.back().position)
        return sorted.back().color;

    for (size_t i = 1; i < sorted.size(); ++i)
    {
        const auto& lo = sorted[i - 1];
        const auto& hi = sorted[i];
        if (t > hi.position)
            continue;
        float span = hi.position - lo.position;
        if (span <= 0.0f)
            return hi.color;
        return lo.color.lerp(hi.color, (t - lo.position) / span);
    }

    return sorted.back().color;
}

}   // namespace combopanel
