#include <combopanel/theme.hpp>

namespace combopanel
{

namespace
{

Gradient two_stop_gradient(float angle)
{
    Gradient g;
    g.angle = angle;
    g.stops = {GradientStop{0.0f, ColorSource::theme(1)}, GradientStop{1.0f, ColorSource::theme(2)}};
    return g;
}

std::vector<Theme> build_presets()
{
    std::vector<Theme> presets;

    // Neon cyan / magenta on deep navy
    Theme cyberpunk;
    cyberpunk.name     = "cyberpunk";
    cyberpunk.colors   = {Color::from_hex(0x00FFFF),
                          Color::from_hex(0xFF0099),
                          Color::from_hex(0xF2E600),
                          Color(0.04f, 0.06f, 0.10f, 0.90f)};
    cyberpunk.fonts    = {FontSpec{"Rajdhani", 14.0f}, FontSpec{"Share Tech Mono", 11.0f}};
    cyberpunk.gradient = two_stop_gradient(0.0f);
    presets.push_back(std::move(cyberpunk));

    // Green phosphor CRT
    Theme retro;
    retro.name   = "retro_terminal";
    retro.colors = {Color(0.2f, 1.0f, 0.2f),
                    Color(0.1f, 0.5f, 0.1f),
                    Color(1.0f, 0.69f, 0.0f),
                    Color(0.02f, 0.02f, 0.02f)};
    retro.fonts  = {FontSpec{"Monospace", 14.0f}, FontSpec{"Monospace", 11.0f}};
    retro.gradient = two_stop_gradient(90.0f);
    presets.push_back(std::move(retro));

    Theme synthwave;
    synthwave.name     = "synthwave";
    synthwave.colors   = {Color::from_hex(0xFF2A6D),
                          Color::from_hex(0x05D9E8),
                          Color::from_hex(0xD300C5),
                          Color::from_hex(0x1A1033)};
    synthwave.fonts    = {FontSpec{"Sans Bold", 14.0f}, FontSpec{"Sans", 11.0f}};
    synthwave.gradient = Gradient{.stops = {GradientStop{0.0f, ColorSource::theme(3)},
                                            GradientStop{0.5f, ColorSource::theme(1)},
                                            GradientStop{1.0f, ColorSource::theme(2)}},
                                  .angle = 90.0f};
    presets.push_back(std::move(synthwave));

    // Brushed steel with hazard yellow
    Theme industrial;
    industrial.name     = "industrial";
    industrial.colors   = {Color::from_hex(0xFFC107),
                           Color::from_hex(0x9E9E9E),
                           Color::from_hex(0xE53935),
                           Color::from_hex(0x263238)};
    industrial.fonts    = {FontSpec{"Sans Bold", 13.0f}, FontSpec{"Monospace", 11.0f}};
    industrial.gradient = two_stop_gradient(90.0f);
    presets.push_back(std::move(industrial));

    return presets;
}

const std::vector<Theme>& presets()
{
    static const std::vector<Theme> list = build_presets();
    return list;
}

}   // namespace

Theme default_theme()
{
    return presets().front();
}

std::optional<Theme> theme_preset(std::string_view name)
{
    for (const auto& t : presets())
    {
        if (t.name == name)
            return t;
    }
    return std::nullopt;
}

std::vector<std::string> theme_preset_names()
{
    std::vector<std::string> names;
    names.reserve(presets().size());
    for (const auto& t : presets())
        names.push_back(t.name);
    return names;
}

}   // namespace combopanel
