#include <cmath>
#include <combopanel/combopanel.hpp>
#include <iostream>
#include <memory>
#include <string>

using namespace combopanel;

namespace
{

// Minimal content drawing: caption, value text and a horizontal fill bar
class SimpleItemRenderer : public ContentItemRenderer
{
   public:
    void render_item(DrawSurface& surface, const ContentItemContext& ctx) override
    {
        const Color    accent = resolve_color(ColorSource::theme(1), ctx.theme);
        const Color    track  = resolve_color(ColorSource::theme(4, 0.25f), ctx.theme);
        const FontSpec font   = resolve_font(FontSource::theme(2), ctx.theme);

        TextStyle style;
        style.family = font.family;
        style.size   = font.size;
        style.color  = resolve_color(ColorSource::theme(3), ctx.theme);

        surface.draw_text(ctx.rect.x, ctx.rect.y + font.size, ctx.data.caption, style);

        const std::string label = ctx.data.value + ctx.data.unit;
        const TextExtents extents = surface.measure_text(label, style);
        surface.draw_text(ctx.rect.right() - extents.width, ctx.rect.y + font.size, label, style);

        if (ctx.config.display_as == ContentDisplayType::Text)
            return;

        Rect bar{ctx.rect.x, ctx.rect.bottom() - 8.0f, ctx.rect.w, 6.0f};
        surface.fill_rect(bar, track);
        bar.w *= static_cast<float>(ctx.display_value);
        surface.fill_rect(bar, accent);
    }
};

MetricValues sample_metrics(float t)
{
    MetricValues values;
    for (int i = 1; i <= 4; ++i)
    {
        const std::string slot = "group1_" + std::to_string(i);
        const double      load = 50.0 + 45.0 * std::sin(t * (0.7 + 0.3 * i));
        values[slot + "_caption"] = "CPU" + std::to_string(i - 1);
        values[slot + "_value"]   = std::round(load);
        values[slot + "_unit"]    = std::string("%");
    }

    values["group2_1_caption"]         = std::string("TEMP");
    values["group2_1_value"]           = 40.0 + 25.0 * std::sin(t * 0.4);
    values["group2_1_unit"]            = std::string("C");
    values["group2_1_max_limit"]       = 110.0;
    values["group2_2_caption"]         = std::string("FAN");
    values["group2_2_value"]           = std::string("auto");
    values["group2_2_numerical_value"] = 1200.0 + 300.0 * std::sin(t);
    values["group2_2_max_limit"]       = 3000.0;
    return values;
}

}   // namespace

// Renders a few seconds of a two-group panel to SVG files, switching theme
// and skin halfway through, and round-trips the configuration through JSON.
int main(int argc, char** argv)
{
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    const std::string out_dir = argc > 1 ? argv[1] : ".";

    SkinRegistry registry = SkinRegistry::with_builtin_skins();
    auto         config   = registry.create_default_config("cyberpunk");
    if (!config)
    {
        COMBOPANEL_LOG_CRITICAL("demo", "cyberpunk skin missing from registry");
        return 1;
    }

    config->layout().group_count       = 2;
    config->layout().group_weights     = {2.0f, 1.0f};
    config->layout().group_item_counts = {4, 2};
    config->layout().split_orientation = Orientation::Horizontal;
    for (int i = 1; i <= 4; ++i)
        config->layout().content_slots["group1_" + std::to_string(i)].display_as = ContentDisplayType::Bar;
    config->layout().content_slots["group2_1"].display_as = ContentDisplayType::LevelBar;
    config->layout().content_slots["group2_2"].display_as = ContentDisplayType::Text;

    const std::string config_path = out_dir + "/panel_demo.json";
    if (!ConfigSerializer::save(config_path, *config))
    {
        COMBOPANEL_LOG_ERROR("demo", "could not save {}", config_path);
        return 1;
    }

    auto loaded = ConfigSerializer::load(config_path, registry);
    if (!loaded)
    {
        COMBOPANEL_LOG_ERROR("demo", "could not reload {}", config_path);
        return 1;
    }

    auto          skin = registry.find(loaded->skin_id());
    PanelComposer panel(skin, std::move(loaded));
    panel.set_item_renderer(std::make_shared<SimpleItemRenderer>());

    FrameScheduler scheduler(30.0f, FrameScheduler::Mode::Uncapped);
    scheduler.set_fixed_timestep(1.0f / 30.0f);

    SvgSurface surface;
    const int  frame_count = 90;
    int        written     = 0;
    for (int frame = 0; frame < frame_count; ++frame)
    {
        scheduler.advance(1.0f / 30.0f);
        const float t = scheduler.elapsed_seconds();

        if (frame == frame_count / 3 && !panel.apply_theme_preset("synthwave"))
            COMBOPANEL_LOG_WARN("demo", "theme preset missing");
        if (frame == 2 * frame_count / 3 && !panel.switch_skin(registry.find("retro_terminal")))
            COMBOPANEL_LOG_WARN("demo", "skin switch rejected");

        if (frame % 5 == 0)
            panel.update_values(sample_metrics(t));

        if (!panel.needs_redraw())
            continue;

        surface.set_output_path(out_dir + "/panel_" + std::to_string(frame) + ".svg");
        PanelRenderResult result = panel.render(surface, 480.0f, 240.0f, scheduler.dt());
        if (!result)
        {
            COMBOPANEL_LOG_ERROR("demo", "frame {} failed: {}", frame, result.error);
            return 1;
        }
        ++written;
    }

    COMBOPANEL_LOG_INFO("demo", "wrote {} of {} frames to {}", written, frame_count, out_dir);
    std::cout << "Saved " << written << " SVG frames\n";
    return 0;
}
