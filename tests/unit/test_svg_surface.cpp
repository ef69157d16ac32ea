#include <combopanel/panel.hpp>
#include <combopanel/skins/cyberpunk.hpp>
#include <combopanel/skins/retro_terminal.hpp>
#include <combopanel/svg_surface.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>

using namespace combopanel;

namespace
{

size_t count_of(const std::string& haystack, const std::string& needle)
{
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1))
        ++count;
    return count;
}

}   // namespace

// ─── Frame lifecycle ─────────────────────────────────────────────────────────

TEST(SvgSurface, EmptyFrameIsValidDocument)
{
    SvgSurface surface;
    EXPECT_TRUE(surface.document().empty());

    ASSERT_TRUE(surface.begin_frame(200.0f, 100.0f));
    ASSERT_TRUE(surface.end_frame());

    const std::string& doc = surface.document();
    EXPECT_EQ(doc.rfind("<?xml", 0), 0u);
    EXPECT_NE(doc.find("width=\"200\" height=\"100\" viewBox=\"0 0 200 100\""), std::string::npos);
    EXPECT_NE(doc.find("</svg>"), std::string::npos);
    EXPECT_EQ(doc.find("<defs>"), std::string::npos);
}

TEST(SvgSurface, InvalidSizeFails)
{
    SvgSurface surface;
    EXPECT_FALSE(surface.begin_frame(0.0f, 100.0f));
    EXPECT_FALSE(surface.ok());
    EXPECT_EQ(surface.last_error(), "invalid frame size");
}

TEST(SvgSurface, UnbalancedFrameCallsFail)
{
    SvgSurface surface;
    EXPECT_FALSE(surface.end_frame());

    ASSERT_TRUE(surface.begin_frame(10.0f, 10.0f));
    EXPECT_FALSE(surface.begin_frame(10.0f, 10.0f));
    EXPECT_EQ(surface.last_error(), "begin_frame called twice");

    // Recovers on the next frame
    EXPECT_TRUE(surface.begin_frame(10.0f, 10.0f));
    EXPECT_TRUE(surface.end_frame());
    EXPECT_TRUE(surface.ok());
}

// ─── Primitives ──────────────────────────────────────────────────────────────

TEST(SvgSurface, ShapesAndText)
{
    SvgSurface surface;
    ASSERT_TRUE(surface.begin_frame(100.0f, 50.0f));
    surface.fill_rect(Rect{1.0f, 2.0f, 30.0f, 40.0f}, Color(1.0f, 0.0f, 0.0f, 0.5f));
    surface.stroke_rect(Rect{0.0f, 0.0f, 10.0f, 10.0f}, Stroke{colors::green, 2.0f, {4.0f, 2.0f}});

    Path p;
    p.move_to(0.0f, 0.0f).line_to(10.0f, 0.0f).line_to(10.0f, 10.0f).close();
    surface.fill_path(p, colors::blue);

    TextStyle style;
    style.family = "Mono";
    style.size   = 12.0f;
    style.bold   = true;
    surface.draw_text(5.0f, 20.0f, "CPU <80%> & \"fan\"", style);
    ASSERT_TRUE(surface.end_frame());

    const std::string& doc = surface.document();
    EXPECT_NE(doc.find("<rect x=\"1\" y=\"2\" width=\"30\" height=\"40\" fill=\"rgb(255,0,0)\" fill-opacity=\"0.5\"/>"),
              std::string::npos);
    EXPECT_NE(doc.find("stroke=\"rgb(0,255,0)\" stroke-width=\"2\" stroke-dasharray=\"4,2\""),
              std::string::npos);
    EXPECT_NE(doc.find("<path d=\"M0 0 L10 0 L10 10 Z\" fill=\"rgb(0,0,255)\"/>"), std::string::npos);
    EXPECT_NE(doc.find("font-weight=\"bold\""), std::string::npos);
    EXPECT_NE(doc.find("CPU &lt;80%&gt; &amp; &quot;fan&quot;"), std::string::npos);
}

TEST(SvgSurface, GradientsGoToDefs)
{
    SvgSurface surface;
    ASSERT_TRUE(surface.begin_frame(100.0f, 100.0f));

    LinearGradient lg = linear_gradient_for(Rect{0.0f, 0.0f, 100.0f, 100.0f},
                                            0.0f,
                                            {{1.0f, colors::blue}, {0.0f, colors::red}});
    surface.fill_linear_gradient(Rect{0.0f, 0.0f, 100.0f, 100.0f}, lg);

    RadialGradient rg;
    rg.cx     = 50.0f;
    rg.cy     = 50.0f;
    rg.radius = 40.0f;
    rg.stops  = {{0.0f, colors::white}, {1.0f, colors::black.with_alpha(0.0f)}};
    surface.fill_radial_gradient(Rect{0.0f, 0.0f, 100.0f, 100.0f}, rg);
    ASSERT_TRUE(surface.end_frame());

    const std::string& doc = surface.document();
    EXPECT_NE(doc.find("<defs>"), std::string::npos);
    EXPECT_NE(doc.find("<linearGradient id=\"grad1\""), std::string::npos);
    EXPECT_NE(doc.find("<radialGradient id=\"grad2\""), std::string::npos);
    EXPECT_NE(doc.find("fill=\"url(#grad1)\""), std::string::npos);

    // Stops written in ascending order
    const size_t red  = doc.find("stop-color=\"rgb(255,0,0)\"");
    const size_t blue = doc.find("stop-color=\"rgb(0,0,255)\"");
    ASSERT_NE(red, std::string::npos);
    ASSERT_NE(blue, std::string::npos);
    EXPECT_LT(red, blue);
    // Defs precede the body
    EXPECT_LT(doc.find("</defs>"), doc.find("fill=\"url(#grad1)\""));
}

TEST(SvgSurface, FullCircleSplitIntoTwoArcs)
{
    SvgSurface surface;
    ASSERT_TRUE(surface.begin_frame(100.0f, 100.0f));
    Path p;
    p.circle(50.0f, 50.0f, 10.0f);
    surface.fill_path(p, colors::white);
    ASSERT_TRUE(surface.end_frame());

    EXPECT_EQ(count_of(surface.document(), "A10 10"), 2u);
}

// ─── Clips ───────────────────────────────────────────────────────────────────

TEST(SvgSurface, ClipGroupsBalanced)
{
    SvgSurface surface;
    ASSERT_TRUE(surface.begin_frame(100.0f, 100.0f));
    surface.push_clip(Rect{0.0f, 0.0f, 50.0f, 50.0f});
    surface.save();
    surface.push_clip(Rect{10.0f, 10.0f, 20.0f, 20.0f});
    surface.push_clip(Rect{12.0f, 12.0f, 5.0f, 5.0f});
    surface.restore();   // closes the two clips pushed after save()
    surface.fill_rect(Rect{0.0f, 0.0f, 5.0f, 5.0f}, colors::red);
    surface.pop_clip();
    surface.pop_clip();   // unmatched, ignored
    ASSERT_TRUE(surface.end_frame());

    const std::string& doc = surface.document();
    EXPECT_EQ(count_of(doc, "<clipPath"), 3u);
    EXPECT_EQ(count_of(doc, "<g clip-path"), count_of(doc, "</g>"));
}

TEST(SvgSurface, OpenClipsClosedAtEndOfFrame)
{
    SvgSurface surface;
    ASSERT_TRUE(surface.begin_frame(100.0f, 100.0f));
    surface.push_clip(Rect{0.0f, 0.0f, 50.0f, 50.0f});
    surface.push_clip(Rect{0.0f, 0.0f, 25.0f, 25.0f});
    ASSERT_TRUE(surface.end_frame());

    EXPECT_EQ(count_of(surface.document(), "</g>"), 2u);
}

// ─── Output file ─────────────────────────────────────────────────────────────

TEST(SvgSurface, WritesOutputFile)
{
    const std::string path =
        (std::filesystem::temp_directory_path() / "combopanel_test_surface.svg").string();

    SvgSurface surface;
    surface.set_output_path(path);
    ASSERT_TRUE(surface.begin_frame(64.0f, 32.0f));
    surface.fill_rect(Rect{0.0f, 0.0f, 64.0f, 32.0f}, colors::black);
    ASSERT_TRUE(surface.end_frame());

    std::ifstream     in(path);
    const std::string on_disk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(on_disk, surface.document());
    std::remove(path.c_str());
}

TEST(SvgSurface, UnwritablePathFailsFrame)
{
    SvgSurface surface;
    surface.set_output_path("/nonexistent/dir/out.svg");
    ASSERT_TRUE(surface.begin_frame(64.0f, 32.0f));
    EXPECT_FALSE(surface.end_frame());
    EXPECT_FALSE(surface.ok());
    EXPECT_NE(surface.last_error().find("/nonexistent/dir/out.svg"), std::string::npos);
    // Document is still available in memory
    EXPECT_FALSE(surface.document().empty());
}

// ─── Text metrics ────────────────────────────────────────────────────────────

TEST(SvgSurface, FontCacheBounded)
{
    SvgSurface surface(4);
    TextStyle  style;
    for (int i = 0; i < 20; ++i)
        surface.measure_text("label " + std::to_string(i), style);
    EXPECT_EQ(surface.font_cache_size(), 4u);
}

// ─── With a panel ────────────────────────────────────────────────────────────

TEST(SvgSurface, RendersWholePanel)
{
    for (std::shared_ptr<const FrameRenderer> skin :
         {std::shared_ptr<const FrameRenderer>(std::make_shared<CyberpunkRenderer>()),
          std::shared_ptr<const FrameRenderer>(std::make_shared<RetroTerminalRenderer>())})
    {
        PanelComposer panel(skin);
        panel.edit_config().layout().group_count = 2;

        SvgSurface surface;
        auto       result = panel.render(surface, 320.0f, 200.0f, 0.016f);
        ASSERT_TRUE(result.ok) << result.error;

        const std::string& doc = surface.document();
        EXPECT_NE(doc.find("<path"), std::string::npos) << skin->id();
        EXPECT_EQ(count_of(doc, "<g clip-path"), count_of(doc, "</g>")) << skin->id();
    }
}
