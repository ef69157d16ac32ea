#include <combopanel/frame_config.hpp>
#include <combopanel/skins/cyberpunk.hpp>
#include <combopanel/skins/retro_terminal.hpp>
#include <gtest/gtest.h>

using namespace combopanel;

// ─── LayoutSettings normalization ────────────────────────────────────────────

TEST(LayoutSettings, EffectiveGroupCountCoercesZero)
{
    LayoutSettings s;
    s.group_count = 0;
    EXPECT_EQ(s.effective_group_count(), 1u);
    s.group_count = 4;
    EXPECT_EQ(s.effective_group_count(), 4u);
}

TEST(LayoutSettings, CountsClampedToLimits)
{
    LayoutSettings s;
    s.group_count       = 1'000'000'000'000;
    s.group_item_counts = {0, 3, 5'000'000'000};
    EXPECT_EQ(s.effective_group_count(), LayoutSettings::MAX_GROUPS);
    EXPECT_EQ(s.effective_weights().size(), LayoutSettings::MAX_GROUPS);

    auto counts = s.effective_item_counts();
    ASSERT_EQ(counts.size(), LayoutSettings::MAX_GROUPS);
    EXPECT_EQ(counts[0], 1u);
    EXPECT_EQ(counts[1], 3u);
    EXPECT_EQ(counts[2], LayoutSettings::MAX_ITEMS_PER_GROUP);
    EXPECT_EQ(counts[3], 1u);
}

TEST(LayoutSettings, WeightsPaddedAndTruncated)
{
    LayoutSettings s;
    s.group_count   = 3;
    s.group_weights = {2.0f};
    EXPECT_EQ(s.effective_weights(), (std::vector<float>{2.0f, 1.0f, 1.0f}));

    s.group_weights = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
    EXPECT_EQ(s.effective_weights(), (std::vector<float>{1.0f, 2.0f, 3.0f}));
}

TEST(LayoutSettings, NegativeWeightsClampToZero)
{
    LayoutSettings s;
    s.group_count   = 2;
    s.group_weights = {-1.0f, 3.0f};
    EXPECT_EQ(s.effective_weights(), (std::vector<float>{0.0f, 3.0f}));
}

TEST(LayoutSettings, NonPositiveSumGivesEqualWeights)
{
    LayoutSettings s;
    s.group_count   = 3;
    s.group_weights = {0.0f, -2.0f, 0.0f};
    EXPECT_EQ(s.effective_weights(), (std::vector<float>{1.0f, 1.0f, 1.0f}));
    // Stored weights stay as edited
    EXPECT_FLOAT_EQ(s.group_weights[1], -2.0f);
}

TEST(LayoutSettings, ItemCountsPaddedAndZerosRaised)
{
    LayoutSettings s;
    s.group_count       = 3;
    s.group_item_counts = {4, 0};
    EXPECT_EQ(s.effective_item_counts(), (std::vector<size_t>{4, 1, 1}));
}

TEST(LayoutSettings, ItemOrientationDefaultsToSplit)
{
    LayoutSettings s;
    s.split_orientation       = Orientation::Horizontal;
    s.group_item_orientations = {Orientation::Vertical};
    EXPECT_EQ(s.item_orientation(0), Orientation::Vertical);
    EXPECT_EQ(s.item_orientation(1), Orientation::Horizontal);
}

// ─── Display types ───────────────────────────────────────────────────────────

TEST(DisplayType, NamesRoundTrip)
{
    for (auto t : {ContentDisplayType::Bar,
                   ContentDisplayType::Text,
                   ContentDisplayType::Graph,
                   ContentDisplayType::LevelBar,
                   ContentDisplayType::CoreBars,
                   ContentDisplayType::Static,
                   ContentDisplayType::Arc,
                   ContentDisplayType::Speedometer})
    {
        auto parsed = display_type_from_name(display_type_name(t));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, t);
    }
    EXPECT_FALSE(display_type_from_name("hologram").has_value());
}

// ─── Capability interfaces ───────────────────────────────────────────────────

TEST(FrameConfig, CapabilitiesShareOneSettingsBlock)
{
    CyberpunkConfig config;
    FrameConfig&    base = config;

    base.layout().group_count = 5;
    base.animation().speed    = 2.5f;

    EXPECT_EQ(config.combo.layout.group_count, 5u);
    EXPECT_FLOAT_EQ(config.combo.animation.speed, 2.5f);

    Theme t = default_theme();
    t.name  = "edited";
    base.set_theme(t);
    EXPECT_EQ(config.theme().name, "edited");
}

TEST(FrameConfig, CloneIsDeepAndTyped)
{
    RetroTerminalConfig config;
    config.header_text                          = "NODE-7";
    config.layout().content_slots["group1_1"] = ContentItemConfig{};

    auto copy = config.clone();
    ASSERT_NE(copy, nullptr);
    auto* typed = dynamic_cast<RetroTerminalConfig*>(copy.get());
    ASSERT_NE(typed, nullptr);
    EXPECT_EQ(typed->header_text, "NODE-7");
    EXPECT_EQ(typed->layout().content_slots.size(), 1u);

    typed->header_text = "changed";
    EXPECT_EQ(config.header_text, "NODE-7");
}

TEST(FrameConfig, SkinDividerMetrics)
{
    RetroTerminalConfig retro;
    EXPECT_FLOAT_EQ(retro.divider_width(), RetroTerminalConfig::DIVIDER_WIDTH);
    EXPECT_FLOAT_EQ(retro.divider_padding(), retro.divider_gap);

    CyberpunkConfig cyber;
    cyber.divider_thickness = 3.0f;
    EXPECT_FLOAT_EQ(cyber.divider_width(), 3.0f);
    EXPECT_FALSE(cyber.item_frame_enabled());
    cyber.item_frames = true;
    EXPECT_TRUE(cyber.item_frame_enabled());
}

// ─── Transfer ────────────────────────────────────────────────────────────────

TEST(TransferableConfig, CarriesLayoutAndAnimation)
{
    CyberpunkConfig source;
    source.layout().group_count       = 2;
    source.layout().group_item_counts = {2, 1};
    source.layout().group_weights     = {3.0f, 1.0f};
    source.layout().split_orientation = Orientation::Horizontal;
    source.layout().content_padding   = 17.0f;
    source.layout().item_spacing      = 6.0f;
    source.layout().content_slots["group1_1"].display_as = ContentDisplayType::Graph;
    source.layout().content_slots["group1_2"].display_as = ContentDisplayType::Text;
    source.layout().content_slots["group2_1"].display_as = ContentDisplayType::Arc;
    source.animation().enabled                           = false;
    source.animation().speed                             = 3.0f;
    source.border_width                                  = 9.0f;

    auto transfer = extract_transferable(source);

    RetroTerminalConfig target;
    apply_transferable(target, transfer);

    EXPECT_EQ(target.layout(), source.layout());
    EXPECT_EQ(target.animation(), source.animation());
    EXPECT_EQ(target.layout().content_slots.size(), 3u);
}

TEST(TransferableConfig, SkinDecorationAndThemeStay)
{
    CyberpunkConfig source;
    source.show_header = true;

    RetroTerminalConfig target;
    const Theme         theme_before  = target.theme();
    const std::string   header_before = target.header_text;

    apply_transferable(target, extract_transferable(source));
    EXPECT_EQ(target.theme(), theme_before);
    EXPECT_EQ(target.header_text, header_before);
    EXPECT_EQ(target.bezel_style, BezelStyle::Classic);
}

TEST(TransferableConfig, DefaultLayoutReplacesTargetDefaults)
{
    // Retro defaults to one group of four; cyberpunk to two groups of one
    RetroTerminalConfig source;
    source.layout().group_count = 0;

    CyberpunkConfig target;
    apply_transferable(target, extract_transferable(source));
    EXPECT_EQ(target.layout().group_count, 0u);
    EXPECT_EQ(target.layout().group_item_counts, (std::vector<size_t>{4}));
    EXPECT_TRUE(target.layout().content_slots.empty());
}
