#pragma once

#include <array>
#include <combopanel/geometry.hpp>
#include <combopanel/theme.hpp>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace combopanel
{

// How the external item renderer should present a slot's metric
enum class ContentDisplayType
{
    Bar,
    Text,
    Graph,
    LevelBar,
    CoreBars,
    Static,
    Arc,
    Speedometer,
};

const char*                       display_type_name(ContentDisplayType type);
std::optional<ContentDisplayType> display_type_from_name(std::string_view name);

// Content bound to one slot. The core only routes it; the item renderer owns
// the meaning of `properties`.
struct ContentItemConfig
{
    ContentDisplayType                 display_as  = ContentDisplayType::Bar;
    float                              item_height = 0.0f;   // 0 = share equally
    bool                               auto_height = true;
    std::map<std::string, std::string> properties;

    bool operator==(const ContentItemConfig&) const = default;
};

// Keyed by slot name ("group{G}_{I}")
using ContentSlots = std::map<std::string, ContentItemConfig>;

// ─── Shared settings ────────────────────────────────────────────────────────

inline constexpr float DEFAULT_ANIMATION_SPEED = 8.0f;
inline constexpr float DEFAULT_ITEM_SPACING    = 4.0f;

// Group/slot layout shared by every skin. Raw fields are stored as edited;
// the effective_* accessors apply the normalization rules.
struct LayoutSettings
{
    static constexpr size_t MAX_GROUPS          = 16;
    static constexpr size_t MAX_ITEMS_PER_GROUP = 32;

    size_t                   group_count = 1;
    std::vector<size_t>      group_item_counts;
    std::vector<float>       group_weights;
    std::vector<Orientation> group_item_orientations;
    Orientation              split_orientation = Orientation::Vertical;
    float                    content_padding   = 8.0f;
    float                    item_spacing      = DEFAULT_ITEM_SPACING;
    ContentSlots             content_slots;

    // group_count clamped to [1, MAX_GROUPS]
    size_t effective_group_count() const;

    // Exactly effective_group_count() entries: padded with 1.0, truncated,
    // negative entries clamped to 0, equal weights when the sum is not positive.
    std::vector<float> effective_weights() const;

    // Exactly effective_group_count() entries, padded with 1, each clamped
    // to [1, MAX_ITEMS_PER_GROUP]
    std::vector<size_t> effective_item_counts() const;

    // Orientation used to stack the items of group `group` (0-based)
    Orientation item_orientation(size_t group) const;

    bool operator==(const LayoutSettings&) const = default;
};

struct AnimationSettings
{
    bool  enabled = true;
    float speed   = DEFAULT_ANIMATION_SPEED;

    bool operator==(const AnimationSettings&) const = default;
};

// The base structure composed into every skin config
struct ComboSettings
{
    Theme             theme = default_theme();
    LayoutSettings    layout;
    AnimationSettings animation;
};

// ─── Skin fields ────────────────────────────────────────────────────────────

// Walks the persisted fields a skin adds on top of ComboSettings. Serializers
// and editors implement it, so they never need the concrete config type.
class SkinFieldVisitor
{
   public:
    virtual ~SkinFieldVisitor() = default;

    virtual void field(std::string_view name, bool& value)        = 0;
    virtual void field(std::string_view name, float& value)       = 0;
    virtual void field(std::string_view name, std::string& value) = 0;
    virtual void field(std::string_view name, Color& value)       = 0;
    virtual void field(std::string_view name, ColorSource& value) = 0;
    virtual void field(std::string_view name, FontSource& value)  = 0;

    // Enumerations travel as an index into `names`. Implementations only
    // ever store an index below names.size().
    virtual void choice(std::string_view name, size_t& index, std::span<const char* const> names) = 0;

    template <typename E, size_t N>
    void choice(std::string_view name, E& value, const std::array<const char*, N>& names)
    {
        auto index = static_cast<size_t>(value);
        choice(name, index, std::span<const char* const>(names));
        value = static_cast<E>(index);
    }
};

// ─── Capability interfaces ──────────────────────────────────────────────────

class ThemedConfig
{
   public:
    virtual ~ThemedConfig() = default;

    virtual const Theme& theme() const              = 0;
    virtual void         set_theme(const Theme& th) = 0;
};

class LayoutConfig
{
   public:
    virtual ~LayoutConfig() = default;

    virtual const LayoutSettings& layout() const = 0;
    virtual LayoutSettings&       layout()       = 0;

    // Thickness of the divider band and the gap kept on each side of it
    virtual float divider_width() const   = 0;
    virtual float divider_padding() const = 0;
};

class AnimatedConfig
{
   public:
    virtual ~AnimatedConfig() = default;

    virtual const AnimationSettings& animation() const = 0;
    virtual AnimationSettings&       animation()       = 0;
};

// Configuration object every skin must provide
class FrameConfig : public ThemedConfig, public LayoutConfig, public AnimatedConfig
{
   public:
    virtual std::string_view             skin_id() const = 0;
    virtual std::unique_ptr<FrameConfig> clone() const   = 0;

    virtual bool item_frame_enabled() const { return false; }

    // Skin decoration only; theme, layout and animation are not visited
    virtual void visit_skin_fields(SkinFieldVisitor& visitor) { (void)visitor; }
};

// Implements the capability accessors on top of a ComboSettings member.
// Skins derive as `struct MyConfig : ComboFrameConfig<MyConfig>`.
template <typename Derived>
class ComboFrameConfig : public FrameConfig
{
   public:
    ComboSettings combo;

    const Theme& theme() const override { return combo.theme; }
    void         set_theme(const Theme& th) override { combo.theme = th; }

    const LayoutSettings& layout() const override { return combo.layout; }
    LayoutSettings&       layout() override { return combo.layout; }

    const AnimationSettings& animation() const override { return combo.animation; }
    AnimationSettings&       animation() override { return combo.animation; }

    std::unique_ptr<FrameConfig> clone() const override
    {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }
};

// ─── Skin switching ─────────────────────────────────────────────────────────

// Fields that survive a change of skin
struct TransferableConfig
{
    LayoutSettings    layout;
    AnimationSettings animation;
};

TransferableConfig extract_transferable(const FrameConfig& config);

// Overwrites layout and animation; theme and skin decoration are untouched
void apply_transferable(FrameConfig& config, const TransferableConfig& transfer);

}   // namespace combopanel
