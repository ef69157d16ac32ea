#pragma once

#include <combopanel/frame_config.hpp>
#include <combopanel/skin_registry.hpp>
#include <combopanel/theme.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace combopanel
{

// JSON panel configuration documents
//
//   { "version": 1, "skin": "<id>", "theme": {...}, "layout": {...},
//     "content_slots": {...}, "animation": {...}, "skin_config": {...} }
//
// Missing fields keep the skin's defaults. Colors may be written either as
// {"type": "custom"|"theme", ...} objects or as bare [r, g, b, a] arrays.
class ConfigSerializer
{
   public:
    static constexpr int VERSION = 1;

    static std::string to_json(const FrameConfig& config);

    // nullptr on malformed documents, newer versions or unknown skins
    static std::unique_ptr<FrameConfig> from_json(std::string_view text, const SkinRegistry& registry);

    // Returns true on success
    static bool save(const std::string& path, const FrameConfig& config);

    static std::unique_ptr<FrameConfig> load(const std::string& path, const SkinRegistry& registry);
};

// Standalone theme files, used to share presets between panels
class ThemeSerializer
{
   public:
    static std::string          to_json(const Theme& theme);
    static std::optional<Theme> from_json(std::string_view text);

    static bool                 save(const std::string& path, const Theme& theme);
    static std::optional<Theme> load(const std::string& path);
};

}   // namespace combopanel
