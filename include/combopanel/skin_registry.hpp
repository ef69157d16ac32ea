#pragma once

#include <combopanel/frame_config.hpp>
#include <combopanel/frame_renderer.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace combopanel
{

// Lookup of skins by id. Owned by the application, not global.
class SkinRegistry
{
   public:
    // Registry preloaded with the retro terminal and cyberpunk skins
    static SkinRegistry with_builtin_skins();

    // Returns false (and keeps the existing entry) if the id is taken
    bool register_skin(std::shared_ptr<const FrameRenderer> renderer);

    std::shared_ptr<const FrameRenderer> find(std::string_view id) const;
    bool                                 contains(std::string_view id) const;

    // Default config of skin `id`, nullptr when unknown
    std::unique_ptr<FrameConfig> create_default_config(std::string_view id) const;

    std::vector<std::string> ids() const;
    size_t                   size() const { return skins_.size(); }

   private:
    std::vector<std::shared_ptr<const FrameRenderer>> skins_;
};

}   // namespace combopanel
