#include <combopanel/logger.hpp>
#include <combopanel/skin_registry.hpp>
#include <combopanel/skins/cyberpunk.hpp>
#include <combopanel/skins/retro_terminal.hpp>

namespace combopanel
{

SkinRegistry SkinRegistry::with_builtin_skins()
{
    SkinRegistry registry;
    registry.register_skin(std::make_shared<CyberpunkRenderer>());
    registry.register_skin(std::make_shared<RetroTerminalRenderer>());
    return registry;
}

bool SkinRegistry::register_skin(std::shared_ptr<const FrameRenderer> renderer)
{
    if (!renderer)
        return false;

    if (contains(renderer->id()))
    {
        COMBOPANEL_LOG_WARN("skin", "Skin '{}' is already registered", renderer->id());
        return false;
    }

    COMBOPANEL_LOG_DEBUG("skin", "Registered skin '{}'", renderer->id());
    skins_.push_back(std::move(renderer));
    return true;
}

std::shared_ptr<const FrameRenderer> SkinRegistry::find(std::string_view id) const
{
    for (const auto& skin : skins_)
    {
        if (skin->id() == id)
            return skin;
    }
    return nullptr;
}

bool SkinRegistry::contains(std::string_view id) const
{
    return find(id) != nullptr;
}

std::unique_ptr<FrameConfig> SkinRegistry::create_default_config(std::string_view id) const
{
    auto skin = find(id);
    if (!skin)
    {
        COMBOPANEL_LOG_WARN("skin", "Unknown skin '{}'", id);
        return nullptr;
    }
    return skin->default_config();
}

std::vector<std::string> SkinRegistry::ids() const
{
    std::vector<std::string> out;
    out.reserve(skins_.size());
    for (const auto& skin : skins_)
        out.emplace_back(skin->id());
    return out;
}

}   // namespace combopanel
