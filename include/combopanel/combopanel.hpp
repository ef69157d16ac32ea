#pragma once

#include <combopanel/color.hpp>
#include <combopanel/config_serializer.hpp>
#include <combopanel/content_item.hpp>
#include <combopanel/draw_surface.hpp>
#include <combopanel/frame_config.hpp>
#include <combopanel/frame_renderer.hpp>
#include <combopanel/frame_scheduler.hpp>
#include <combopanel/fwd.hpp>
#include <combopanel/geometry.hpp>
#include <combopanel/logger.hpp>
#include <combopanel/panel.hpp>
#include <combopanel/skin_registry.hpp>
#include <combopanel/skins/cyberpunk.hpp>
#include <combopanel/skins/retro_terminal.hpp>
#include <combopanel/svg_surface.hpp>
#include <combopanel/theme.hpp>

// ImGuiSurface lives in <combopanel/imgui_surface.hpp> and needs the
// combopanel_imgui target.
