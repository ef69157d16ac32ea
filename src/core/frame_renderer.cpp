#include <combopanel/frame_renderer.hpp>

#include "layout.hpp"

namespace combopanel
{

void FrameRenderer::calculate_group_layouts(const FrameConfig& config,
                                            const Rect&        content,
                                            std::vector<Rect>& out) const
{
    const auto& layout = config.layout();
    compute_group_layouts(content,
                          layout.effective_group_count(),
                          layout.group_weights,
                          layout.split_orientation,
                          config.divider_width(),
                          config.divider_padding(),
                          out);
}

std::vector<Rect> FrameRenderer::calculate_group_layouts(const FrameConfig& config,
                                                         const Rect&        content) const
{
    std::vector<Rect> out;
    calculate_group_layouts(config, content, out);
    return out;
}

}   // namespace combopanel
