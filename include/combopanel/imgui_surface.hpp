#pragma once

#include <combopanel/draw_surface.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

struct ImDrawList;
struct ImFont;

namespace combopanel
{

class FontMetricsCache;

// DrawSurface over a Dear ImGui draw list. Coordinates are panel-local and
// shifted by the origin; the panel rect is pushed as a clip rect per frame.
class ImGuiSurface : public DrawSurface
{
   public:
    static constexpr size_t DEFAULT_FONT_CACHE_CAPACITY = 512;

    // Strips used to approximate gradients ImDrawList cannot draw natively
    static constexpr int GRADIENT_STEPS = 16;

    explicit ImGuiSurface(ImDrawList* draw_list           = nullptr,
                          size_t      font_cache_capacity = DEFAULT_FONT_CACHE_CAPACITY);
    ~ImGuiSurface() override;

    ImGuiSurface(const ImGuiSurface&)            = delete;
    ImGuiSurface& operator=(const ImGuiSurface&) = delete;

    // Target for the next frame, typically ImGui::GetWindowDrawList()
    void set_draw_list(ImDrawList* draw_list) { draw_list_ = draw_list; }
    void set_origin(float x, float y);

    // Font used for `family`; unregistered families use the default font
    void register_font(const std::string& family, ImFont* font);
    void set_default_font(ImFont* font);

    size_t font_cache_size() const;

    bool begin_frame(float width, float height) override;
    bool end_frame() override;

    bool        ok() const override { return error_.empty(); }
    std::string last_error() const override { return error_; }

    void save() override;
    void restore() override;

    void push_clip(const Rect& rect) override;
    void pop_clip() override;

    void fill_rect(const Rect& rect, const Color& color) override;
    void stroke_rect(const Rect& rect, const Stroke& stroke) override;
    void fill_rounded_rect(const Rect& rect, float radius, const Color& color) override;
    void stroke_rounded_rect(const Rect& rect, float radius, const Stroke& stroke) override;
    void fill_path(const Path& path, const Color& color) override;
    void stroke_path(const Path& path, const Stroke& stroke) override;
    void fill_linear_gradient(const Rect& rect, const LinearGradient& gradient) override;
    void fill_radial_gradient(const Rect& rect, const RadialGradient& gradient) override;

    TextExtents measure_text(std::string_view text, const TextStyle& style) override;
    void        draw_text(float x, float y, std::string_view text, const TextStyle& style) override;

   private:
    ImFont* font_for(const TextStyle& style) const;
    void    fail(std::string message);
    void    trace_path(const Path& path, size_t begin, size_t end);
    void    stroke_dashed(const Path& path, const Stroke& stroke);

    ImDrawList*                              draw_list_    = nullptr;
    ImFont*                                  default_font_ = nullptr;
    std::unordered_map<std::string, ImFont*> fonts_;
    std::unique_ptr<FontMetricsCache>        metrics_;

    float            origin_x_ = 0.0f;
    float            origin_y_ = 0.0f;
    bool             in_frame_ = false;
    std::string      error_;
    int              open_clips_ = 0;
    std::vector<int> saved_clips_;
};

}   // namespace combopanel
