#pragma once

#include <combopanel/draw_surface.hpp>
#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace combopanel
{

class FontMetricsCache;

// DrawSurface that records one frame as an SVG document.
// Each end_frame() replaces document(); with an output path set the
// document is also written to that file.
class SvgSurface : public DrawSurface
{
   public:
    static constexpr size_t DEFAULT_FONT_CACHE_CAPACITY = 256;

    explicit SvgSurface(size_t font_cache_capacity = DEFAULT_FONT_CACHE_CAPACITY);
    ~SvgSurface() override;

    SvgSurface(const SvgSurface&)            = delete;
    SvgSurface& operator=(const SvgSurface&) = delete;

    void               set_output_path(std::string path) { output_path_ = std::move(path); }
    const std::string& output_path() const { return output_path_; }

    // Last completed frame, empty before the first end_frame()
    const std::string& document() const { return document_; }

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
    void        fail(std::string message);
    void        indent();
    std::string next_id(const char* prefix);

    std::ostringstream body_;
    std::ostringstream defs_;
    float              width_    = 0.0f;
    float              height_   = 0.0f;
    bool               in_frame_ = false;
    std::string        error_;
    std::string        output_path_;
    std::string        document_;
    int                id_counter_ = 0;

    // Open clip groups, and their count at each save()
    int              open_clips_ = 0;
    std::vector<int> saved_clips_;

    std::unique_ptr<FontMetricsCache> fonts_;
};

}   // namespace combopanel
