#pragma once

// DrawSurface that records every call instead of drawing.
//
// Usage:
//   combopanel::test::RecordingSurface surface;
//   renderer.render_frame(surface, config, 200.0f, 100.0f);
//   EXPECT_GT(surface.draw_call_count(), 0u);
//
// fail_begin / fail_end simulate a backend that cannot start or finish a frame.

#include <algorithm>
#include <combopanel/draw_surface.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace combopanel::test
{

class RecordingSurface : public DrawSurface
{
   public:
    enum class Op
    {
        BeginFrame,
        EndFrame,
        Save,
        Restore,
        PushClip,
        PopClip,
        FillRect,
        StrokeRect,
        FillRoundedRect,
        StrokeRoundedRect,
        FillPath,
        StrokePath,
        FillLinearGradient,
        FillRadialGradient,
        MeasureText,
        DrawText,
    };

    struct Call
    {
        Op          op;
        Rect        rect;
        Color       color;
        std::string text;
        float       width    = 0.0f;
        size_t      elements = 0;   // path verbs, for fill_path / stroke_path
    };

    bool fail_begin = false;
    bool fail_end   = false;
    bool fail_draw  = false;   // ok() turns false after the first draw call

    bool begin_frame(float width, float height) override
    {
        record({Op::BeginFrame, Rect{0.0f, 0.0f, width, height}, {}, {}});
        error_.clear();
        if (fail_begin)
        {
            error_ = "device lost";
            return false;
        }
        ++frames_begun_;
        return true;
    }

    bool end_frame() override
    {
        record({Op::EndFrame, {}, {}, {}});
        if (fail_end)
        {
            error_ = "present failed";
            return false;
        }
        ++frames_ended_;
        return error_.empty();
    }

    bool        ok() const override { return error_.empty(); }
    std::string last_error() const override { return error_; }

    void save() override
    {
        record({Op::Save, {}, {}, {}});
        ++save_depth_;
    }

    void restore() override
    {
        record({Op::Restore, {}, {}, {}});
        --save_depth_;
    }

    void push_clip(const Rect& rect) override
    {
        record({Op::PushClip, rect, {}, {}});
        ++clip_depth_;
    }

    void pop_clip() override
    {
        record({Op::PopClip, {}, {}, {}});
        --clip_depth_;
    }

    void fill_rect(const Rect& rect, const Color& color) override { draw({Op::FillRect, rect, color, {}}); }

    void stroke_rect(const Rect& rect, const Stroke& stroke) override
    {
        draw({Op::StrokeRect, rect, stroke.color, {}, stroke.width});
    }

    void fill_rounded_rect(const Rect& rect, float, const Color& color) override
    {
        draw({Op::FillRoundedRect, rect, color, {}});
    }

    void stroke_rounded_rect(const Rect& rect, float, const Stroke& stroke) override
    {
        draw({Op::StrokeRoundedRect, rect, stroke.color, {}, stroke.width});
    }

    void fill_path(const Path& path, const Color& color) override
    {
        draw({Op::FillPath, {}, color, {}, 0.0f, path.elements().size()});
    }

    void stroke_path(const Path& path, const Stroke& stroke) override
    {
        draw({Op::StrokePath, {}, stroke.color, {}, stroke.width, path.elements().size()});
    }

    void fill_linear_gradient(const Rect& rect, const LinearGradient&) override
    {
        draw({Op::FillLinearGradient, rect, {}, {}});
    }

    void fill_radial_gradient(const Rect& rect, const RadialGradient&) override
    {
        draw({Op::FillRadialGradient, rect, {}, {}});
    }

    TextExtents measure_text(std::string_view text, const TextStyle& style) override
    {
        record({Op::MeasureText, {}, style.color, std::string(text)});
        return TextExtents{static_cast<float>(text.size()) * style.size * 0.5f, style.size};
    }

    void draw_text(float x, float y, std::string_view text, const TextStyle& style) override
    {
        draw({Op::DrawText, Rect{x, y, 0.0f, 0.0f}, style.color, std::string(text)});
    }

    // ─── Inspection ─────────────────────────────────────────────────────────

    const std::vector<Call>& calls() const { return calls_; }

    size_t count(Op op) const
    {
        return static_cast<size_t>(
            std::count_if(calls_.begin(), calls_.end(), [op](const Call& c) { return c.op == op; }));
    }

    // Calls that put pixels on the surface
    size_t draw_call_count() const { return draw_calls_; }

    bool has_text(std::string_view text) const
    {
        return std::any_of(calls_.begin(),
                           calls_.end(),
                           [&](const Call& c) { return c.op == Op::DrawText && c.text == text; });
    }

    // Largest path handed to a single fill_path or stroke_path
    size_t max_path_elements() const
    {
        size_t most = 0;
        for (const auto& c : calls_)
            most = std::max(most, c.elements);
        return most;
    }

    bool has_color(const Color& color) const
    {
        return std::any_of(calls_.begin(), calls_.end(), [&](const Call& c) { return c.color == color; });
    }

    int save_depth() const { return save_depth_; }
    int clip_depth() const { return clip_depth_; }
    int frames_begun() const { return frames_begun_; }
    int frames_ended() const { return frames_ended_; }

    void clear()
    {
        calls_.clear();
        draw_calls_ = 0;
    }

   private:
    void record(Call call) { calls_.push_back(std::move(call)); }

    void draw(Call call)
    {
        ++draw_calls_;
        if (fail_draw && error_.empty())
            error_ = "out of memory";
        record(std::move(call));
    }

    std::vector<Call> calls_;
    size_t            draw_calls_   = 0;
    int               save_depth_   = 0;
    int               clip_depth_   = 0;
    int               frames_begun_ = 0;
    int               frames_ended_ = 0;
    std::string       error_;
};

}   // namespace combopanel::test
