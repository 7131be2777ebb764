#pragma once

/**
 * @file canvas_render_context.hpp
 * @brief RenderContext implemented on the backend Canvas.
 */

#include "vellum/canvas.hpp"
#include "vellum/composite_font_source.hpp"
#include "vellum/render_context.hpp"
#include <memory>

namespace vellum {

/**
 * CanvasRenderContext - Drives a backend Canvas from the generic interface.
 *
 * Each drawing call converts its arguments and then issues one canvas
 * drawing call. Styles, line width, transform and smoothing are set on the
 * canvas as state. Arguments are fully converted before any canvas state
 * changes, so a failed call leaves the canvas untouched.
 *
 * The context borrows the canvas for its whole lifetime; at most one
 * context may drive a canvas at a time.
 */
class CanvasRenderContext : public RenderContext {
public:
    CanvasRenderContext(Canvas& canvas, std::shared_ptr<CompositeFontSource> fonts);

    CanvasRenderContext(const CanvasRenderContext&) = delete;
    CanvasRenderContext& operator=(const CanvasRenderContext&) = delete;

    Error status() override;

    Brush solidBrush(Color color) override;
    Error gradient(const FixedGradient& gradient, Brush& out) override;

    void clear(Color color) override;
    void clear(const Rect& region, Color color) override;

    void stroke(const Shape& shape, const Brush& brush, f64 width) override;
    void strokeStyled(const Shape& shape, const Brush& brush, f64 width,
                      const StrokeStyle& style) override;
    void fill(const Shape& shape, const Brush& brush) override;
    void fillEvenOdd(const Shape& shape, const Brush& brush) override;
    void clip(const Shape& shape) override;

    Text& text() override { return text_; }
    void drawText(const TextLayout& layout, Point origin) override;

    Error save() override;
    Error restore() override;
    Error finish() override { return {}; }

    void transform(const Affine& transform) override;
    Affine currentTransform() const override;

    Error makeImage(size_t width, size_t height, const u8* bytes, size_t len,
                    ImageFormat format, CanvasImage& out) override;
    void drawImage(const CanvasImage& image, const Rect& dst,
                   InterpolationMode interp) override;
    void drawImageArea(const CanvasImage& image, const Rect& src, const Rect& dst,
                       InterpolationMode interp) override;
    Error captureImageArea(const Rect& src, CanvasImage& out) override;

    void blurredRect(const Rect& rect, f64 blurRadius, const Brush& brush) override;

private:
    // Keep the first failure of a void drawing call for status().
    void recordError(const char* op, Error err);

    bool resolve(const char* op, const Shape& shape, const Brush& brush, FillStyle& style);
    void fillShape(const char* op, const Shape& shape, const Brush& brush, FillRule rule);
    void strokeShape(const char* op, const Shape& shape, const Brush& brush, f64 width);

    Canvas& canvas_;
    Text text_;
    Error status_;
};

} // namespace vellum
