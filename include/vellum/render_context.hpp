#pragma once

/**
 * @file render_context.hpp
 * @brief The generic immediate-mode drawing interface.
 */

#include "vellum/brush.hpp"
#include "vellum/error.hpp"
#include "vellum/image_bridge.hpp"
#include "vellum/image_format.hpp"
#include "vellum/shape.hpp"
#include "vellum/stroke_style.hpp"
#include "vellum/text.hpp"
#include <functional>

namespace vellum {

/**
 * RenderContext - Backend-agnostic 2D drawing.
 *
 * Application code draws shapes with brushes, text layouts and images
 * through this interface. Drawing calls return nothing; a failure they
 * cannot report directly is kept and returned by the next status() call.
 */
class RenderContext {
public:
    virtual ~RenderContext() = default;

    /// @brief Return and clear the first error recorded by a drawing call.
    virtual Error status() = 0;

    virtual Brush solidBrush(Color color) = 0;
    virtual Error gradient(const FixedGradient& gradient, Brush& out) = 0;

    /// @brief Clear the whole target to @p color.
    virtual void clear(Color color) = 0;
    /// @brief Fill exactly @p region with @p color, leaving the clip alone.
    virtual void clear(const Rect& region, Color color) = 0;

    virtual void stroke(const Shape& shape, const Brush& brush, f64 width) = 0;
    virtual void strokeStyled(const Shape& shape, const Brush& brush, f64 width,
                              const StrokeStyle& style) = 0;
    virtual void fill(const Shape& shape, const Brush& brush) = 0;
    virtual void fillEvenOdd(const Shape& shape, const Brush& brush) = 0;
    virtual void clip(const Shape& shape) = 0;

    virtual Text& text() = 0;
    virtual void drawText(const TextLayout& layout, Point origin) = 0;

    virtual Error save() = 0;
    virtual Error restore() = 0;
    virtual Error finish() = 0;

    /// @brief Replace the current transform.
    virtual void transform(const Affine& transform) = 0;
    virtual Affine currentTransform() const = 0;

    virtual Error makeImage(size_t width, size_t height, const u8* bytes, size_t len,
                            ImageFormat format, CanvasImage& out) = 0;
    virtual void drawImage(const CanvasImage& image, const Rect& dst,
                           InterpolationMode interp) = 0;
    virtual void drawImageArea(const CanvasImage& image, const Rect& src, const Rect& dst,
                               InterpolationMode interp) = 0;
    virtual Error captureImageArea(const Rect& src, CanvasImage& out) = 0;

    virtual void blurredRect(const Rect& rect, f64 blurRadius, const Brush& brush) = 0;

    /// @brief Run @p fn between save() and restore().
    Error withSave(const std::function<Error(RenderContext&)>& fn) {
        Error err = save();
        if (!err.ok()) return err;
        Error result = fn(*this);
        Error restored = restore();
        return result.ok() ? restored : result;
    }
};

} // namespace vellum
