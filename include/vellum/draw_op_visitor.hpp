#pragma once

/**
 * @file draw_op_visitor.hpp
 * @brief Visitor interface for traversing recorded draw operations.
 */

#include "vellum/types.hpp"
#include "vellum/paint.hpp"
#include <string_view>

namespace vellum {

class Path2D;
struct PaintRef;

/// @brief Visitor interface for traversing recorded draw operations.
///
/// Implement this interface to consume a scene produced by Recording::accept().
class DrawOpVisitor {
public:
    virtual ~DrawOpVisitor() = default;

    /// @brief Replace the whole target with a color, ignoring clip and transform.
    virtual void visitClear(ColorU color) = 0;

    /// @brief Fill a rectangle given in user space.
    virtual void visitFillRect(RectF rect, const PaintRef& paint, const Transform2F& t) = 0;

    /// @brief Fill a path with the given rule.
    virtual void visitFillPath(const Path2D& path, FillRule rule,
                               const PaintRef& paint, const Transform2F& t) = 0;

    /// @brief Stroke a path with the given width (user-space units).
    virtual void visitStrokePath(const Path2D& path, f32 width,
                                 const PaintRef& paint, const Transform2F& t) = 0;

    /// @brief Intersect the clip with a path interior.
    virtual void visitClipPath(const Path2D& path, FillRule rule, const Transform2F& t) = 0;

    /// @brief Remove every clip path.
    virtual void visitResetClip() = 0;

    /// @brief Draw a text run at a baseline origin.
    virtual void visitText(Vector2F pos, std::string_view text, std::string_view font,
                           f32 fontSize, const PaintRef& paint, const Transform2F& t) = 0;

    /// @brief Paint an image pattern into a destination rectangle.
    virtual void visitDrawImage(RectF dst, const Pattern& pattern, const Transform2F& t) = 0;
};

} // namespace vellum
