#pragma once

/**
 * @file path2d.hpp
 * @brief Backend path builder: an ordered list of move/line/curve/close/rect commands.
 */

#include "vellum/types.hpp"
#include <vector>

namespace vellum {

/// @brief Path command tag.
enum class PathVerb : u8 {
    MoveTo,   ///< Start a new subpath (1 point).
    LineTo,   ///< Straight segment (1 point).
    QuadTo,   ///< Quadratic Bézier (control, end).
    CubicTo,  ///< Cubic Bézier (control 1, control 2, end).
    Close,    ///< Close the current subpath (0 points).
    Rect      ///< Closed axis-aligned rectangle subpath (min corner, max corner).
};

/// @brief A polyline produced by flattening one subpath.
struct Contour {
    std::vector<Vector2F> points;  ///< Vertices in device space.
    bool closed = false;           ///< True if the subpath was closed.
};

/// @brief Mutable path built incrementally, then handed to the canvas by value.
///
/// Mirrors the HTML canvas Path2D: curve commands without a preceding
/// moveTo() start at the curve's first point.
class Path2D {
public:
    void moveTo(Vector2F p);
    void lineTo(Vector2F p);
    void quadraticCurveTo(Vector2F ctrl, Vector2F to);
    void bezierCurveTo(Vector2F ctrl0, Vector2F ctrl1, Vector2F to);
    void closePath();

    /// @brief Append a closed rectangle as its own subpath.
    void rect(RectF r);

    const std::vector<PathVerb>& verbs() const { return verbs_; }
    const std::vector<Vector2F>& points() const { return points_; }
    bool empty() const { return verbs_.empty(); }

    /// @brief Number of points consumed by a verb.
    static int pointCount(PathVerb verb);

    /// @brief Bounding box of all stored points (control points included).
    RectF bounds() const;

    /// @brief Flatten the path into polylines in device space.
    /// @param transform Transform applied to every point before flattening.
    /// @param tolerance Maximum distance between curve and polyline, in device pixels.
    /// @param out Receives one contour per subpath.
    void flatten(const Transform2F& transform, f32 tolerance,
                 std::vector<Contour>& out) const;

private:
    void ensureStarted(Vector2F p);

    std::vector<PathVerb> verbs_;
    std::vector<Vector2F> points_;
    bool hasCurrent_ = false;
};

}
