#pragma once

/**
 * @file convert.hpp
 * @brief Conversions from generic geometry to backend geometry.
 *
 * The generic interface works in f64 with column-convention transforms;
 * the backend canvas works in f32 with row-major transforms. Every
 * conversion here is pure.
 */

#include "vellum/types.hpp"
#include "vellum/shape.hpp"
#include "vellum/path2d.hpp"

namespace vellum {

/// @brief Curve flattening tolerance used when a shape has no direct path form.
constexpr f64 kFlattenTolerance = 0.1;

inline Vector2F toVector2F(Point p) { return {f32(p.x), f32(p.y)}; }
inline Point toPoint(Vector2F v) { return {f64(v.x), f64(v.y)}; }

/// @brief Convert a generic rectangle to origin and size form.
inline RectF toRectF(const Rect& r) {
    return {f32(r.x0), f32(r.y0), f32(r.width()), f32(r.height())};
}

/// @brief Generic affine [a b c d e f] to backend row-major [a c; b d] + (e, f).
Transform2F toBackendTransform(const Affine& affine);

/// @brief Backend row-major transform back to the generic coefficient layout.
Affine toGenericTransform(const Transform2F& transform);

/**
 * @brief Build a backend path from a shape.
 *
 * Lines and rectangles use their direct forms, stored element sequences are
 * translated element by element, and any other shape is expanded at
 * kFlattenTolerance first. ClosePath becomes Path2D::closePath().
 */
Path2D pathFromShape(const Shape& shape);

/// @brief Append generic path elements to a backend path, one command each.
void appendPathElements(const std::vector<PathEl>& elements, Path2D& path);

} // namespace vellum
