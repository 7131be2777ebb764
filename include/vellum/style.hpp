#pragma once

/**
 * @file style.hpp
 * @brief Brush to backend fill style mapping.
 */

#include "vellum/brush.hpp"
#include "vellum/error.hpp"
#include "vellum/paint.hpp"
#include <functional>

namespace vellum {

/// @brief Convert a packed 0xRRGGBBAA color to the backend color type.
inline ColorU toColorU(u32 rgba) { return ColorU::FromU32(rgba); }

/**
 * @brief Resolve a brush into a backend fill style.
 *
 * Solid brushes map to their color and never call @p bbox. Gradient brushes
 * have no backend realization: the result is NotSupported and @p out is left
 * untouched.
 *
 * @param bbox Lazily supplies the bounding box of the shape being painted.
 */
Error resolveStyle(const Brush& brush, const std::function<Rect()>& bbox, FillStyle& out);

} // namespace vellum
