#pragma once

/**
 * @file blur.hpp
 * @brief Alpha mask of a Gaussian-blurred rectangle.
 */

#include "vellum/shape.hpp"
#include <cstddef>
#include <vector>

namespace vellum {

/// @brief Pixel size of the mask produced for @p rect blurred by @p radius.
///
/// The rectangle is inflated by ceil(2.5 * radius) on each side and rounded
/// outward to whole pixels.
Size sizeForBlurredRect(const Rect& rect, f64 radius);

/**
 * @brief Compute the blurred coverage of @p rect as an 8-bit alpha mask.
 *
 * @param stride Bytes per mask row; at least the width from sizeForBlurredRect().
 * @param mask Resized to stride * height and filled row by row.
 * @return The expanded rectangle the mask covers, in user space.
 */
Rect computeBlurredRect(const Rect& rect, f64 radius, size_t stride, std::vector<u8>& mask);

} // namespace vellum
