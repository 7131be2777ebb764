#pragma once

/**
 * @file stroke_style.hpp
 * @brief Stroke attributes of the generic drawing interface.
 *
 * The canvas adapter accepts these attributes but strokes with the width
 * only; joins, caps and dashes are left to the backend defaults.
 */

#include "vellum/types.hpp"
#include <vector>

namespace vellum {

enum class LineJoin : u8 { Miter, Round, Bevel };
enum class LineCap : u8 { Butt, Round, Square };

struct StrokeStyle {
    LineJoin lineJoin = LineJoin::Miter;
    LineCap lineCap = LineCap::Butt;
    std::vector<f64> dashPattern;
    f64 dashOffset = 0;
    f64 miterLimit = 10.0;

    StrokeStyle& setLineJoin(LineJoin j) { lineJoin = j; return *this; }
    StrokeStyle& setLineCap(LineCap c) { lineCap = c; return *this; }
    StrokeStyle& setDash(std::vector<f64> pattern, f64 offset) {
        dashPattern = std::move(pattern);
        dashOffset = offset;
        return *this;
    }
    StrokeStyle& setMiterLimit(f64 limit) { miterLimit = limit; return *this; }
};

} // namespace vellum
