#pragma once

/**
 * @file paint.hpp
 * @brief Fill styles, image patterns and fill rules of the backend canvas.
 */

#include "vellum/types.hpp"
#include <memory>

namespace vellum {

class Image;

/// @brief Rule deciding which regions of a self-intersecting path are inside.
enum class FillRule : u8 {
    Winding,  ///< Non-zero winding number.
    EvenOdd   ///< Odd crossing count.
};

/// @brief Resampling quality used when smoothing is enabled.
enum class ImageSmoothingQuality : u8 {
    Low,     ///< Bilinear.
    Medium,
    High
};

/// @brief An image painted through a transform.
struct Pattern {
    std::shared_ptr<const Image> image;   ///< Source pixels.
    Transform2F transform;                ///< Maps image pixel space to user space.
    bool smoothingEnabled = true;         ///< False samples nearest-neighbor.
    ImageSmoothingQuality smoothingQuality = ImageSmoothingQuality::Low;

    /// @brief Post-multiply an additional transform onto the pattern.
    void applyTransform(const Transform2F& t) { transform = t * transform; }
};

/// @brief Fill or stroke style: a solid color or an image pattern.
struct FillStyle {
    enum class Kind : u8 { Color, Pattern };

    Kind kind = Kind::Color;
    ColorU color;                      ///< Used when kind == Color.
    std::shared_ptr<Pattern> pattern;  ///< Used when kind == Pattern.

    static FillStyle FromColor(ColorU c) {
        FillStyle s;
        s.kind = Kind::Color;
        s.color = c;
        return s;
    }

    static FillStyle FromPattern(Pattern p) {
        FillStyle s;
        s.kind = Kind::Pattern;
        s.pattern = std::make_shared<Pattern>(std::move(p));
        return s;
    }

    bool isColor() const { return kind == Kind::Color; }
};

}
