#pragma once

/**
 * @file pixmap.hpp
 * @brief RGBA8888 raster buffer used as the software render target.
 */

#include "vellum/types.hpp"
#include <cstddef>
#include <vector>

namespace vellum {

/// @brief Owned raster of straight-alpha RGBA8888 pixels.
///
/// Rows are tightly packed, so stride() is always width() * 4 and the first
/// byte of each pixel is red. Moving a Pixmap transfers its storage and
/// leaves the source empty; copies are made explicitly with copy().
class Pixmap {
public:
    static constexpr i32 kBytesPerPixel = 4;

    /// @brief Allocate a zero-filled (transparent black) raster.
    /// @return An empty pixmap if either dimension is not positive or the
    ///         buffer cannot be allocated.
    static Pixmap Alloc(i32 width, i32 height);

    Pixmap() = default;
    Pixmap(Pixmap&& other) noexcept;
    Pixmap& operator=(Pixmap&& other) noexcept;

    Pixmap(const Pixmap&) = delete;
    Pixmap& operator=(const Pixmap&) = delete;

    /// @brief Deep copy of the pixels.
    Pixmap copy() const;

    i32 width() const { return width_; }
    i32 height() const { return height_; }
    Vector2I size() const { return {width_, height_}; }
    i32 stride() const { return width_ * kBytesPerPixel; }
    size_t byteSize() const { return bytes_.size(); }

    bool valid() const { return !bytes_.empty(); }
    bool contains(i32 x, i32 y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    u8* data() { return bytes_.data(); }
    const u8* data() const { return bytes_.data(); }
    u8* row(i32 y) { return bytes_.data() + size_t(y) * size_t(stride()); }
    const u8* row(i32 y) const { return bytes_.data() + size_t(y) * size_t(stride()); }

    /// Unchecked; (x, y) must satisfy contains().
    ColorU getColor(i32 x, i32 y) const;
    void setColor(i32 x, i32 y, ColorU c);

    /// @brief Overwrite every pixel with @p c.
    void clear(ColorU c);

    /// @brief Replace the raster with a zero-filled one of the new size.
    /// Existing pixels are discarded.
    void resize(i32 width, i32 height);

private:
    i32 width_ = 0;
    i32 height_ = 0;
    std::vector<u8> bytes_;
};

}
