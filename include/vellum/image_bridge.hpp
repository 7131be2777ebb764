#pragma once

/**
 * @file image_bridge.hpp
 * @brief Validated construction of backend images from caller pixel buffers.
 */

#include "vellum/canvas.hpp"
#include "vellum/error.hpp"
#include "vellum/image.hpp"
#include "vellum/image_format.hpp"
#include <memory>

namespace vellum {

/**
 * CanvasImage - An image handed out by the render context.
 *
 * Holds an immutable backend Image whose byte count always equals
 * width * height * 4. Drawing it produces a Pattern that carries the
 * canvas's current smoothing state. A zero-area image has a size but no
 * backend Image, and drawing it paints nothing.
 */
class CanvasImage : public CanvasImageSource {
public:
    CanvasImage() = default;
    explicit CanvasImage(std::shared_ptr<const Image> image)
        : image_(std::move(image)), size_(image_ ? image_->size() : Vector2I{}) {}

    static CanvasImage Empty(i32 width, i32 height);

    const std::shared_ptr<const Image>& image() const { return image_; }
    bool valid() const { return image_ && image_->valid(); }

    // CanvasImageSource
    Vector2I size() const override;
    Pattern toPattern(Canvas& dest, const Transform2F& transform) const override;

private:
    std::shared_ptr<const Image> image_;
    Vector2I size_;
};

/**
 * @brief Build an image from straight-alpha RGBA bytes.
 *
 * @param width, height Pixel dimensions; each must fit the backend's i32.
 * @param bytes Pixel data, copied on success.
 * @param len Length of @p bytes; must equal width * height * 4. A zero
 *        width or height with len == 0 yields an empty image.
 * @param format Declared layout; only ImageFormat::RgbaSeparate is accepted.
 * @return UnsupportedFormat for other formats or oversize dimensions,
 *         InvalidInput for a length mismatch.
 */
Error makeImage(size_t width, size_t height, const u8* bytes, size_t len,
                ImageFormat format, CanvasImage& out);

/// @brief Apply an interpolation mode as the canvas smoothing state.
void applyInterpolation(Canvas& canvas, InterpolationMode mode);

} // namespace vellum
