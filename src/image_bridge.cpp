#include "vellum/image_bridge.hpp"
#include <limits>

namespace vellum {

CanvasImage CanvasImage::Empty(i32 width, i32 height) {
    CanvasImage image;
    image.size_ = {width, height};
    return image;
}

Vector2I CanvasImage::size() const {
    return size_;
}

Pattern CanvasImage::toPattern(Canvas& dest, const Transform2F& transform) const {
    Pattern pattern;
    pattern.image = image_;
    pattern.transform = transform;
    pattern.smoothingEnabled = dest.imageSmoothingEnabled();
    pattern.smoothingQuality = dest.imageSmoothingQuality();
    return pattern;
}

Error makeImage(size_t width, size_t height, const u8* bytes, size_t len,
                ImageFormat format, CanvasImage& out) {
    if (format != ImageFormat::RgbaSeparate) {
        return {ErrorCode::UnsupportedFormat, "only straight-alpha RGBA is supported"};
    }

    constexpr size_t kMaxDim = size_t(std::numeric_limits<i32>::max());
    if (width > kMaxDim || height > kMaxDim) {
        return {ErrorCode::UnsupportedFormat, "image dimensions too large"};
    }

    if (width == 0 || height == 0) {
        if (len != 0) {
            return {ErrorCode::InvalidInput, "buffer length does not match width * height * 4"};
        }
        out = CanvasImage::Empty(i32(width), i32(height));
        return {};
    }

    constexpr size_t kMaxSize = std::numeric_limits<size_t>::max();
    if (height > kMaxSize / 4 / width || len != width * height * 4) {
        return {ErrorCode::InvalidInput, "buffer length does not match width * height * 4"};
    }

    auto image = Image::MakeFromRGBA(i32(width), i32(height), bytes, len);
    if (!image) {
        return {ErrorCode::BackendError, "image allocation failed"};
    }
    out = CanvasImage(std::move(image));
    return {};
}

void applyInterpolation(Canvas& canvas, InterpolationMode mode) {
    switch (mode) {
        case InterpolationMode::NearestNeighbor:
            canvas.setImageSmoothingEnabled(false);
            break;
        case InterpolationMode::Bilinear:
            canvas.setImageSmoothingEnabled(true);
            canvas.setImageSmoothingQuality(ImageSmoothingQuality::Low);
            break;
    }
}

} // namespace vellum
