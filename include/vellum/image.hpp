#pragma once

#include "vellum/types.hpp"
#include "vellum/pixmap.hpp"
#include <memory>

namespace vellum {

/**
 * Image - An immutable snapshot of pixel data owned by the backend.
 *
 * Images are created from raw RGBA bytes or from a Pixmap and are always
 * CPU backed. The pixel data is copied on creation; no caller buffer is
 * aliased afterwards.
 */
class Image {
public:
    // Create an image by copying pixel data from a Pixmap
    static std::shared_ptr<Image> MakeFromPixmap(const Pixmap& src);

    // Create an RGBA8888 image from tightly packed bytes. Returns nullptr
    // unless byteCount == width * height * 4 and both dimensions are positive.
    static std::shared_ptr<Image> MakeFromRGBA(i32 width, i32 height,
                                               const u8* bytes, size_t byteCount);

    i32 width() const { return pixmap_.width(); }
    i32 height() const { return pixmap_.height(); }
    Vector2I size() const { return {pixmap_.width(), pixmap_.height()}; }

    // Tightly packed RGBA8888 rows.
    const u8* pixels() const { return pixmap_.data(); }
    i32 stride() const { return pixmap_.stride(); }

    ColorU getColor(i32 x, i32 y) const { return pixmap_.getColor(x, y); }

    // Stable identity used for renderer caches.
    u64 uniqueId() const { return id_; }

    bool valid() const { return pixmap_.valid(); }

private:
    static u64 nextImageId();

    explicit Image(Pixmap pixmap);

    u64 id_ = 0;
    Pixmap pixmap_;
};

} // namespace vellum
