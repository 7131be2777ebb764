#include "vellum/image.hpp"
#include <cstring>
#include <atomic>

namespace vellum {

namespace {
std::atomic<u64> gNextImageId{1};
}

u64 Image::nextImageId() {
    return gNextImageId.fetch_add(1, std::memory_order_relaxed);
}

Image::Image(Pixmap pixmap)
    : id_(nextImageId()),
      pixmap_(std::move(pixmap)) {
}

std::shared_ptr<Image> Image::MakeFromPixmap(const Pixmap& src) {
    if (!src.valid()) return nullptr;

    Pixmap copy = src.copy();
    if (!copy.valid()) return nullptr;
    return std::shared_ptr<Image>(new Image(std::move(copy)));
}

std::shared_ptr<Image> Image::MakeFromRGBA(i32 width, i32 height,
                                           const u8* bytes, size_t byteCount) {
    if (width <= 0 || height <= 0 || !bytes) return nullptr;
    if (byteCount != size_t(width) * size_t(height) * 4) return nullptr;

    Pixmap pixmap = Pixmap::Alloc(width, height);
    if (!pixmap.valid()) return nullptr;

    std::memcpy(pixmap.data(), bytes, byteCount);
    return std::shared_ptr<Image>(new Image(std::move(pixmap)));
}

} // namespace vellum
