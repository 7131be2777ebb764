#include "vellum/pixmap.hpp"
#include <cstdio>
#include <new>
#include <utility>

namespace vellum {

Pixmap Pixmap::Alloc(i32 width, i32 height) {
    Pixmap pm;
    if (width <= 0 || height <= 0) return pm;
    try {
        pm.bytes_.assign(size_t(width) * size_t(height) * kBytesPerPixel, 0);
    } catch (const std::bad_alloc&) {
        std::fprintf(stderr, "vellum Pixmap: out of memory for %dx%d\n", width, height);
        return Pixmap();
    }
    pm.width_ = width;
    pm.height_ = height;
    return pm;
}

Pixmap::Pixmap(Pixmap&& other) noexcept
    : width_(std::exchange(other.width_, 0)),
      height_(std::exchange(other.height_, 0)),
      bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

Pixmap& Pixmap::operator=(Pixmap&& other) noexcept {
    if (this != &other) {
        width_ = std::exchange(other.width_, 0);
        height_ = std::exchange(other.height_, 0);
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

Pixmap Pixmap::copy() const {
    Pixmap out = Alloc(width_, height_);
    if (out.valid()) out.bytes_ = bytes_;
    return out;
}

ColorU Pixmap::getColor(i32 x, i32 y) const {
    const u8* p = row(y) + size_t(x) * kBytesPerPixel;
    return {p[0], p[1], p[2], p[3]};
}

void Pixmap::setColor(i32 x, i32 y, ColorU c) {
    u8* p = row(y) + size_t(x) * kBytesPerPixel;
    p[0] = c.r;
    p[1] = c.g;
    p[2] = c.b;
    p[3] = c.a;
}

void Pixmap::clear(ColorU c) {
    for (size_t i = 0; i + 3 < bytes_.size(); i += kBytesPerPixel) {
        bytes_[i] = c.r;
        bytes_[i + 1] = c.g;
        bytes_[i + 2] = c.b;
        bytes_[i + 3] = c.a;
    }
}

void Pixmap::resize(i32 width, i32 height) {
    *this = Alloc(width, height);
}

}
