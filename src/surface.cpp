#include "vellum/surface.hpp"
#include "cpu_renderer.hpp"
#include <cstdio>

namespace vellum {

Surface::Surface(i32 w, i32 h, std::unique_ptr<Renderer> renderer,
                 std::unique_ptr<Pixmap> pixmap)
    : size_{w, h},
      device_(),
      renderer_(std::move(renderer)),
      pixmap_(std::move(pixmap)) {
    canvas_ = std::make_unique<Canvas>(&device_);
}

Surface::~Surface() = default;

std::unique_ptr<Surface> Surface::MakeRaster(i32 w, i32 h) {
    auto pixmap = std::make_unique<Pixmap>(Pixmap::Alloc(w, h));
    if (!pixmap->valid()) {
        std::fprintf(stderr, "vellum Surface: cannot allocate %dx%d raster\n", w, h);
        return nullptr;
    }
    auto renderer = std::make_unique<CpuRenderer>(pixmap.get());
    return std::unique_ptr<Surface>(new Surface(w, h, std::move(renderer), std::move(pixmap)));
}

std::unique_ptr<Surface> Surface::MakeRecording(i32 w, i32 h) {
    return std::unique_ptr<Surface>(new Surface(w, h, nullptr, nullptr));
}

void Surface::resize(i32 w, i32 h) {
    size_ = {w, h};
    if (pixmap_) {
        pixmap_->resize(w, h);
    }
    if (renderer_) {
        renderer_->resize(w, h);
    }
}

void Surface::beginFrame(ColorU clearColor) {
    device_.beginFrame();
    if (renderer_) {
        renderer_->beginFrame(clearColor);
    }
}

void Surface::endFrame() {
    device_.endFrame();
    if (renderer_) {
        renderer_->endFrame();
    }
}

void Surface::flush() {
    auto recording = device_.finishRecording();
    if (!recording || !renderer_) return;
    renderer_->execute(*recording);
}

std::shared_ptr<Image> Surface::makeSnapshot() const {
    if (renderer_) {
        return renderer_->makeSnapshot();
    }
    return nullptr;
}

Pixmap* Surface::peekPixels() {
    return pixmap_.get();
}

const Pixmap* Surface::peekPixels() const {
    return pixmap_.get();
}

std::unique_ptr<Recording> Surface::takeRecording() {
    return device_.finishRecording();
}

} // namespace vellum
