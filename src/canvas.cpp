#include "vellum/canvas.hpp"
#include "vellum/device.hpp"

namespace vellum {

Canvas::Canvas(Device* device)
    : device_(device) {
}

void Canvas::clear(ColorU c) {
    device_->clear(c);
}

void Canvas::fillRect(RectF r) {
    device_->fillRect(r, current_.fillStyle, current_.transform);
}

void Canvas::fillPath(Path2D path, FillRule rule) {
    device_->fillPath(std::move(path), rule, current_.fillStyle, current_.transform);
}

void Canvas::strokePath(Path2D path) {
    device_->strokePath(std::move(path), current_.lineWidth, current_.strokeStyle,
                        current_.transform);
}

void Canvas::clipPath(Path2D path, FillRule rule) {
    current_.clips.push_back({path, rule, current_.transform});
    device_->clipPath(std::move(path), rule, current_.transform);
}

void Canvas::fillText(std::string_view text, Vector2F pos) {
    device_->drawText(pos, text, current_.fontFamily, current_.fontSize,
                      current_.fillStyle, current_.transform);
}

void Canvas::drawImage(const CanvasImageSource& src, Vector2F pos) {
    Vector2I size = src.size();
    drawImage(src, RectF{pos.x, pos.y, f32(size.x), f32(size.y)});
}

void Canvas::drawImage(const CanvasImageSource& src, RectF dst) {
    Vector2I size = src.size();
    drawSubimage(src, RectF{0, 0, f32(size.x), f32(size.y)}, dst);
}

void Canvas::drawSubimage(const CanvasImageSource& src, RectF srcRect, RectF dst) {
    Vector2I size = src.size();
    if (size.x <= 0 || size.y <= 0) return;
    if (srcRect.w == 0 || srcRect.h == 0) return;

    // Source pixel space -> destination rectangle in user space.
    Transform2F toDst = Transform2F::Translation(dst.origin()) *
                        Transform2F::Scale({dst.w / srcRect.w, dst.h / srcRect.h}) *
                        Transform2F::Translation({-srcRect.x, -srcRect.y});
    device_->drawImage(dst, src.toPattern(*this, toDst), current_.transform);
}

void Canvas::save() {
    stack_.push_back(current_);
}

bool Canvas::restore() {
    if (stack_.empty()) return false;
    size_t clipsBefore = current_.clips.size();
    current_ = std::move(stack_.back());
    stack_.pop_back();
    if (current_.clips.size() != clipsBefore) {
        applyClip();
    }
    return true;
}

void Canvas::applyClip() {
    device_->resetClip();
    for (const auto& clip : current_.clips) {
        device_->clipPath(clip.path, clip.rule, clip.transform);
    }
}

}
