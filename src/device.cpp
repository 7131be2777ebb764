#include "vellum/device.hpp"

namespace vellum {

void Device::beginFrame() {
    recorder_.reset();
    recording_.reset();
}

void Device::endFrame() {
    recording_ = recorder_.finish();
}

void Device::clear(ColorU c) {
    recorder_.clear(c);
}

void Device::fillRect(RectF r, const FillStyle& style, const Transform2F& t) {
    recorder_.fillRect(r, style, t);
}

void Device::fillPath(Path2D path, FillRule rule, const FillStyle& style, const Transform2F& t) {
    recorder_.fillPath(std::move(path), rule, style, t);
}

void Device::strokePath(Path2D path, f32 width, const FillStyle& style, const Transform2F& t) {
    recorder_.strokePath(std::move(path), width, style, t);
}

void Device::drawText(Vector2F p, std::string_view text, std::string_view font, f32 fontSize,
                      const FillStyle& style, const Transform2F& t) {
    recorder_.drawText(p, text, font, fontSize, style, t);
}

void Device::drawImage(RectF dst, Pattern pattern, const Transform2F& t) {
    recorder_.drawImage(dst, std::move(pattern), t);
}

void Device::clipPath(Path2D path, FillRule rule, const Transform2F& t) {
    recorder_.clipPath(std::move(path), rule, t);
}

void Device::resetClip() {
    recorder_.resetClip();
}

std::unique_ptr<Recording> Device::finishRecording() {
    return std::move(recording_);
}

}
