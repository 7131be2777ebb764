#include "vellum/canvas_render_context.hpp"
#include "vellum/blur.hpp"
#include "vellum/convert.hpp"
#include "vellum/style.hpp"
#include <cstdio>
#include <limits>

namespace vellum {

CanvasRenderContext::CanvasRenderContext(Canvas& canvas,
                                         std::shared_ptr<CompositeFontSource> fonts)
    : canvas_(canvas),
      text_(std::move(fonts)) {
}

void CanvasRenderContext::recordError(const char* op, Error err) {
    std::fprintf(stderr, "vellum CanvasRenderContext: %s skipped (%s)\n",
                 op, err.toString().c_str());
    if (status_.ok()) {
        status_ = std::move(err);
    }
}

Error CanvasRenderContext::status() {
    Error err = std::move(status_);
    status_ = Error();
    return err;
}

Brush CanvasRenderContext::solidBrush(Color color) {
    return Brush::Solid(color.toRgba32());
}

Error CanvasRenderContext::gradient(const FixedGradient& gradient, Brush& out) {
    out = Brush::Gradient(gradient);
    return {};
}

// --- Clearing ---

void CanvasRenderContext::clear(Color color) {
    canvas_.clear(toColorU(color.toRgba32()));
}

void CanvasRenderContext::clear(const Rect& region, Color color) {
    FillStyle previous = canvas_.fillStyle();
    canvas_.setFillStyle(FillStyle::FromColor(toColorU(color.toRgba32())));
    canvas_.fillRect(toRectF(region));
    canvas_.setFillStyle(previous);
}

// --- Shapes ---

bool CanvasRenderContext::resolve(const char* op, const Shape& shape, const Brush& brush,
                                  FillStyle& style) {
    Error err = resolveStyle(brush, [&shape]() { return shape.boundingBox(); }, style);
    if (!err.ok()) {
        recordError(op, std::move(err));
        return false;
    }
    return true;
}

void CanvasRenderContext::strokeShape(const char* op, const Shape& shape, const Brush& brush,
                                      f64 width) {
    FillStyle style;
    if (!resolve(op, shape, brush, style)) return;
    Path2D path = pathFromShape(shape);
    canvas_.setStrokeStyle(style);
    canvas_.setLineWidth(f32(width));
    canvas_.strokePath(std::move(path));
}

void CanvasRenderContext::fillShape(const char* op, const Shape& shape, const Brush& brush,
                                    FillRule rule) {
    FillStyle style;
    if (!resolve(op, shape, brush, style)) return;
    Path2D path = pathFromShape(shape);
    canvas_.setFillStyle(style);
    canvas_.fillPath(std::move(path), rule);
}

void CanvasRenderContext::stroke(const Shape& shape, const Brush& brush, f64 width) {
    strokeShape("stroke", shape, brush, width);
}

void CanvasRenderContext::strokeStyled(const Shape& shape, const Brush& brush, f64 width,
                                       const StrokeStyle&) {
    strokeShape("strokeStyled", shape, brush, width);
}

void CanvasRenderContext::fill(const Shape& shape, const Brush& brush) {
    fillShape("fill", shape, brush, FillRule::Winding);
}

void CanvasRenderContext::fillEvenOdd(const Shape& shape, const Brush& brush) {
    fillShape("fillEvenOdd", shape, brush, FillRule::EvenOdd);
}

void CanvasRenderContext::clip(const Shape& shape) {
    canvas_.clipPath(pathFromShape(shape), FillRule::Winding);
}

// --- Text ---

void CanvasRenderContext::drawText(const TextLayout& layout, Point origin) {
    canvas_.fillText(layout.text(), toVector2F(origin));
}

// --- State ---

Error CanvasRenderContext::save() {
    canvas_.save();
    return {};
}

Error CanvasRenderContext::restore() {
    if (!canvas_.restore()) {
        return {ErrorCode::InvalidInput, "restore without matching save"};
    }
    return {};
}

void CanvasRenderContext::transform(const Affine& transform) {
    canvas_.setTransform(toBackendTransform(transform));
}

Affine CanvasRenderContext::currentTransform() const {
    return toGenericTransform(canvas_.transform());
}

// --- Images ---

Error CanvasRenderContext::makeImage(size_t width, size_t height, const u8* bytes, size_t len,
                                     ImageFormat format, CanvasImage& out) {
    return vellum::makeImage(width, height, bytes, len, format, out);
}

void CanvasRenderContext::drawImage(const CanvasImage& image, const Rect& dst,
                                    InterpolationMode interp) {
    applyInterpolation(canvas_, interp);
    canvas_.drawImage(image, toRectF(dst));
}

void CanvasRenderContext::drawImageArea(const CanvasImage& image, const Rect& src,
                                        const Rect& dst, InterpolationMode interp) {
    applyInterpolation(canvas_, interp);
    canvas_.drawSubimage(image, toRectF(src), toRectF(dst));
}

Error CanvasRenderContext::captureImageArea(const Rect&, CanvasImage&) {
    return {ErrorCode::NotSupported, "canvas read-back is not supported"};
}

void CanvasRenderContext::blurredRect(const Rect& rect, f64 blurRadius, const Brush& brush) {
    FillStyle style;
    if (!resolve("blurredRect", rect, brush, style)) return;

    constexpr f64 kMaxDim = f64(std::numeric_limits<i32>::max());
    Size size = sizeForBlurredRect(rect, blurRadius);
    if (!(size.width >= 0 && size.height >= 0) || size.width > kMaxDim ||
        size.height > kMaxDim || size.width * size.height * 4 > f64(std::numeric_limits<i32>::max())) {
        recordError("blurredRect", {ErrorCode::UnsupportedFormat, "blur buffer too large"});
        return;
    }

    const size_t width = size_t(size.width);
    const size_t height = size_t(size.height);
    std::vector<u8> mask;
    Rect expanded = computeBlurredRect(rect, blurRadius, width, mask);

    // Coverage becomes alpha over the brush color.
    const ColorU color = style.color;
    std::vector<u8> rgba(width * height * 4);
    for (size_t i = 0; i < width * height; ++i) {
        rgba[i * 4 + 0] = color.r;
        rgba[i * 4 + 1] = color.g;
        rgba[i * 4 + 2] = color.b;
        rgba[i * 4 + 3] = u8((u32(mask[i]) * color.a + 127) / 255);
    }

    CanvasImage image;
    Error err = vellum::makeImage(width, height, rgba.data(), rgba.size(),
                                  ImageFormat::RgbaSeparate, image);
    if (!err.ok()) {
        recordError("blurredRect", std::move(err));
        return;
    }
    canvas_.drawImage(image, toVector2F(expanded.origin()));
}

} // namespace vellum
