#include "vellum/blur.hpp"
#include <algorithm>
#include <cmath>

namespace vellum {

namespace {

constexpr f64 kTwoOverSqrtPi = 1.12837916709551257390;
constexpr f64 kMinBlurRadius = 1e-3;

// Seventh-order approximation of erf, accurate to about 1e-4.
f64 erf7(f64 x) {
    x *= kTwoOverSqrtPi;
    f64 xx = x * x;
    x += (0.24295 + (0.03395 + 0.0104 * xx) * xx) * (x * xx);
    return x / std::sqrt(1.0 + x * x);
}

Rect expandedRect(const Rect& rect, f64 radius) {
    f64 padding = std::ceil(radius * 2.5);
    return rect.abs().inflate(padding, padding).expand();
}

} // namespace

Size sizeForBlurredRect(const Rect& rect, f64 radius) {
    return expandedRect(rect, std::max(radius, kMinBlurRadius)).size();
}

Rect computeBlurredRect(const Rect& rect, f64 radius, size_t stride, std::vector<u8>& mask) {
    radius = std::max(radius, kMinBlurRadius);
    const Rect r = rect.abs();
    const Rect exp = expandedRect(r, radius);
    const f64 inv = 1.0 / radius;
    const f64 xmax = r.width() * inv;
    const f64 ymax = r.height() * inv;
    const f64 xfrac = r.x0 - exp.x0;
    const f64 yfrac = r.y0 - exp.y0;
    const size_t width = size_t(exp.width());
    const size_t height = size_t(exp.height());

    mask.assign(stride * height, 0);

    // Separable: the horizontal profile is shared by every row.
    std::vector<f64> strip(width);
    for (size_t i = 0; i < width; ++i) {
        f64 x = (f64(i) - (xfrac - 0.5)) * inv;
        strip[i] = (255.0 * 0.25) * (erf7(x) + erf7(xmax - x));
    }

    for (size_t row = 0; row < height; ++row) {
        f64 y = (f64(row) - (yfrac - 0.5)) * inv;
        f64 z = erf7(y) + erf7(ymax - y);
        u8* out = mask.data() + row * stride;
        for (size_t i = 0; i < width && i < stride; ++i) {
            out[i] = u8(std::clamp(std::round(z * strip[i]), 0.0, 255.0));
        }
    }
    return exp;
}

} // namespace vellum
