#include "vellum/brush.hpp"
#include <algorithm>
#include <cmath>

namespace vellum {

namespace {

u8 toByte(f64 v) {
    return u8(std::lround(std::clamp(v, 0.0, 1.0) * 255.0));
}

} // namespace

Color Color::rgba(f64 r, f64 g, f64 b, f64 a) {
    return rgba8(toByte(r), toByte(g), toByte(b), toByte(a));
}

Color Color::withAlpha(f64 alpha) const {
    return rgba8(r(), g(), b(), toByte(a() / 255.0 * alpha));
}

} // namespace vellum
