#include "vellum/style.hpp"

namespace vellum {

Error resolveStyle(const Brush& brush, const std::function<Rect()>&, FillStyle& out) {
    switch (brush.kind()) {
        case Brush::Kind::Solid:
            out = FillStyle::FromColor(toColorU(brush.rgba()));
            return {};
        case Brush::Kind::Gradient:
            return {ErrorCode::NotSupported, "gradient brushes are not rendered"};
    }
    return {ErrorCode::InvalidInput};
}

} // namespace vellum
