#include "vellum/convert.hpp"

namespace vellum {

Transform2F toBackendTransform(const Affine& affine) {
    const f64* c = affine.coeffs();
    return Transform2F::RowMajor(f32(c[0]), f32(c[2]), f32(c[1]), f32(c[3]),
                                 f32(c[4]), f32(c[5]));
}

Affine toGenericTransform(const Transform2F& t) {
    return {f64(t.m11), f64(t.m21), f64(t.m12), f64(t.m22),
            f64(t.vector.x), f64(t.vector.y)};
}

void appendPathElements(const std::vector<PathEl>& elements, Path2D& path) {
    for (const auto& el : elements) {
        switch (el.type) {
            case PathElType::MoveTo:
                path.moveTo(toVector2F(el.p[0]));
                break;
            case PathElType::LineTo:
                path.lineTo(toVector2F(el.p[0]));
                break;
            case PathElType::QuadTo:
                path.quadraticCurveTo(toVector2F(el.p[0]), toVector2F(el.p[1]));
                break;
            case PathElType::CurveTo:
                path.bezierCurveTo(toVector2F(el.p[0]), toVector2F(el.p[1]),
                                   toVector2F(el.p[2]));
                break;
            case PathElType::ClosePath:
                path.closePath();
                break;
        }
    }
}

Path2D pathFromShape(const Shape& shape) {
    Path2D path;

    Line line;
    if (shape.asLine(&line)) {
        path.moveTo(toVector2F(line.p0));
        path.lineTo(toVector2F(line.p1));
        return path;
    }

    Rect rect;
    if (shape.asRect(&rect)) {
        path.rect(toRectF(rect));
        return path;
    }

    if (const auto* elements = shape.asPathSlice()) {
        appendPathElements(*elements, path);
        return path;
    }

    std::vector<PathEl> elements;
    shape.pathElements(kFlattenTolerance, elements);
    appendPathElements(elements, path);
    return path;
}

} // namespace vellum
