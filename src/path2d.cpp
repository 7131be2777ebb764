#include "vellum/path2d.hpp"
#include <algorithm>
#include <cmath>

namespace vellum {

namespace {

Vector2F lerp(Vector2F a, Vector2F b, f32 t) {
    return {a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

f32 length(Vector2F v) {
    return std::sqrt(v.x * v.x + v.y * v.y);
}

// Second difference of three control points; bounds the curvature.
f32 secondDiff(Vector2F a, Vector2F b, Vector2F c) {
    return length({a.x - 2 * b.x + c.x, a.y - 2 * b.y + c.y});
}

// Wang's formula: segments needed so a degree-n Bézier stays within tolerance.
int segmentsFor(f32 maxSecondDiff, int degree, f32 tolerance) {
    f32 n = std::sqrt(f32(degree * (degree - 1)) / 8.0f * maxSecondDiff / tolerance);
    if (!(n >= 1.0f)) return 1;
    if (!(n < 256.0f)) return 256;
    return int(std::ceil(n));
}

} // namespace

void Path2D::ensureStarted(Vector2F p) {
    if (!hasCurrent_) moveTo(p);
}

void Path2D::moveTo(Vector2F p) {
    verbs_.push_back(PathVerb::MoveTo);
    points_.push_back(p);
    hasCurrent_ = true;
}

void Path2D::lineTo(Vector2F p) {
    ensureStarted(p);
    verbs_.push_back(PathVerb::LineTo);
    points_.push_back(p);
}

void Path2D::quadraticCurveTo(Vector2F ctrl, Vector2F to) {
    ensureStarted(ctrl);
    verbs_.push_back(PathVerb::QuadTo);
    points_.push_back(ctrl);
    points_.push_back(to);
}

void Path2D::bezierCurveTo(Vector2F ctrl0, Vector2F ctrl1, Vector2F to) {
    ensureStarted(ctrl0);
    verbs_.push_back(PathVerb::CubicTo);
    points_.push_back(ctrl0);
    points_.push_back(ctrl1);
    points_.push_back(to);
}

void Path2D::closePath() {
    if (!hasCurrent_) return;
    verbs_.push_back(PathVerb::Close);
}

void Path2D::rect(RectF r) {
    verbs_.push_back(PathVerb::Rect);
    points_.push_back({r.x, r.y});
    points_.push_back({r.x + r.w, r.y + r.h});
    // A subpath following a rect starts from the rect's origin.
    hasCurrent_ = true;
}

int Path2D::pointCount(PathVerb verb) {
    switch (verb) {
        case PathVerb::MoveTo:  return 1;
        case PathVerb::LineTo:  return 1;
        case PathVerb::QuadTo:  return 2;
        case PathVerb::CubicTo: return 3;
        case PathVerb::Close:   return 0;
        case PathVerb::Rect:    return 2;
    }
    return 0;
}

RectF Path2D::bounds() const {
    if (points_.empty()) return {};
    f32 x0 = points_[0].x, y0 = points_[0].y, x1 = x0, y1 = y0;
    for (const auto& p : points_) {
        x0 = std::min(x0, p.x);
        y0 = std::min(y0, p.y);
        x1 = std::max(x1, p.x);
        y1 = std::max(y1, p.y);
    }
    return {x0, y0, x1 - x0, y1 - y0};
}

void Path2D::flatten(const Transform2F& transform, f32 tolerance,
                     std::vector<Contour>& out) const {
    Contour current;
    Vector2F last{};
    Vector2F start{};
    size_t pi = 0;

    auto flush = [&]() {
        if (current.points.size() > 1 || current.closed) {
            out.push_back(std::move(current));
        }
        current = Contour();
    };

    for (PathVerb verb : verbs_) {
        switch (verb) {
        case PathVerb::MoveTo:
            flush();
            last = start = transform.apply(points_[pi++]);
            current.points.push_back(last);
            break;
        case PathVerb::LineTo:
            last = transform.apply(points_[pi++]);
            current.points.push_back(last);
            break;
        case PathVerb::QuadTo: {
            Vector2F p0 = last;
            Vector2F p1 = transform.apply(points_[pi++]);
            Vector2F p2 = transform.apply(points_[pi++]);
            int n = segmentsFor(secondDiff(p0, p1, p2), 2, tolerance);
            for (int i = 1; i <= n; ++i) {
                f32 t = f32(i) / f32(n);
                current.points.push_back(lerp(lerp(p0, p1, t), lerp(p1, p2, t), t));
            }
            last = p2;
            break;
        }
        case PathVerb::CubicTo: {
            Vector2F p0 = last;
            Vector2F p1 = transform.apply(points_[pi++]);
            Vector2F p2 = transform.apply(points_[pi++]);
            Vector2F p3 = transform.apply(points_[pi++]);
            f32 dd = std::max(secondDiff(p0, p1, p2), secondDiff(p1, p2, p3));
            int n = segmentsFor(dd, 3, tolerance);
            for (int i = 1; i <= n; ++i) {
                f32 t = f32(i) / f32(n);
                Vector2F a = lerp(p0, p1, t), b = lerp(p1, p2, t), c = lerp(p2, p3, t);
                Vector2F d = lerp(a, b, t), e = lerp(b, c, t);
                current.points.push_back(lerp(d, e, t));
            }
            last = p3;
            break;
        }
        case PathVerb::Close:
            current.closed = true;
            flush();
            // Drawing after a close continues from the subpath's start.
            last = start;
            current.points.push_back(start);
            break;
        case PathVerb::Rect: {
            flush();
            Vector2F mn = points_[pi++];
            Vector2F mx = points_[pi++];
            current.points.push_back(transform.apply(mn));
            current.points.push_back(transform.apply({mx.x, mn.y}));
            current.points.push_back(transform.apply(mx));
            current.points.push_back(transform.apply({mn.x, mx.y}));
            current.closed = true;
            last = start = transform.apply(mn);
            flush();
            current.points.push_back(start);
            break;
        }
        }
    }
    flush();
}

}
