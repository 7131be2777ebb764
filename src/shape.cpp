#include "vellum/shape.hpp"
#include <algorithm>
#include <cmath>

namespace vellum {

namespace {

constexpr f64 kPi = 3.14159265358979323846;

// Control point distance of a cubic approximating a quarter circle.
constexpr f64 kQuarterArcK = 0.5522847498307936;

// Radial error of a cubic arc spanning theta is about kArcErrorScale * r * theta^6.
constexpr f64 kArcErrorScale = 1.8e-5;
constexpr int kMaxArcs = 1024;

} // namespace

// --- Affine ---

Affine Affine::Rotate(f64 radians) {
    f64 s = std::sin(radians), co = std::cos(radians);
    return {co, s, -s, co, 0, 0};
}

Affine Affine::operator*(const Affine& o) const {
    return {c[0] * o.c[0] + c[2] * o.c[1],
            c[1] * o.c[0] + c[3] * o.c[1],
            c[0] * o.c[2] + c[2] * o.c[3],
            c[1] * o.c[2] + c[3] * o.c[3],
            c[0] * o.c[4] + c[2] * o.c[5] + c[4],
            c[1] * o.c[4] + c[3] * o.c[5] + c[5]};
}

bool Affine::operator==(const Affine& o) const {
    return std::equal(c, c + 6, o.c);
}

// --- PathEl ---

bool PathEl::operator==(const PathEl& o) const {
    if (type != o.type) return false;
    int n = 0;
    switch (type) {
        case PathElType::MoveTo:
        case PathElType::LineTo:   n = 1; break;
        case PathElType::QuadTo:   n = 2; break;
        case PathElType::CurveTo:  n = 3; break;
        case PathElType::ClosePath: n = 0; break;
    }
    for (int i = 0; i < n; ++i) {
        if (p[i] != o.p[i]) return false;
    }
    return true;
}

// --- Shape defaults ---

bool Shape::asLine(Line*) const { return false; }
bool Shape::asRect(Rect*) const { return false; }

// --- Rect ---

Rect Rect::FromPoints(Point a, Point b) {
    return Rect(a.x, a.y, b.x, b.y).abs();
}

Rect Rect::abs() const {
    return {std::min(x0, x1), std::min(y0, y1), std::max(x0, x1), std::max(y0, y1)};
}

Rect Rect::expand() const {
    Rect r = abs();
    return {std::floor(r.x0), std::floor(r.y0), std::ceil(r.x1), std::ceil(r.y1)};
}

void Rect::pathElements(f64, std::vector<PathEl>& out) const {
    out.push_back(PathEl::MoveTo({x0, y0}));
    out.push_back(PathEl::LineTo({x1, y0}));
    out.push_back(PathEl::LineTo({x1, y1}));
    out.push_back(PathEl::LineTo({x0, y1}));
    out.push_back(PathEl::ClosePath());
}

// --- Line ---

void Line::pathElements(f64, std::vector<PathEl>& out) const {
    out.push_back(PathEl::MoveTo(p0));
    out.push_back(PathEl::LineTo(p1));
}

// --- BezPath ---

void BezPath::pathElements(f64, std::vector<PathEl>& out) const {
    out.insert(out.end(), elements_.begin(), elements_.end());
}

Rect BezPath::boundingBox() const {
    bool any = false;
    Rect r;
    auto add = [&](Point p) {
        if (!any) {
            r = {p.x, p.y, p.x, p.y};
            any = true;
            return;
        }
        r.x0 = std::min(r.x0, p.x); r.y0 = std::min(r.y0, p.y);
        r.x1 = std::max(r.x1, p.x); r.y1 = std::max(r.y1, p.y);
    };
    for (const auto& el : elements_) {
        switch (el.type) {
            case PathElType::CurveTo: add(el.p[2]); [[fallthrough]];
            case PathElType::QuadTo:  add(el.p[1]); [[fallthrough]];
            case PathElType::MoveTo:
            case PathElType::LineTo:  add(el.p[0]); break;
            case PathElType::ClosePath: break;
        }
    }
    return r;
}

// --- Circle ---

void Circle::pathElements(f64 tolerance, std::vector<PathEl>& out) const {
    f64 r = std::fabs(radius);
    int n = 4;
    if (r > 0 && tolerance > 0) {
        f64 maxTheta = std::pow(tolerance / (kArcErrorScale * r), 1.0 / 6.0);
        f64 segments = std::ceil(2 * kPi / maxTheta);
        // Clamp before narrowing; huge radii overflow int.
        n = std::isfinite(segments) ? int(std::clamp(segments, 4.0, f64(kMaxArcs))) : kMaxArcs;
    }

    f64 step = 2 * kPi / n;
    f64 k = 4.0 / 3.0 * std::tan(step / 4) * r;
    auto at = [&](f64 angle) {
        return Point{center.x + r * std::cos(angle), center.y + r * std::sin(angle)};
    };

    out.push_back(PathEl::MoveTo(at(0)));
    for (int i = 0; i < n; ++i) {
        f64 a0 = step * i, a1 = step * (i + 1);
        Point p0 = at(a0);
        Point p3 = i + 1 == n ? at(0) : at(a1);
        Point c0{p0.x - k * std::sin(a0), p0.y + k * std::cos(a0)};
        Point c1{p3.x + k * std::sin(a1), p3.y - k * std::cos(a1)};
        out.push_back(PathEl::CurveTo(c0, c1, p3));
    }
    out.push_back(PathEl::ClosePath());
}

// --- RoundedRect ---

RoundedRect::RoundedRect(const Rect& rect, f64 radius)
    : rect_(rect.abs()) {
    f64 maxRadius = 0.5 * std::min(rect_.width(), rect_.height());
    radius_ = std::clamp(radius, 0.0, maxRadius);
}

void RoundedRect::pathElements(f64 tolerance, std::vector<PathEl>& out) const {
    if (radius_ == 0) {
        rect_.pathElements(tolerance, out);
        return;
    }

    const f64 r = radius_;
    const f64 k = kQuarterArcK * r;
    const Rect& b = rect_;

    out.push_back(PathEl::MoveTo({b.x0 + r, b.y0}));
    out.push_back(PathEl::LineTo({b.x1 - r, b.y0}));
    out.push_back(PathEl::CurveTo({b.x1 - r + k, b.y0}, {b.x1, b.y0 + r - k}, {b.x1, b.y0 + r}));
    out.push_back(PathEl::LineTo({b.x1, b.y1 - r}));
    out.push_back(PathEl::CurveTo({b.x1, b.y1 - r + k}, {b.x1 - r + k, b.y1}, {b.x1 - r, b.y1}));
    out.push_back(PathEl::LineTo({b.x0 + r, b.y1}));
    out.push_back(PathEl::CurveTo({b.x0 + r - k, b.y1}, {b.x0, b.y1 - r + k}, {b.x0, b.y1 - r}));
    out.push_back(PathEl::LineTo({b.x0, b.y0 + r}));
    out.push_back(PathEl::CurveTo({b.x0, b.y0 + r - k}, {b.x0 + r - k, b.y0}, {b.x0 + r, b.y0}));
    out.push_back(PathEl::ClosePath());
}

} // namespace vellum
