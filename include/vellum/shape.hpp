#pragma once

/**
 * @file shape.hpp
 * @brief Double-precision geometry of the generic drawing interface.
 *
 * Shapes are backend independent. The adapter reads them through the
 * Shape interface and converts them into backend Path2D commands.
 */

#include "vellum/types.hpp"
#include <vector>

namespace vellum {

/// @brief A 2D point.
struct Point {
    f64 x = 0;
    f64 y = 0;

    Point operator+(Point o) const { return {x + o.x, y + o.y}; }
    Point operator-(Point o) const { return {x - o.x, y - o.y}; }
    bool operator==(Point o) const { return x == o.x && y == o.y; }
    bool operator!=(Point o) const { return !(*this == o); }
};

/// @brief A 2D size.
struct Size {
    f64 width = 0;
    f64 height = 0;
};

/**
 * @brief 2D affine transform in column convention.
 *
 * Coefficients [a b c d e f] map (x, y) to (a*x + c*y + e, b*x + d*y + f).
 */
struct Affine {
    f64 c[6] = {1, 0, 0, 1, 0, 0};

    Affine() = default;
    Affine(f64 a, f64 b, f64 cc, f64 d, f64 e, f64 f) : c{a, b, cc, d, e, f} {}

    static Affine Identity() { return Affine(); }
    static Affine Translate(Point v) { return {1, 0, 0, 1, v.x, v.y}; }
    static Affine Scale(f64 s) { return {s, 0, 0, s, 0, 0}; }
    static Affine ScaleNonUniform(f64 sx, f64 sy) { return {sx, 0, 0, sy, 0, 0}; }
    static Affine Rotate(f64 radians);

    const f64* coeffs() const { return c; }

    Point apply(Point p) const {
        return {c[0] * p.x + c[2] * p.y + c[4], c[1] * p.x + c[3] * p.y + c[5]};
    }

    /// @brief Compose: the result applies @p other first, then this transform.
    Affine operator*(const Affine& other) const;

    bool operator==(const Affine& o) const;
    bool operator!=(const Affine& o) const { return !(*this == o); }
};

/// @brief Path element tag.
enum class PathElType : u8 {
    MoveTo,
    LineTo,
    QuadTo,
    CurveTo,
    ClosePath
};

/// @brief One element of a path: a tag and up to three points.
struct PathEl {
    PathElType type = PathElType::MoveTo;
    Point p[3];

    static PathEl MoveTo(Point p0) { PathEl e; e.type = PathElType::MoveTo; e.p[0] = p0; return e; }
    static PathEl LineTo(Point p0) { PathEl e; e.type = PathElType::LineTo; e.p[0] = p0; return e; }
    static PathEl QuadTo(Point p0, Point p1) {
        PathEl e; e.type = PathElType::QuadTo; e.p[0] = p0; e.p[1] = p1; return e;
    }
    static PathEl CurveTo(Point p0, Point p1, Point p2) {
        PathEl e; e.type = PathElType::CurveTo; e.p[0] = p0; e.p[1] = p1; e.p[2] = p2; return e;
    }
    static PathEl ClosePath() { PathEl e; e.type = PathElType::ClosePath; return e; }

    bool operator==(const PathEl& o) const;
};

class Line;
class Rect;

/**
 * @brief Abstract geometric shape.
 *
 * Every shape can produce path elements within a tolerance. Shapes that are
 * exactly a line, a rectangle, or a stored element sequence also expose that
 * directly so converters can skip the general path.
 */
class Shape {
public:
    virtual ~Shape() = default;

    /// @brief Append the shape's outline as path elements.
    /// @param tolerance Maximum distance between curves and their approximation.
    virtual void pathElements(f64 tolerance, std::vector<PathEl>& out) const = 0;

    /// @brief Smallest axis-aligned rectangle containing the shape.
    virtual Rect boundingBox() const = 0;

    virtual bool asLine(Line* out) const;
    virtual bool asRect(Rect* out) const;
    /// @brief Stored elements, or nullptr if the shape has none.
    virtual const std::vector<PathEl>* asPathSlice() const { return nullptr; }
};

/// @brief An axis-aligned rectangle given by two corners.
class Rect : public Shape {
public:
    f64 x0 = 0, y0 = 0, x1 = 0, y1 = 0;

    Rect() = default;
    Rect(f64 x0_, f64 y0_, f64 x1_, f64 y1_) : x0(x0_), y0(y0_), x1(x1_), y1(y1_) {}

    static Rect FromOriginSize(Point origin, Size size) {
        return {origin.x, origin.y, origin.x + size.width, origin.y + size.height};
    }
    static Rect FromPoints(Point a, Point b);

    f64 width() const { return x1 - x0; }
    f64 height() const { return y1 - y0; }
    Point origin() const { return {x0, y0}; }
    Size size() const { return {width(), height()}; }

    /// @brief Rectangle with corners ordered so that width and height are non-negative.
    Rect abs() const;
    /// @brief Grow by @p w horizontally and @p h vertically on each side.
    Rect inflate(f64 w, f64 h) const { return {x0 - w, y0 - h, x1 + w, y1 + h}; }
    /// @brief Round the corners outward to integer coordinates.
    Rect expand() const;

    bool operator==(const Rect& o) const {
        return x0 == o.x0 && y0 == o.y0 && x1 == o.x1 && y1 == o.y1;
    }

    void pathElements(f64 tolerance, std::vector<PathEl>& out) const override;
    Rect boundingBox() const override { return abs(); }
    bool asRect(Rect* out) const override { *out = *this; return true; }
};

/// @brief A line segment.
class Line : public Shape {
public:
    Point p0;
    Point p1;

    Line() = default;
    Line(Point a, Point b) : p0(a), p1(b) {}

    void pathElements(f64 tolerance, std::vector<PathEl>& out) const override;
    Rect boundingBox() const override { return Rect::FromPoints(p0, p1); }
    bool asLine(Line* out) const override { *out = *this; return true; }
};

/// @brief An explicit sequence of path elements.
class BezPath : public Shape {
public:
    BezPath() = default;
    explicit BezPath(std::vector<PathEl> elements) : elements_(std::move(elements)) {}

    void moveTo(Point p) { elements_.push_back(PathEl::MoveTo(p)); }
    void lineTo(Point p) { elements_.push_back(PathEl::LineTo(p)); }
    void quadTo(Point p1, Point p2) { elements_.push_back(PathEl::QuadTo(p1, p2)); }
    void curveTo(Point p1, Point p2, Point p3) { elements_.push_back(PathEl::CurveTo(p1, p2, p3)); }
    void closePath() { elements_.push_back(PathEl::ClosePath()); }

    const std::vector<PathEl>& elements() const { return elements_; }

    void pathElements(f64 tolerance, std::vector<PathEl>& out) const override;
    Rect boundingBox() const override;
    const std::vector<PathEl>* asPathSlice() const override { return &elements_; }

private:
    std::vector<PathEl> elements_;
};

/// @brief A circle, approximated by cubic arcs when converted to a path.
class Circle : public Shape {
public:
    Point center;
    f64 radius = 0;

    Circle() = default;
    Circle(Point c, f64 r) : center(c), radius(r) {}

    void pathElements(f64 tolerance, std::vector<PathEl>& out) const override;
    Rect boundingBox() const override {
        return {center.x - radius, center.y - radius, center.x + radius, center.y + radius};
    }
};

/// @brief A rectangle with uniformly rounded corners.
class RoundedRect : public Shape {
public:
    RoundedRect() = default;
    /// @param radius Corner radius; clamped to half the shorter side.
    RoundedRect(const Rect& rect, f64 radius);

    const Rect& rect() const { return rect_; }
    f64 radius() const { return radius_; }

    void pathElements(f64 tolerance, std::vector<PathEl>& out) const override;
    Rect boundingBox() const override { return rect_; }

private:
    Rect rect_;
    f64 radius_ = 0;
};

} // namespace vellum
