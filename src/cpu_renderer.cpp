#include "cpu_renderer.hpp"
#include "vellum/image.hpp"
#include <algorithm>
#include <cmath>

namespace vellum {

namespace {

constexpr f32 kRasterTolerance = 0.25f;

struct Crossing {
    f32 x;
    int winding;
    bool operator<(const Crossing& o) const { return x < o.x; }
};

bool insideByRule(int winding, FillRule rule) {
    return rule == FillRule::EvenOdd ? (winding & 1) != 0 : winding != 0;
}

// Narrow a device coordinate into [lo, hi]; NaN maps to lo.
i32 clampCoord(f32 v, i32 lo, i32 hi) {
    if (!(v > f32(lo))) return lo;
    if (!(v < f32(hi))) return hi;
    return i32(v);
}

f32 transformScale(const Transform2F& t) {
    return std::sqrt(std::fabs(t.determinant()));
}

u8 mix(u8 src, u8 dst, u32 alpha) {
    return u8((src * alpha + dst * (255 - alpha)) / 255);
}

} // namespace

void CpuRenderer::beginFrame(ColorU clearColor) {
    if (ready()) target_->clear(clearColor);
    clipMask_.clear();
}

std::shared_ptr<Image> CpuRenderer::makeSnapshot() const {
    if (ready()) {
        return Image::MakeFromPixmap(*target_);
    }
    return nullptr;
}

// --- Coverage ---

void CpuRenderer::rasterize(const std::vector<Contour>& contours, FillRule rule,
                            Mask& mask) const {
    const i32 w = target_->width();
    const i32 h = target_->height();
    mask.assign(size_t(w) * size_t(h), 0);

    f32 minY = 0, maxY = 0;
    bool any = false;
    for (const auto& c : contours) {
        for (const auto& p : c.points) {
            if (!any) { minY = maxY = p.y; any = true; }
            minY = std::min(minY, p.y);
            maxY = std::max(maxY, p.y);
        }
    }
    if (!any) return;

    i32 y0 = clampCoord(std::floor(minY), 0, h);
    i32 y1 = clampCoord(std::ceil(maxY) + 1.0f, 0, h);

    std::vector<Crossing> crossings;
    for (i32 y = y0; y < y1; ++y) {
        f32 sy = f32(y) + 0.5f;
        crossings.clear();
        for (const auto& c : contours) {
            size_t n = c.points.size();
            if (n < 2) continue;
            // Filling implicitly closes every contour.
            for (size_t i = 0; i < n; ++i) {
                Vector2F a = c.points[i];
                Vector2F b = c.points[(i + 1) % n];
                if (a.y <= sy && b.y > sy) {
                    crossings.push_back({a.x + (sy - a.y) * (b.x - a.x) / (b.y - a.y), 1});
                } else if (b.y <= sy && a.y > sy) {
                    crossings.push_back({a.x + (sy - a.y) * (b.x - a.x) / (b.y - a.y), -1});
                }
            }
        }
        if (crossings.size() < 2) continue;
        std::sort(crossings.begin(), crossings.end());

        u8* row = mask.data() + size_t(y) * size_t(w);
        int winding = 0;
        for (size_t i = 0; i + 1 < crossings.size(); ++i) {
            winding += crossings[i].winding;
            if (!insideByRule(winding, rule)) continue;
            // Pixel x is covered when its center lies in [left, right).
            i32 px0 = clampCoord(std::ceil(crossings[i].x - 0.5f), 0, w);
            i32 px1 = clampCoord(std::ceil(crossings[i + 1].x - 0.5f), 0, w);
            for (i32 x = px0; x < px1; ++x) row[x] = 1;
        }
    }
}

void CpuRenderer::rasterizeStroke(const std::vector<Contour>& contours, f32 halfWidth,
                                  Mask& mask) const {
    mask.assign(size_t(target_->width()) * size_t(target_->height()), 0);
    Mask piece;
    std::vector<Contour> poly(1);
    poly[0].closed = true;

    auto addPiece = [&](std::vector<Vector2F> pts) {
        poly[0].points = std::move(pts);
        rasterize(poly, FillRule::Winding, piece);
        for (size_t i = 0; i < mask.size(); ++i) mask[i] |= piece[i];
    };

    auto normal = [&](Vector2F a, Vector2F b, Vector2F* out) {
        f32 dx = b.x - a.x, dy = b.y - a.y;
        f32 len = std::sqrt(dx * dx + dy * dy);
        if (len == 0) return false;
        *out = {-dy / len * halfWidth, dx / len * halfWidth};
        return true;
    };

    std::vector<Vector2F> pts;
    for (const auto& c : contours) {
        // Drop repeated vertices so every segment has a direction.
        pts.clear();
        for (const auto& p : c.points) {
            if (pts.empty() || p.x != pts.back().x || p.y != pts.back().y) pts.push_back(p);
        }
        if (c.closed && pts.size() > 1 &&
            pts.front().x == pts.back().x && pts.front().y == pts.back().y) {
            pts.pop_back();
        }
        size_t n = pts.size();
        if (n < 2) continue;
        size_t segments = c.closed ? n : n - 1;
        std::vector<Vector2F> normals;
        for (size_t i = 0; i < segments; ++i) {
            Vector2F a = pts[i];
            Vector2F b = pts[(i + 1) % n];
            Vector2F nv;
            if (!normal(a, b, &nv)) continue;
            normals.push_back(nv);
            addPiece({{a.x + nv.x, a.y + nv.y}, {b.x + nv.x, b.y + nv.y},
                      {b.x - nv.x, b.y - nv.y}, {a.x - nv.x, a.y - nv.y}});
        }
        // Bevel joins between consecutive segments.
        size_t joins = c.closed ? normals.size() : (normals.empty() ? 0 : normals.size() - 1);
        size_t vi = 1;
        for (size_t j = 0; j < joins; ++j, ++vi) {
            Vector2F p = pts[vi % n];
            Vector2F n0 = normals[j];
            Vector2F n1 = normals[(j + 1) % normals.size()];
            addPiece({p, {p.x + n0.x, p.y + n0.y}, {p.x + n1.x, p.y + n1.y}});
            addPiece({p, {p.x - n1.x, p.y - n1.y}, {p.x - n0.x, p.y - n0.y}});
        }
    }
}

// --- Painting ---

void CpuRenderer::blendPixel(i32 x, i32 y, ColorU c) {
    if (!target_->contains(x, y)) return;
    if (!clipMask_.empty() && !clipMask_[size_t(y) * target_->width() + x]) return;
    if (c.a == 0) return;
    if (c.a == 255) {
        target_->setColor(x, y, c);
        return;
    }

    ColorU dst = target_->getColor(x, y);
    u32 a = c.a;
    ColorU out;
    out.r = mix(c.r, dst.r, a);
    out.g = mix(c.g, dst.g, a);
    out.b = mix(c.b, dst.b, a);
    out.a = u8(a + dst.a * (255 - a) / 255);
    target_->setColor(x, y, out);
}

ColorU CpuRenderer::samplePattern(const Pattern& pattern, const Transform2F& inverse,
                                  f32 x, f32 y) const {
    const Image* image = pattern.image.get();
    if (!image || !image->valid()) return ColorU::transparentBlack();

    Vector2F uv = inverse.apply({x, y});
    i32 iw = image->width(), ih = image->height();
    if (uv.x < 0 || uv.y < 0 || uv.x >= f32(iw) || uv.y >= f32(ih)) {
        return ColorU::transparentBlack();
    }

    if (!pattern.smoothingEnabled) {
        return image->getColor(i32(uv.x), i32(uv.y));
    }

    // Bilinear: sample around texel centers, clamping at the edges.
    f32 fx = uv.x - 0.5f, fy = uv.y - 0.5f;
    i32 x0 = i32(std::floor(fx)), y0 = i32(std::floor(fy));
    f32 tx = fx - f32(x0), ty = fy - f32(y0);
    auto texel = [&](i32 sx, i32 sy) {
        return image->getColor(std::clamp(sx, 0, iw - 1), std::clamp(sy, 0, ih - 1));
    };
    ColorU c00 = texel(x0, y0), c10 = texel(x0 + 1, y0);
    ColorU c01 = texel(x0, y0 + 1), c11 = texel(x0 + 1, y0 + 1);
    auto lerp2 = [&](u8 a, u8 b, u8 c, u8 d) {
        f32 top = a + (b - a) * tx;
        f32 bottom = c + (d - c) * tx;
        return u8(std::lround(top + (bottom - top) * ty));
    };
    return {lerp2(c00.r, c10.r, c01.r, c11.r), lerp2(c00.g, c10.g, c01.g, c11.g),
            lerp2(c00.b, c10.b, c01.b, c11.b), lerp2(c00.a, c10.a, c01.a, c11.a)};
}

void CpuRenderer::paintMask(const Mask& mask, const PaintRef& paint, const Transform2F& t) {
    const i32 w = target_->width();
    const i32 h = target_->height();

    Transform2F inverse;
    if (paint.pattern) {
        Transform2F full = t * paint.pattern->transform;
        if (!full.invert(&inverse)) return;
    }

    for (i32 y = 0; y < h; ++y) {
        const u8* row = mask.data() + size_t(y) * size_t(w);
        for (i32 x = 0; x < w; ++x) {
            if (!row[x]) continue;
            ColorU c = paint.pattern
                ? samplePattern(*paint.pattern, inverse, f32(x) + 0.5f, f32(y) + 0.5f)
                : paint.color;
            blendPixel(x, y, c);
        }
    }
}

// --- DrawOpVisitor ---

void CpuRenderer::visitClear(ColorU color) {
    if (ready()) target_->clear(color);
}

void CpuRenderer::visitFillRect(RectF rect, const PaintRef& paint, const Transform2F& t) {
    Path2D path;
    path.rect(rect);
    visitFillPath(path, FillRule::Winding, paint, t);
}

void CpuRenderer::visitFillPath(const Path2D& path, FillRule rule,
                                const PaintRef& paint, const Transform2F& t) {
    if (!ready()) return;
    std::vector<Contour> contours;
    path.flatten(t, kRasterTolerance, contours);
    Mask mask;
    rasterize(contours, rule, mask);
    paintMask(mask, paint, t);
}

void CpuRenderer::visitStrokePath(const Path2D& path, f32 width,
                                  const PaintRef& paint, const Transform2F& t) {
    if (!ready()) return;
    std::vector<Contour> contours;
    path.flatten(t, kRasterTolerance, contours);
    f32 halfWidth = 0.5f * (width > 0 ? width : 1.0f) * transformScale(t);
    Mask mask;
    rasterizeStroke(contours, halfWidth, mask);
    paintMask(mask, paint, t);
}

void CpuRenderer::visitClipPath(const Path2D& path, FillRule rule, const Transform2F& t) {
    if (!ready()) return;
    std::vector<Contour> contours;
    path.flatten(t, kRasterTolerance, contours);
    Mask mask;
    rasterize(contours, rule, mask);
    if (clipMask_.empty()) {
        clipMask_ = std::move(mask);
    } else {
        for (size_t i = 0; i < clipMask_.size(); ++i) clipMask_[i] &= mask[i];
    }
}

void CpuRenderer::visitDrawImage(RectF dst, const Pattern& pattern, const Transform2F& t) {
    PaintRef paint;
    paint.pattern = &pattern;
    visitFillRect(dst, paint, t);
}

} // namespace vellum
