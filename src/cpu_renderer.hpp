#pragma once

#include "vellum/renderer.hpp"
#include "vellum/draw_op_visitor.hpp"
#include "vellum/pixmap.hpp"
#include "vellum/recording.hpp"
#include <vector>

namespace vellum {

/**
 * CpuRenderer - Software rasterization of a recorded scene into a Pixmap.
 *
 * Paths are flattened in device space and scan converted at pixel centers
 * (no anti-aliasing). Clip paths accumulate into a coverage mask. Text runs
 * are skipped: glyph rasterization belongs to a text engine, not to this
 * renderer.
 */
class CpuRenderer : public Renderer, public DrawOpVisitor {
public:
    explicit CpuRenderer(Pixmap* target) : target_(target) {}

    // Renderer interface
    void beginFrame(ColorU clearColor) override;
    void endFrame() override {}
    void resize(i32, i32) override { clipMask_.clear(); }
    void execute(const Recording& recording) override { recording.accept(*this); }
    std::shared_ptr<Image> makeSnapshot() const override;

    // DrawOpVisitor interface
    void visitClear(ColorU color) override;
    void visitFillRect(RectF rect, const PaintRef& paint, const Transform2F& t) override;
    void visitFillPath(const Path2D& path, FillRule rule,
                       const PaintRef& paint, const Transform2F& t) override;
    void visitStrokePath(const Path2D& path, f32 width,
                         const PaintRef& paint, const Transform2F& t) override;
    void visitClipPath(const Path2D& path, FillRule rule, const Transform2F& t) override;
    void visitResetClip() override { clipMask_.clear(); }
    void visitText(Vector2F, std::string_view, std::string_view, f32,
                   const PaintRef&, const Transform2F&) override {}
    void visitDrawImage(RectF dst, const Pattern& pattern, const Transform2F& t) override;

private:
    using Mask = std::vector<u8>;

    Pixmap* target_ = nullptr;
    Mask clipMask_;  // empty means no clip

    bool ready() const { return target_ && target_->valid(); }

    // Scan-convert contours into a width*height coverage mask (1 = inside).
    void rasterize(const std::vector<Contour>& contours, FillRule rule, Mask& mask) const;
    // Coverage of a stroke: union of per-segment quads and joins.
    void rasterizeStroke(const std::vector<Contour>& contours, f32 halfWidth, Mask& mask) const;

    void paintMask(const Mask& mask, const PaintRef& paint, const Transform2F& t);
    ColorU samplePattern(const Pattern& pattern, const Transform2F& inverse, f32 x, f32 y) const;
    void blendPixel(i32 x, i32 y, ColorU c);
};

} // namespace vellum
