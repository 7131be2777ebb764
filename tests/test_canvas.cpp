#include <gtest/gtest.h>
#include <vellum/vellum.hpp>
#include <functional>
#include <vector>

using namespace vellum;

// Helper: run canvas operations, finish recording, return the recording.
static std::unique_ptr<Recording> record(std::function<void(Canvas&)> fn) {
    Device device;
    device.beginFrame();
    Canvas canvas(&device);
    fn(canvas);
    device.endFrame();
    return device.finishRecording();
}

// Helper: count ops of a given type in a recording.
static int countOps(const Recording& rec, DrawOp::Type type) {
    int n = 0;
    for (const auto& op : rec.ops()) {
        if (op.type == type) ++n;
    }
    return n;
}

// Minimal image source for drawImage tests.
class SolidSource : public CanvasImageSource {
public:
    Vector2I size() const override { return {4, 2}; }
    Pattern toPattern(Canvas& dest, const Transform2F& transform) const override {
        Pattern p;
        p.transform = transform;
        p.smoothingEnabled = dest.imageSmoothingEnabled();
        return p;
    }
};

static Path2D square() {
    Path2D p;
    p.rect({0, 0, 10, 10});
    return p;
}

// --- Defaults ---

TEST(Canvas, DefaultState) {
    Device device;
    Canvas canvas(&device);
    EXPECT_FLOAT_EQ(canvas.lineWidth(), 1.0f);
    EXPECT_TRUE(canvas.transform().isIdentity());
    EXPECT_TRUE(canvas.imageSmoothingEnabled());
    EXPECT_EQ(canvas.fontFamily(), "sans-serif");
    EXPECT_EQ(canvas.saveCount(), 0u);
}

// --- One op per drawing call ---

TEST(Canvas, EachDrawingCallRecordsOneOp) {
    auto rec = record([](Canvas& c) {
        c.setFillStyle(FillStyle::FromColor({255, 0, 0, 255}));
        c.setLineWidth(4.0f);
        c.fillRect({0, 0, 5, 5});
        c.fillPath(square(), FillRule::Winding);
        c.strokePath(square());
        c.fillText("hi", {1, 1});
    });
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->ops().size(), 4u);
    EXPECT_FLOAT_EQ(rec->ops()[2].width, 4.0f);
    EXPECT_EQ(rec->ops()[0].paint.color.r, 255);
}

TEST(Canvas, StateSettersRecordNothing) {
    auto rec = record([](Canvas& c) {
        c.setFillStyle(FillStyle::FromColor({1, 2, 3, 4}));
        c.setStrokeStyle(FillStyle::FromColor({1, 2, 3, 4}));
        c.setLineWidth(2.0f);
        c.setTransform(Transform2F::Scale({2, 2}));
        c.setImageSmoothingEnabled(false);
    });
    ASSERT_NE(rec, nullptr);
    EXPECT_TRUE(rec->ops().empty());
}

TEST(Canvas, ClearRecordsColor) {
    auto rec = record([](Canvas& c) { c.clear({9, 9, 9, 9}); });
    ASSERT_EQ(rec->ops().size(), 1u);
    EXPECT_EQ(rec->ops()[0].type, DrawOp::Type::Clear);
    EXPECT_EQ(rec->ops()[0].paint.color.toU32(), 0x09090909u);
}

// --- Transform ---

TEST(Canvas, SetTransformReplaces) {
    Device device;
    Canvas canvas(&device);
    canvas.setTransform(Transform2F::Translation({5, 5}));
    canvas.setTransform(Transform2F::Scale({2, 3}));
    EXPECT_FLOAT_EQ(canvas.transform().vector.x, 0.0f);
    EXPECT_FLOAT_EQ(canvas.transform().m11, 2.0f);
}

TEST(Canvas, TransformByComposes) {
    Device device;
    Canvas canvas(&device);
    canvas.setTransform(Transform2F::Translation({5, 5}));
    canvas.transformBy(Transform2F::Scale({2, 2}));
    Vector2F p = canvas.transform().apply({1, 1});
    EXPECT_FLOAT_EQ(p.x, 7.0f);
    EXPECT_FLOAT_EQ(p.y, 7.0f);
}

// --- Save / restore ---

TEST(Canvas, RestoreWithoutSaveFails) {
    Device device;
    Canvas canvas(&device);
    EXPECT_FALSE(canvas.restore());
}

TEST(Canvas, SaveRestoreRoundTripsState) {
    Device device;
    Canvas canvas(&device);
    canvas.setLineWidth(3.0f);
    canvas.save();
    canvas.setLineWidth(9.0f);
    canvas.setImageSmoothingEnabled(false);
    EXPECT_TRUE(canvas.restore());
    EXPECT_FLOAT_EQ(canvas.lineWidth(), 3.0f);
    EXPECT_TRUE(canvas.imageSmoothingEnabled());
}

TEST(Canvas, RestoreAfterClipResetsClip) {
    auto rec = record([](Canvas& c) {
        c.save();
        c.clipPath(square(), FillRule::Winding);
        c.restore();
    });
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(countOps(*rec, DrawOp::Type::ClipPath), 1);
    EXPECT_EQ(countOps(*rec, DrawOp::Type::ResetClip), 1);
}

TEST(Canvas, NestedRestoreReappliesOuterClip) {
    auto rec = record([](Canvas& c) {
        c.clipPath(square(), FillRule::Winding);
        c.save();
        c.clipPath(square(), FillRule::EvenOdd);
        c.restore();
    });
    ASSERT_NE(rec, nullptr);
    // clip, clip, reset, outer clip again
    EXPECT_EQ(countOps(*rec, DrawOp::Type::ClipPath), 3);
    EXPECT_EQ(countOps(*rec, DrawOp::Type::ResetClip), 1);
}

TEST(Canvas, RestoreWithoutClipChangeRecordsNothing) {
    auto rec = record([](Canvas& c) {
        c.save();
        c.setLineWidth(5.0f);
        c.restore();
    });
    ASSERT_NE(rec, nullptr);
    EXPECT_TRUE(rec->ops().empty());
}

// --- Images ---

TEST(Canvas, DrawImageAtNaturalSize) {
    SolidSource src;
    auto rec = record([&](Canvas& c) { c.drawImage(src, Vector2F{10, 20}); });
    ASSERT_EQ(rec->ops().size(), 1u);
    const auto& op = rec->ops()[0];
    EXPECT_EQ(op.type, DrawOp::Type::DrawImage);
    EXPECT_FLOAT_EQ(op.data.rect.rect.x, 10.0f);
    EXPECT_FLOAT_EQ(op.data.rect.rect.w, 4.0f);
    EXPECT_FLOAT_EQ(op.data.rect.rect.h, 2.0f);
}

TEST(Canvas, DrawSubimageMapsSourceRectToDestination) {
    SolidSource src;
    auto rec = record([&](Canvas& c) {
        c.setImageSmoothingEnabled(false);
        c.drawSubimage(src, {2, 0, 2, 2}, {100, 100, 8, 8});
    });
    ASSERT_EQ(rec->ops().size(), 1u);
    const Pattern* pattern = rec->getPattern(rec->ops()[0].paint.patternIndex);
    ASSERT_NE(pattern, nullptr);
    EXPECT_FALSE(pattern->smoothingEnabled);
    // Source (2, 0) lands on the destination origin, scaled 4x.
    Vector2F origin = pattern->transform.apply({2, 0});
    EXPECT_FLOAT_EQ(origin.x, 100.0f);
    EXPECT_FLOAT_EQ(origin.y, 100.0f);
    Vector2F corner = pattern->transform.apply({4, 2});
    EXPECT_FLOAT_EQ(corner.x, 108.0f);
    EXPECT_FLOAT_EQ(corner.y, 108.0f);
}
