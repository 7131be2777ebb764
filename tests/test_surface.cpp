#include <gtest/gtest.h>
#include <vellum/vellum.hpp>
#include <cstring>
#include <vector>

using namespace vellum;

static const ColorU kRed{255, 0, 0, 255};
static const ColorU kBlue{0, 0, 255, 255};

static bool sameColor(ColorU a, ColorU b) {
    return a.toU32() == b.toU32();
}

// Draw into a fresh 32x32 raster surface and return it flushed.
template <typename Fn>
static std::unique_ptr<Surface> render(Fn fn) {
    auto surface = Surface::MakeRaster(32, 32);
    surface->beginFrame();
    fn(*surface->canvas());
    surface->endFrame();
    surface->flush();
    return surface;
}

static bool samePixels(const Pixmap& a, const Pixmap& b) {
    return a.width() == b.width() && a.height() == b.height() &&
           std::memcmp(a.data(), b.data(), a.byteSize()) == 0;
}

// Image source backed by a real Image, painted through the canvas transform.
class ImageSource : public CanvasImageSource {
public:
    explicit ImageSource(std::shared_ptr<const Image> image) : image_(std::move(image)) {}
    Vector2I size() const override { return {image_->width(), image_->height()}; }
    Pattern toPattern(Canvas& dest, const Transform2F& transform) const override {
        Pattern p;
        p.image = image_;
        p.transform = transform;
        p.smoothingEnabled = dest.imageSmoothingEnabled();
        return p;
    }
private:
    std::shared_ptr<const Image> image_;
};

// --- Creation ---

TEST(Surface, MakeRasterAllocatesPixels) {
    auto surface = Surface::MakeRaster(16, 8);
    ASSERT_NE(surface, nullptr);
    ASSERT_NE(surface->peekPixels(), nullptr);
    EXPECT_EQ(surface->size().x, 16);
    EXPECT_EQ(surface->size().y, 8);
    EXPECT_NE(surface->canvas(), nullptr);
}

TEST(Surface, MakeRasterRejectsEmptySize) {
    EXPECT_EQ(Surface::MakeRaster(0, 10), nullptr);
}

TEST(Surface, RecordingSurfaceHasNoPixels) {
    auto surface = Surface::MakeRecording(10, 10);
    ASSERT_NE(surface, nullptr);
    EXPECT_EQ(surface->peekPixels(), nullptr);
    EXPECT_EQ(surface->makeSnapshot(), nullptr);

    surface->beginFrame();
    surface->canvas()->fillRect({0, 0, 5, 5});
    surface->endFrame();
    auto recording = surface->takeRecording();
    ASSERT_NE(recording, nullptr);
    EXPECT_EQ(recording->ops().size(), 1u);
}

// --- Raster output ---

TEST(Surface, BeginFrameClearsToColor) {
    auto surface = Surface::MakeRaster(4, 4);
    surface->beginFrame(kBlue);
    surface->endFrame();
    surface->flush();
    EXPECT_TRUE(sameColor(surface->peekPixels()->getColor(3, 3), kBlue));
}

TEST(Surface, FillRectCoversPixelCenters) {
    auto surface = render([](Canvas& c) {
        c.setFillStyle(FillStyle::FromColor(kRed));
        c.fillRect({2, 2, 4, 4});
    });
    const Pixmap* pm = surface->peekPixels();
    EXPECT_TRUE(sameColor(pm->getColor(2, 2), kRed));
    EXPECT_TRUE(sameColor(pm->getColor(5, 5), kRed));
    EXPECT_EQ(pm->getColor(6, 6).a, 0);
    EXPECT_EQ(pm->getColor(1, 2).a, 0);
}

TEST(Surface, RectAndEquivalentPathProduceSameCoverage) {
    auto a = render([](Canvas& c) {
        c.setFillStyle(FillStyle::FromColor(kRed));
        c.fillRect({3, 4, 10, 7});
    });
    auto b = render([](Canvas& c) {
        c.setFillStyle(FillStyle::FromColor(kRed));
        Path2D p;
        p.moveTo({3, 4});
        p.lineTo({13, 4});
        p.lineTo({13, 11});
        p.lineTo({3, 11});
        p.closePath();
        c.fillPath(p, FillRule::Winding);
    });
    EXPECT_TRUE(samePixels(*a->peekPixels(), *b->peekPixels()));
}

TEST(Surface, FillRuleDecidesHoles) {
    auto makeRing = []() {
        Path2D p;
        p.rect({0, 0, 20, 20});
        p.rect({5, 5, 10, 10});
        return p;
    };
    auto winding = render([&](Canvas& c) { c.fillPath(makeRing(), FillRule::Winding); });
    auto evenOdd = render([&](Canvas& c) { c.fillPath(makeRing(), FillRule::EvenOdd); });
    EXPECT_EQ(winding->peekPixels()->getColor(10, 10).a, 255);
    EXPECT_EQ(evenOdd->peekPixels()->getColor(10, 10).a, 0);
    EXPECT_EQ(evenOdd->peekPixels()->getColor(2, 2).a, 255);
}

TEST(Surface, TransformAppliesToGeometry) {
    auto surface = render([](Canvas& c) {
        c.setTransform(Transform2F::Scale({2, 2}));
        c.fillRect({1, 1, 2, 2});
    });
    const Pixmap* pm = surface->peekPixels();
    EXPECT_EQ(pm->getColor(2, 2).a, 255);
    EXPECT_EQ(pm->getColor(5, 5).a, 255);
    EXPECT_EQ(pm->getColor(6, 6).a, 0);
}

TEST(Surface, StrokeCoversLineWidth) {
    auto surface = render([](Canvas& c) {
        c.setStrokeStyle(FillStyle::FromColor(kBlue));
        c.setLineWidth(4.0f);
        Path2D p;
        p.moveTo({2, 10});
        p.lineTo({28, 10});
        c.strokePath(p);
    });
    const Pixmap* pm = surface->peekPixels();
    EXPECT_TRUE(sameColor(pm->getColor(15, 9), kBlue));
    EXPECT_TRUE(sameColor(pm->getColor(15, 11), kBlue));
    EXPECT_EQ(pm->getColor(15, 5).a, 0);
    EXPECT_EQ(pm->getColor(15, 14).a, 0);
}

TEST(Surface, StrokeUsesStrokeStyleNotFillStyle) {
    auto surface = render([](Canvas& c) {
        c.setFillStyle(FillStyle::FromColor(kRed));
        c.setStrokeStyle(FillStyle::FromColor(kBlue));
        c.setLineWidth(2.0f);
        Path2D p;
        p.rect({4, 4, 20, 20});
        c.strokePath(p);
    });
    const Pixmap* pm = surface->peekPixels();
    EXPECT_TRUE(sameColor(pm->getColor(4, 12), kBlue));
    // Interior stays empty.
    EXPECT_EQ(pm->getColor(14, 14).a, 0);
}

TEST(Surface, ClipRestrictsPaintingUntilRestore) {
    auto surface = render([](Canvas& c) {
        c.setFillStyle(FillStyle::FromColor(kRed));
        c.save();
        Path2D clip;
        clip.rect({0, 0, 8, 8});
        c.clipPath(clip, FillRule::Winding);
        c.fillRect({0, 0, 16, 16});
        c.restore();
        c.setFillStyle(FillStyle::FromColor(kBlue));
        c.fillRect({20, 20, 4, 4});
    });
    const Pixmap* pm = surface->peekPixels();
    EXPECT_TRUE(sameColor(pm->getColor(4, 4), kRed));
    EXPECT_EQ(pm->getColor(12, 12).a, 0);
    EXPECT_TRUE(sameColor(pm->getColor(21, 21), kBlue));
}

TEST(Surface, SemiTransparentFillBlendsOver) {
    auto surface = render([](Canvas& c) {
        c.setFillStyle(FillStyle::FromColor({255, 255, 255, 255}));
        c.fillRect({0, 0, 8, 8});
        c.setFillStyle(FillStyle::FromColor({0, 0, 0, 128}));
        c.fillRect({0, 0, 8, 8});
    });
    ColorU c = surface->peekPixels()->getColor(4, 4);
    EXPECT_EQ(c.a, 255);
    EXPECT_NEAR(c.r, 127, 1);
}

// --- Images ---

TEST(Surface, DrawImagePaintsSourcePixels) {
    // 2x2: red, blue / blue, red
    std::vector<u8> px = {
        255, 0, 0, 255,   0, 0, 255, 255,
        0, 0, 255, 255,   255, 0, 0, 255,
    };
    auto image = Image::MakeFromRGBA(2, 2, px.data(), px.size());
    ASSERT_NE(image, nullptr);
    ImageSource src(image);

    auto surface = render([&](Canvas& c) {
        c.setImageSmoothingEnabled(false);
        c.drawImage(src, RectF{4, 4, 8, 8});
    });
    const Pixmap* pm = surface->peekPixels();
    EXPECT_TRUE(sameColor(pm->getColor(5, 5), kRed));
    EXPECT_TRUE(sameColor(pm->getColor(9, 5), kBlue));
    EXPECT_TRUE(sameColor(pm->getColor(5, 9), kBlue));
    EXPECT_TRUE(sameColor(pm->getColor(10, 10), kRed));
    EXPECT_EQ(pm->getColor(13, 13).a, 0);
}

TEST(Surface, SnapshotCopiesPixels) {
    auto surface = render([](Canvas& c) {
        c.setFillStyle(FillStyle::FromColor(kRed));
        c.fillRect({0, 0, 32, 32});
    });
    auto snapshot = surface->makeSnapshot();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_EQ(snapshot->width(), 32);
    EXPECT_TRUE(sameColor(snapshot->getColor(16, 16), kRed));
}

TEST(Surface, ResizeReallocates) {
    auto surface = Surface::MakeRaster(8, 8);
    surface->resize(20, 10);
    EXPECT_EQ(surface->size().x, 20);
    EXPECT_EQ(surface->peekPixels()->width(), 20);
    EXPECT_EQ(surface->peekPixels()->height(), 10);
}
