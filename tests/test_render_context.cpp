#include <gtest/gtest.h>
#include <vellum/vellum.hpp>
#include <functional>
#include <vector>

using namespace vellum;

// Helper: drive a CanvasRenderContext over a recording canvas.
static std::unique_ptr<Recording> record(std::function<void(CanvasRenderContext&, Canvas&)> fn) {
    Device device;
    device.beginFrame();
    Canvas canvas(&device);
    CanvasRenderContext ctx(canvas, std::make_shared<CompositeFontSource>());
    fn(ctx, canvas);
    device.endFrame();
    return device.finishRecording();
}

static int countOps(const Recording& rec, DrawOp::Type type) {
    int n = 0;
    for (const auto& op : rec.ops()) {
        if (op.type == type) ++n;
    }
    return n;
}

static Brush gradientBrush(RenderContext& ctx) {
    FixedLinearGradient lin;
    lin.start = {0, 0};
    lin.end = {10, 10};
    lin.stops = {{0.0f, Color::black()}, {1.0f, Color::white()}};
    Brush brush;
    EXPECT_TRUE(ctx.gradient(FixedGradient::Linear(lin), brush).ok());
    return brush;
}

static CanvasImage makeTestImage(RenderContext& ctx, size_t w, size_t h) {
    std::vector<u8> px(w * h * 4, 200);
    CanvasImage image;
    EXPECT_TRUE(ctx.makeImage(w, h, px.data(), px.size(), ImageFormat::RgbaSeparate, image).ok());
    return image;
}

// --- Shapes ---

TEST(CanvasRenderContext, StrokeRectIsOneRectStroke) {
    Color stroke = Color::rgba8(0x20, 0x40, 0x60, 0xff);
    auto rec = record([&](CanvasRenderContext& ctx, Canvas& canvas) {
        Rect r = Rect::FromOriginSize({75, 140}, {150, 110});
        ctx.stroke(r, ctx.solidBrush(stroke), 10.0);
        EXPECT_TRUE(ctx.status().ok());
        // Fill style is untouched by a stroke.
        EXPECT_EQ(canvas.fillStyle().color.toU32(), 0x000000ffu);
    });
    ASSERT_NE(rec, nullptr);
    ASSERT_EQ(rec->ops().size(), 1u);

    const auto& op = rec->ops()[0];
    EXPECT_EQ(op.type, DrawOp::Type::StrokePath);
    EXPECT_FLOAT_EQ(op.width, 10.0f);
    EXPECT_EQ(op.paint.color.toU32(), stroke.toRgba32());

    const Path2D* path = rec->getPath(op.data.path.pathIndex);
    ASSERT_NE(path, nullptr);
    ASSERT_EQ(path->verbs().size(), 1u);
    EXPECT_EQ(path->verbs()[0], PathVerb::Rect);
    EXPECT_FLOAT_EQ(path->points()[0].x, 75.0f);
    EXPECT_FLOAT_EQ(path->points()[0].y, 140.0f);
    EXPECT_FLOAT_EQ(path->points()[1].x, 225.0f);
    EXPECT_FLOAT_EQ(path->points()[1].y, 250.0f);
}

TEST(CanvasRenderContext, StrokeStyledUsesWidth) {
    auto rec = record([](CanvasRenderContext& ctx, Canvas&) {
        StrokeStyle style;
        style.setLineJoin(LineJoin::Round).setLineCap(LineCap::Square);
        ctx.strokeStyled(Line({0, 0}, {10, 10}), ctx.solidBrush(Color::black()), 2.5, style);
    });
    ASSERT_EQ(rec->ops().size(), 1u);
    EXPECT_EQ(rec->ops()[0].type, DrawOp::Type::StrokePath);
    EXPECT_FLOAT_EQ(rec->ops()[0].width, 2.5f);
}

TEST(CanvasRenderContext, FillRules) {
    auto rec = record([](CanvasRenderContext& ctx, Canvas&) {
        Brush red = ctx.solidBrush(Color::rgb8(255, 0, 0));
        ctx.fill(Circle({50, 50}, 10), red);
        ctx.fillEvenOdd(RoundedRect(Rect(0, 0, 20, 20), 4), red);
    });
    ASSERT_EQ(rec->ops().size(), 2u);
    EXPECT_EQ(rec->ops()[0].type, DrawOp::Type::FillPath);
    EXPECT_EQ(rec->ops()[0].fillRule, FillRule::Winding);
    EXPECT_EQ(rec->ops()[1].fillRule, FillRule::EvenOdd);
    EXPECT_EQ(rec->ops()[0].paint.color.toU32(), 0xff0000ffu);
}

TEST(CanvasRenderContext, ClipRecordsClipPath) {
    auto rec = record([](CanvasRenderContext& ctx, Canvas&) {
        ctx.clip(Rect(0, 0, 10, 10));
    });
    ASSERT_EQ(rec->ops().size(), 1u);
    EXPECT_EQ(rec->ops()[0].type, DrawOp::Type::ClipPath);
    EXPECT_EQ(rec->ops()[0].fillRule, FillRule::Winding);
}

// --- Gradients ---

TEST(CanvasRenderContext, GradientFillIsSkippedAndReported) {
    auto rec = record([](CanvasRenderContext& ctx, Canvas&) {
        Brush g = gradientBrush(ctx);
        ctx.fill(Rect(0, 0, 10, 10), g);
        ctx.stroke(Rect(0, 0, 10, 10), g, 1.0);
        ctx.blurredRect(Rect(0, 0, 10, 10), 2.0, g);
        EXPECT_EQ(ctx.status().code, ErrorCode::NotSupported);
        // Reading the status clears it.
        EXPECT_TRUE(ctx.status().ok());
    });
    ASSERT_NE(rec, nullptr);
    EXPECT_TRUE(rec->ops().empty());
}

TEST(CanvasRenderContext, StatusKeepsFirstError) {
    record([](CanvasRenderContext& ctx, Canvas&) {
        ctx.fill(Rect(0, 0, 1, 1), gradientBrush(ctx));
        ctx.blurredRect(Rect(0, 0, 1e6, 1e6), 1.0, ctx.solidBrush(Color::black()));
        EXPECT_EQ(ctx.status().code, ErrorCode::NotSupported);
    });
}

// --- Clearing ---

TEST(CanvasRenderContext, ClearWholeTarget) {
    auto rec = record([](CanvasRenderContext& ctx, Canvas&) {
        ctx.clear(Color::white());
    });
    ASSERT_EQ(rec->ops().size(), 1u);
    EXPECT_EQ(rec->ops()[0].type, DrawOp::Type::Clear);
    EXPECT_EQ(rec->ops()[0].paint.color.toU32(), 0xffffffffu);
}

TEST(CanvasRenderContext, ClearRegionFillsRectAndKeepsFillStyle) {
    auto rec = record([](CanvasRenderContext& ctx, Canvas& canvas) {
        ctx.fill(Rect(0, 0, 1, 1), ctx.solidBrush(Color::rgb8(1, 2, 3)));
        ctx.clear(Rect(5, 6, 15, 26), Color::rgba8(9, 9, 9, 9));
        EXPECT_EQ(canvas.fillStyle().color.toU32(), 0x010203ffu);
    });
    ASSERT_EQ(rec->ops().size(), 2u);
    const auto& op = rec->ops()[1];
    EXPECT_EQ(op.type, DrawOp::Type::FillRect);
    EXPECT_EQ(op.paint.color.toU32(), 0x09090909u);
    EXPECT_FLOAT_EQ(op.data.rect.rect.x, 5.0f);
    EXPECT_FLOAT_EQ(op.data.rect.rect.w, 10.0f);
    EXPECT_FLOAT_EQ(op.data.rect.rect.h, 20.0f);
}

// --- State ---

TEST(CanvasRenderContext, RestoreWithoutSaveIsInvalidInput) {
    record([](CanvasRenderContext& ctx, Canvas&) {
        EXPECT_EQ(ctx.restore().code, ErrorCode::InvalidInput);
        EXPECT_TRUE(ctx.save().ok());
        EXPECT_TRUE(ctx.restore().ok());
        EXPECT_EQ(ctx.restore().code, ErrorCode::InvalidInput);
        EXPECT_TRUE(ctx.finish().ok());
    });
}

TEST(CanvasRenderContext, TransformReplacesAndIsRestored) {
    auto rec = record([](CanvasRenderContext& ctx, Canvas&) {
        ctx.transform(Affine::Translate({100, 0}));
        ctx.transform(Affine::Translate({10, 20}));
        EXPECT_EQ(ctx.currentTransform(), Affine::Translate({10, 20}));

        ctx.save();
        ctx.transform(Affine::Scale(3));
        EXPECT_EQ(ctx.currentTransform(), Affine::Scale(3));
        ctx.restore();
        EXPECT_EQ(ctx.currentTransform(), Affine::Translate({10, 20}));

        ctx.fill(Rect(0, 0, 1, 1), ctx.solidBrush(Color::black()));
    });
    ASSERT_EQ(rec->ops().size(), 1u);
    EXPECT_FLOAT_EQ(rec->ops()[0].transform.vector.x, 10.0f);
    EXPECT_FLOAT_EQ(rec->ops()[0].transform.vector.y, 20.0f);
}

TEST(CanvasRenderContext, WithSaveRestoresOnSuccessAndError) {
    record([](CanvasRenderContext& ctx, Canvas& canvas) {
        Error ok = ctx.withSave([](RenderContext& rc) {
            rc.transform(Affine::Scale(2));
            return Error();
        });
        EXPECT_TRUE(ok.ok());
        EXPECT_EQ(ctx.currentTransform(), Affine::Identity());

        Error failed = ctx.withSave([](RenderContext& rc) {
            rc.transform(Affine::Scale(2));
            return Error(ErrorCode::BackendError, "inner");
        });
        EXPECT_EQ(failed.code, ErrorCode::BackendError);
        EXPECT_EQ(canvas.saveCount(), 0u);
    });
}

// --- Text ---

TEST(CanvasRenderContext, DrawTextRecordsLayoutText) {
    auto rec = record([](CanvasRenderContext& ctx, Canvas&) {
        TextLayout layout;
        ASSERT_TRUE(ctx.text().newTextLayout("Hello vellum").build(layout).ok());
        ctx.drawText(layout, {12, 34});
    });
    ASSERT_EQ(rec->ops().size(), 1u);
    const auto& op = rec->ops()[0];
    EXPECT_EQ(op.type, DrawOp::Type::Text);
    EXPECT_FLOAT_EQ(op.data.text.pos.x, 12.0f);
    EXPECT_FLOAT_EQ(op.data.text.pos.y, 34.0f);
    EXPECT_EQ(std::string(rec->arena().getString(op.data.text.offset), op.data.text.len),
              "Hello vellum");
}

// --- Images ---

TEST(CanvasRenderContext, MakeImageValidatesLength) {
    record([](CanvasRenderContext& ctx, Canvas&) {
        std::vector<u8> px(15);
        CanvasImage image;
        EXPECT_EQ(ctx.makeImage(2, 2, px.data(), px.size(), ImageFormat::RgbaSeparate, image).code,
                  ErrorCode::InvalidInput);
        EXPECT_EQ(ctx.makeImage(2, 2, px.data(), 12, ImageFormat::Rgb, image).code,
                  ErrorCode::UnsupportedFormat);
    });
}

TEST(CanvasRenderContext, DrawImageSetsStickyInterpolation) {
    auto rec = record([](CanvasRenderContext& ctx, Canvas& canvas) {
        CanvasImage image = makeTestImage(ctx, 4, 4);
        ctx.drawImage(image, Rect(0, 0, 8, 8), InterpolationMode::NearestNeighbor);
        // The mode stays on the canvas after the call.
        EXPECT_FALSE(canvas.imageSmoothingEnabled());
        ctx.drawImageArea(image, Rect(1, 1, 3, 3), Rect(10, 10, 30, 30),
                          InterpolationMode::Bilinear);
        EXPECT_TRUE(canvas.imageSmoothingEnabled());
    });
    ASSERT_EQ(rec->ops().size(), 2u);
    EXPECT_EQ(countOps(*rec, DrawOp::Type::DrawImage), 2);

    const Pattern* first = rec->getPattern(rec->ops()[0].paint.patternIndex);
    const Pattern* second = rec->getPattern(rec->ops()[1].paint.patternIndex);
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    EXPECT_FALSE(first->smoothingEnabled);
    EXPECT_TRUE(second->smoothingEnabled);
    EXPECT_FLOAT_EQ(rec->ops()[1].data.rect.rect.x, 10.0f);
    EXPECT_FLOAT_EQ(rec->ops()[1].data.rect.rect.w, 20.0f);
}

TEST(CanvasRenderContext, ZeroAreaImageDrawsNothing) {
    auto rec = record([](CanvasRenderContext& ctx, Canvas&) {
        CanvasImage image;
        ASSERT_TRUE(ctx.makeImage(0, 4, nullptr, 0, ImageFormat::RgbaSeparate, image).ok());
        ctx.drawImage(image, Rect(0, 0, 10, 10), InterpolationMode::Bilinear);
        ctx.drawImageArea(image, Rect(0, 0, 1, 1), Rect(0, 0, 10, 10),
                          InterpolationMode::NearestNeighbor);
        EXPECT_TRUE(ctx.status().ok());
    });
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->ops().size(), 0u);
}

TEST(CanvasRenderContext, CaptureImageAreaIsNotSupported) {
    record([](CanvasRenderContext& ctx, Canvas&) {
        CanvasImage image;
        EXPECT_EQ(ctx.captureImageArea(Rect(0, 0, 4, 4), image).code, ErrorCode::NotSupported);
        EXPECT_FALSE(image.valid());
    });
}

// --- Blur ---

TEST(CanvasRenderContext, BlurredRectDrawsOneMaskImage) {
    Color c = Color::rgba8(10, 20, 30, 255);
    auto rec = record([&](CanvasRenderContext& ctx, Canvas&) {
        ctx.blurredRect(Rect(10, 10, 30, 20), 2.0, ctx.solidBrush(c));
        EXPECT_TRUE(ctx.status().ok());
    });
    ASSERT_EQ(rec->ops().size(), 1u);
    const auto& op = rec->ops()[0];
    EXPECT_EQ(op.type, DrawOp::Type::DrawImage);
    EXPECT_FLOAT_EQ(op.data.rect.rect.x, 5.0f);
    EXPECT_FLOAT_EQ(op.data.rect.rect.y, 5.0f);
    EXPECT_FLOAT_EQ(op.data.rect.rect.w, 30.0f);
    EXPECT_FLOAT_EQ(op.data.rect.rect.h, 20.0f);

    const Pattern* pattern = rec->getPattern(op.paint.patternIndex);
    ASSERT_NE(pattern, nullptr);
    ASSERT_NE(pattern->image, nullptr);
    EXPECT_EQ(pattern->image->width(), 30);
    EXPECT_EQ(pattern->image->height(), 20);
    ColorU center = pattern->image->getColor(15, 10);
    EXPECT_EQ(center.r, 10);
    EXPECT_EQ(center.b, 30);
    EXPECT_GE(center.a, 250);
    EXPECT_LE(pattern->image->getColor(0, 0).a, 2);
}

TEST(CanvasRenderContext, BlurredRectAlphaFollowsBrush) {
    auto rec = record([](CanvasRenderContext& ctx, Canvas&) {
        ctx.blurredRect(Rect(10, 10, 30, 20), 2.0, ctx.solidBrush(Color::rgba8(0, 0, 0, 128)));
    });
    ASSERT_EQ(rec->ops().size(), 1u);
    const Pattern* pattern = rec->getPattern(rec->ops()[0].paint.patternIndex);
    ASSERT_NE(pattern, nullptr);
    EXPECT_NEAR(pattern->image->getColor(15, 10).a, 128, 1);
}

TEST(CanvasRenderContext, OversizedBlurIsUnsupported) {
    auto rec = record([](CanvasRenderContext& ctx, Canvas&) {
        ctx.blurredRect(Rect(0, 0, 1e6, 1e6), 1.0, ctx.solidBrush(Color::black()));
        EXPECT_EQ(ctx.status().code, ErrorCode::UnsupportedFormat);
    });
    EXPECT_TRUE(rec->ops().empty());
}

// --- Raster ---

TEST(CanvasRenderContext, RastersThroughSurface) {
    auto surface = Surface::MakeRaster(20, 20);
    ASSERT_NE(surface, nullptr);
    surface->beginFrame(ColorU{255, 255, 255, 255});
    {
        CanvasRenderContext ctx(*surface->canvas(), std::make_shared<CompositeFontSource>());
        ctx.transform(Affine::Translate({2, 2}));
        ctx.fill(Rect(0, 0, 6, 6), ctx.solidBrush(Color::rgb8(0, 128, 0)));
        ctx.stroke(Line({0, 12}, {16, 12}), ctx.solidBrush(Color::rgb8(0, 0, 255)), 2.0);
        EXPECT_TRUE(ctx.finish().ok());
    }
    surface->endFrame();
    surface->flush();

    const Pixmap* pm = surface->peekPixels();
    EXPECT_EQ(pm->getColor(4, 4).g, 128);
    EXPECT_EQ(pm->getColor(4, 4).r, 0);
    EXPECT_EQ(pm->getColor(1, 1).r, 255);
    EXPECT_EQ(pm->getColor(10, 14).b, 255);
    EXPECT_EQ(pm->getColor(10, 14).r, 0);
}

TEST(CanvasRenderContext, FillFarBeyondSurfaceCoversEveryPixel) {
    auto surface = Surface::MakeRaster(16, 16);
    ASSERT_NE(surface, nullptr);
    surface->beginFrame(ColorU{255, 255, 255, 255});
    {
        CanvasRenderContext ctx(*surface->canvas(), std::make_shared<CompositeFontSource>());
        ctx.fill(Rect(-1e10, -1e10, 1e10, 1e10), ctx.solidBrush(Color::rgb8(0, 0, 255)));
        EXPECT_TRUE(ctx.status().ok());
    }
    surface->endFrame();
    surface->flush();

    const Pixmap* pm = surface->peekPixels();
    for (i32 y = 0; y < 16; y += 5) {
        for (i32 x = 0; x < 16; x += 5) {
            EXPECT_EQ(pm->getColor(x, y).b, 255);
            EXPECT_EQ(pm->getColor(x, y).r, 0);
        }
    }
}
