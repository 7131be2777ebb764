/**
 * example_house.cpp - Drawing through the generic RenderContext
 *
 * Demonstrates:
 *   - Driving a raster Surface through CanvasRenderContext
 *   - Stroking and filling shapes with solid brushes
 *   - Transforms with save/restore
 *   - Creating an image from RGBA bytes and drawing it scaled
 *   - A blurred rectangle used as a drop shadow
 *   - Writing the result to a raw PPM file for viewing
 *
 * Build:
 *   cmake -B build -DVELLUM_BUILD_EXAMPLES=ON && cmake --build build
 *   ./build/example_house
 *
 * Output: house.ppm
 */

#include <vellum/vellum.hpp>
#include <cstdio>
#include <fstream>
#include <vector>

using namespace vellum;

// Write an RGBA pixmap to PPM, dropping alpha.
static bool writePPM(const char* filename, const Pixmap& pm) {
    std::ofstream f(filename, std::ios::binary);
    if (!f) {
        std::fprintf(stderr, "cannot open %s\n", filename);
        return false;
    }
    f << "P6\n" << pm.width() << " " << pm.height() << "\n255\n";
    for (i32 y = 0; y < pm.height(); ++y) {
        for (i32 x = 0; x < pm.width(); ++x) {
            ColorU c = pm.getColor(x, y);
            f.put(char(c.r)); f.put(char(c.g)); f.put(char(c.b));
        }
    }
    std::printf("Written: %s (%dx%d)\n", filename, pm.width(), pm.height());
    return true;
}

static void report(const char* what, const Error& err) {
    if (!err.ok()) {
        std::fprintf(stderr, "%s: %s\n", what, err.toString().c_str());
    }
}

static void drawHouse(RenderContext& rc) {
    rc.clear(Color::rgb8(0xdd, 0xee, 0xff));

    // Ground
    rc.fill(Rect(0, 250, 400, 300), rc.solidBrush(Color::rgb8(0x55, 0x99, 0x44)));

    // Shadow under the walls
    rc.blurredRect(Rect(85, 150, 235, 262), 6.0, rc.solidBrush(Color::rgba8(0, 0, 0, 0x60)));

    // Walls
    Rect walls = Rect::FromOriginSize({75, 140}, {150, 110});
    rc.fill(walls, rc.solidBrush(Color::rgb8(0xee, 0xdd, 0xbb)));
    rc.stroke(walls, rc.solidBrush(Color::black()), 10.0);

    // Door
    rc.fill(Rect(130, 190, 170, 250), rc.solidBrush(Color::rgb8(0x88, 0x44, 0x22)));

    // Roof
    BezPath roof;
    roof.moveTo({50, 140});
    roof.lineTo({150, 60});
    roof.lineTo({250, 140});
    roof.closePath();
    rc.fill(roof, rc.solidBrush(Color::rgb8(0xaa, 0x33, 0x33)));
    rc.stroke(roof, rc.solidBrush(Color::black()), 4.0);

    // Sun, drawn in a translated frame
    report("withSave", rc.withSave([](RenderContext& inner) {
        inner.transform(Affine::Translate({330, 60}));
        inner.fill(Circle({0, 0}, 30), inner.solidBrush(Color::rgb8(0xff, 0xcc, 0x00)));
        return Error();
    }));

    // 2x2 checker window, scaled up without smoothing
    const std::vector<u8> checker = {
        0x33, 0x66, 0x99, 0xff,  0xcc, 0xee, 0xff, 0xff,
        0xcc, 0xee, 0xff, 0xff,  0x33, 0x66, 0x99, 0xff,
    };
    CanvasImage window;
    Error err = rc.makeImage(2, 2, checker.data(), checker.size(),
                             ImageFormat::RgbaSeparate, window);
    report("makeImage", err);
    if (err.ok()) {
        rc.drawImage(window, Rect(90, 160, 120, 190), InterpolationMode::NearestNeighbor);
        rc.drawImage(window, Rect(180, 160, 210, 190), InterpolationMode::NearestNeighbor);
    }

    // Caption; the CPU renderer records text but does not rasterize glyphs.
    TextLayout caption;
    report("build", rc.text().newTextLayout("Home").build(caption));
    rc.drawText(caption, {20, 290});

    report("status", rc.status());
    report("finish", rc.finish());
}

int main() {
    const int W = 400, H = 300;

    auto surface = Surface::MakeRaster(W, H);
    if (!surface) return 1;

    auto fonts = CompositeFontSource::MakeSystem();

    surface->beginFrame();
    {
        CanvasRenderContext rc(*surface->canvas(), fonts);
        drawHouse(rc);
    }
    surface->endFrame();
    surface->flush();

    return writePPM("house.ppm", *surface->peekPixels()) ? 0 : 1;
}
