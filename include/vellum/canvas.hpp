#pragma once

/**
 * @file canvas.hpp
 * @brief Backend canvas: the native 2D drawing API with state management.
 */

#include "vellum/types.hpp"
#include "vellum/paint.hpp"
#include "vellum/path2d.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace vellum {

class Canvas;
class Device;

/// @brief Anything the canvas can draw as an image.
///
/// The canvas asks the source for a pattern mapping the source's pixel space
/// into user space, and paints that pattern into the destination rectangle.
class CanvasImageSource {
public:
    virtual ~CanvasImageSource() = default;

    /// @brief Source size in pixels.
    virtual Vector2I size() const = 0;

    /// @brief Wrap the source as a pattern under @p transform.
    /// @param dest Canvas the pattern will be painted on (supplies smoothing state).
    /// @param transform Maps source pixel space to user space.
    virtual Pattern toPattern(Canvas& dest, const Transform2F& transform) const = 0;
};

/// @brief Native drawing API of the vector backend.
///
/// Canvas keeps the current styles, line width, transform, image smoothing
/// and clip in a state that save()/restore() push and pop. Each drawing
/// call is forwarded to the Device as exactly one recorded operation, with
/// the state captured at call time.
class Canvas {
public:
    /// @brief Construct a Canvas that records into a device.
    explicit Canvas(Device* device);

    /// @name State
    /// @{
    void setFillStyle(const FillStyle& style) { current_.fillStyle = style; }
    const FillStyle& fillStyle() const { return current_.fillStyle; }
    void setStrokeStyle(const FillStyle& style) { current_.strokeStyle = style; }
    const FillStyle& strokeStyle() const { return current_.strokeStyle; }

    void setLineWidth(f32 width) { current_.lineWidth = width; }
    f32 lineWidth() const { return current_.lineWidth; }

    /// @brief Replace the current transform.
    void setTransform(const Transform2F& t) { current_.transform = t; }
    /// @brief Post-multiply the current transform.
    void transformBy(const Transform2F& t) { current_.transform = current_.transform * t; }
    void resetTransform() { current_.transform = Transform2F(); }
    const Transform2F& transform() const { return current_.transform; }

    void setImageSmoothingEnabled(bool enabled) { current_.smoothingEnabled = enabled; }
    bool imageSmoothingEnabled() const { return current_.smoothingEnabled; }
    void setImageSmoothingQuality(ImageSmoothingQuality q) { current_.smoothingQuality = q; }
    ImageSmoothingQuality imageSmoothingQuality() const { return current_.smoothingQuality; }

    void setFontFamily(std::string_view family) { current_.fontFamily = std::string(family); }
    const std::string& fontFamily() const { return current_.fontFamily; }
    void setFontSize(f32 size) { current_.fontSize = size; }
    f32 fontSize() const { return current_.fontSize; }
    /// @}

    /// @brief Replace the whole target with a color, ignoring clip and transform.
    void clear(ColorU c = ColorU::transparentBlack());

    /// @brief Fill a rectangle with the fill style.
    void fillRect(RectF r);

    /// @brief Fill a path with the fill style.
    void fillPath(Path2D path, FillRule rule);

    /// @brief Stroke a path with the stroke style and line width.
    void strokePath(Path2D path);

    /// @brief Intersect the clip with a path interior until the matching restore().
    void clipPath(Path2D path, FillRule rule);

    /// @brief Draw text with the fill style and current font at a baseline origin.
    void fillText(std::string_view text, Vector2F pos);

    /// @brief Draw an image at its natural size.
    void drawImage(const CanvasImageSource& src, Vector2F pos);

    /// @brief Draw an image scaled into a destination rectangle.
    void drawImage(const CanvasImageSource& src, RectF dst);

    /// @brief Draw part of an image scaled into a destination rectangle.
    void drawSubimage(const CanvasImageSource& src, RectF srcRect, RectF dst);

    /// @brief Push the current state onto the stack.
    void save();

    /// @brief Pop the most recently saved state.
    /// @return False if no state was saved.
    bool restore();

    /// @brief Number of saved states.
    size_t saveCount() const { return stack_.size(); }

private:
    struct ClipEntry {
        Path2D path;
        FillRule rule = FillRule::Winding;
        Transform2F transform;
    };

    struct State {
        FillStyle fillStyle = FillStyle::FromColor({0, 0, 0, 255});
        FillStyle strokeStyle = FillStyle::FromColor({0, 0, 0, 255});
        f32 lineWidth = 1.0f;
        Transform2F transform;
        bool smoothingEnabled = true;
        ImageSmoothingQuality smoothingQuality = ImageSmoothingQuality::Low;
        std::string fontFamily = "sans-serif";
        f32 fontSize = 10.0f;
        std::vector<ClipEntry> clips;
    };

    Device* device_ = nullptr;
    std::vector<State> stack_;
    State current_;

    void applyClip();
};

}
