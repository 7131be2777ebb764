#pragma once

/**
 * @file surface.hpp
 * @brief Top-level render target owning the canvas, device and renderer.
 */

#include "vellum/types.hpp"
#include "vellum/pixmap.hpp"
#include "vellum/canvas.hpp"
#include "vellum/device.hpp"
#include "vellum/image.hpp"
#include "vellum/renderer.hpp"
#include <memory>

namespace vellum {

/// @brief Top-level rendering target.
///
/// A Surface owns a Canvas, a Device, and optionally a Renderer. The frame
/// cycle is: beginFrame() → draw via canvas() → endFrame() → flush().
/// Recording surfaces have no renderer; their scene is retrieved with
/// takeRecording() instead of flush().
class Surface {
public:
    /// @brief Create a CPU raster surface that allocates its own pixel buffer.
    /// @param w Width in pixels.
    /// @param h Height in pixels.
    /// @return Unique pointer to the new Surface, or nullptr for empty dimensions.
    static std::unique_ptr<Surface> MakeRaster(i32 w, i32 h);

    /// @brief Create a recording-only surface (captures commands, never rasterizes).
    /// @param w Width in pixels.
    /// @param h Height in pixels.
    static std::unique_ptr<Surface> MakeRecording(i32 w, i32 h);

    ~Surface();

    /// @brief Canvas used for drawing on this surface.
    Canvas* canvas() const { return canvas_.get(); }

    /// @brief Device the canvas records into.
    Device* device() { return &device_; }

    /// @brief Surface size in pixels.
    Vector2I size() const { return size_; }

    /// @brief Resize the surface to new dimensions.
    void resize(i32 w, i32 h);

    /// @brief Begin a new frame, clearing the target to @p clearColor.
    void beginFrame(ColorU clearColor = ColorU::transparentBlack());

    /// @brief End the current frame (finishes recording).
    void endFrame();

    /// @brief Execute the recorded frame on the renderer.
    void flush();

    /// @brief Create an immutable snapshot of current surface contents.
    /// @return Shared pointer to the snapshot Image, or nullptr for recording surfaces.
    std::shared_ptr<Image> makeSnapshot() const;

    /// @brief Direct pixel access (raster surfaces only).
    /// @return Pointer to the underlying Pixmap, or nullptr for recording surfaces.
    Pixmap* peekPixels();

    /// @copydoc peekPixels()
    const Pixmap* peekPixels() const;

    /// @brief Take ownership of the finished recording.
    /// @return Unique pointer to the Recording, or nullptr before endFrame().
    std::unique_ptr<Recording> takeRecording();

private:
    Surface(i32 w, i32 h, std::unique_ptr<Renderer> renderer, std::unique_ptr<Pixmap> pixmap);

    Vector2I size_;
    Device device_;
    std::unique_ptr<Canvas> canvas_;
    std::unique_ptr<Renderer> renderer_;
    std::unique_ptr<Pixmap> pixmap_;
};

} // namespace vellum
