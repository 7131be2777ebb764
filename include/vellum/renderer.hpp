#pragma once

/**
 * @file renderer.hpp
 * @brief Abstract interface for renderers that consume a recorded scene.
 */

#include "vellum/types.hpp"
#include <memory>

namespace vellum {

class Recording;
class Image;

/**
 * @brief Abstract rendering interface.
 *
 * Implemented by renderers that execute recorded drawing commands. This
 * abstraction allows Surface to work with any rendering backend through a
 * unified interface.
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    /// @brief Begin a new frame, clearing the render target.
    /// @param clearColor The color to clear the render target to (default: transparent).
    virtual void beginFrame(ColorU clearColor = ColorU::transparentBlack()) = 0;

    /// @brief End the current frame.
    virtual void endFrame() = 0;

    /// @brief Execute recorded drawing commands in recording order.
    virtual void execute(const Recording& recording) = 0;

    /// @brief Resize the render target.
    virtual void resize(i32 w, i32 h) = 0;

    /// @brief Create an immutable snapshot of the current render target contents.
    virtual std::shared_ptr<Image> makeSnapshot() const = 0;
};

} // namespace vellum
