#pragma once

/**
 * @file device.hpp
 * @brief Recording device that converts Canvas commands into low-level draw operations.
 */

#include "vellum/types.hpp"
#include "vellum/recording.hpp"
#include <memory>

namespace vellum {

/**
 * @brief The single recording device.
 *
 * Device converts Canvas commands, with their state already resolved, into
 * Recording ops. It always records and never draws directly. The actual
 * rendering is done by a Renderer that consumes the Recording.
 */
class Device {
public:
    Device() = default;
    ~Device() = default;

    /// @brief Begin recording a new frame (resets the recorder).
    void beginFrame();
    /// @brief End the current frame recording.
    void endFrame();

    /// @name Drawing commands
    /// @{
    void clear(ColorU c);
    void fillRect(RectF r, const FillStyle& style, const Transform2F& t);
    void fillPath(Path2D path, FillRule rule, const FillStyle& style, const Transform2F& t);
    void strokePath(Path2D path, f32 width, const FillStyle& style, const Transform2F& t);
    void drawText(Vector2F p, std::string_view text, std::string_view font, f32 fontSize,
                  const FillStyle& style, const Transform2F& t);
    void drawImage(RectF dst, Pattern pattern, const Transform2F& t);
    /// @}

    /// @brief Intersect the recorded clip with a path.
    void clipPath(Path2D path, FillRule rule, const Transform2F& t);

    /// @brief Clear every recorded clip path.
    void resetClip();

    /// @brief Number of operations recorded in the current frame.
    size_t pendingOpCount() const { return recorder_.opCount(); }

    /// @brief Finish recording and return the immutable Recording.
    /// @return Unique pointer to the completed Recording, or nullptr before endFrame().
    std::unique_ptr<Recording> finishRecording();

private:
    Recorder recorder_;
    std::unique_ptr<Recording> recording_;
};

}
