#pragma once

/**
 * @file image_format.hpp
 * @brief Pixel layouts and interpolation modes of the generic image API.
 */

#include "vellum/types.hpp"

namespace vellum {

/// @brief Declared layout of caller-supplied pixel bytes.
enum class ImageFormat : u8 {
    Grayscale,     ///< 1 byte per pixel.
    Rgb,           ///< 3 bytes per pixel.
    RgbaSeparate,  ///< 4 bytes per pixel, straight (non-premultiplied) alpha.
    RgbaPremul     ///< 4 bytes per pixel, premultiplied alpha.
};

inline constexpr int bytesPerPixel(ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Grayscale: return 1;
        case ImageFormat::Rgb:       return 3;
        default:                     return 4;
    }
}

/// @brief Resampling used when an image is drawn scaled.
enum class InterpolationMode : u8 {
    NearestNeighbor,
    Bilinear
};

} // namespace vellum
