#pragma once

/**
 * @file brush.hpp
 * @brief Colors, gradient descriptors and brushes of the generic drawing interface.
 */

#include "vellum/shape.hpp"
#include <memory>
#include <vector>

namespace vellum {

/// @brief A color stored as packed 0xRRGGBBAA.
class Color {
public:
    constexpr Color() = default;

    static constexpr Color rgba8(u8 r, u8 g, u8 b, u8 a) {
        return Color((u32(r) << 24) | (u32(g) << 16) | (u32(b) << 8) | u32(a));
    }
    static constexpr Color rgb8(u8 r, u8 g, u8 b) { return rgba8(r, g, b, 0xff); }
    static constexpr Color fromRgba32(u32 rgba) { return Color(rgba); }
    /// @brief Build from components in [0, 1]; values outside are clamped.
    static Color rgba(f64 r, f64 g, f64 b, f64 a);

    static constexpr Color black() { return rgb8(0, 0, 0); }
    static constexpr Color white() { return rgb8(0xff, 0xff, 0xff); }

    constexpr u32 toRgba32() const { return rgba_; }
    constexpr u8 r() const { return u8(rgba_ >> 24); }
    constexpr u8 g() const { return u8(rgba_ >> 16); }
    constexpr u8 b() const { return u8(rgba_ >> 8); }
    constexpr u8 a() const { return u8(rgba_); }

    /// @brief Same color with alpha multiplied by @p alpha.
    Color withAlpha(f64 alpha) const;

    constexpr bool operator==(Color o) const { return rgba_ == o.rgba_; }
    constexpr bool operator!=(Color o) const { return rgba_ != o.rgba_; }

private:
    constexpr explicit Color(u32 rgba) : rgba_(rgba) {}

    u32 rgba_ = 0x000000ff;
};

/// @brief A color at a position along a gradient ramp.
struct GradientStop {
    f32 pos = 0;
    Color color;
};

/// @brief Linear gradient in user-space coordinates.
struct FixedLinearGradient {
    Point start;
    Point end;
    std::vector<GradientStop> stops;
};

/// @brief Radial gradient in user-space coordinates.
struct FixedRadialGradient {
    Point center;
    Point originOffset;
    f64 radius = 0;
    std::vector<GradientStop> stops;
};

/// @brief A gradient descriptor, either linear or radial.
struct FixedGradient {
    enum class Kind : u8 { Linear, Radial };

    Kind kind = Kind::Linear;
    FixedLinearGradient linear;
    FixedRadialGradient radial;

    static FixedGradient Linear(FixedLinearGradient g) {
        FixedGradient f;
        f.kind = Kind::Linear;
        f.linear = std::move(g);
        return f;
    }
    static FixedGradient Radial(FixedRadialGradient g) {
        FixedGradient f;
        f.kind = Kind::Radial;
        f.radial = std::move(g);
        return f;
    }

    const std::vector<GradientStop>& stops() const {
        return kind == Kind::Linear ? linear.stops : radial.stops;
    }
};

/// @brief Fill or stroke descriptor: a solid color or a gradient.
///
/// Brushes are values; copying one shares the gradient descriptor.
class Brush {
public:
    enum class Kind : u8 { Solid, Gradient };

    static Brush Solid(u32 rgba) {
        Brush b;
        b.kind_ = Kind::Solid;
        b.rgba_ = rgba;
        return b;
    }

    static Brush Gradient(FixedGradient gradient) {
        Brush b;
        b.kind_ = Kind::Gradient;
        b.gradient_ = std::make_shared<const FixedGradient>(std::move(gradient));
        return b;
    }

    Kind kind() const { return kind_; }
    bool isSolid() const { return kind_ == Kind::Solid; }

    /// @brief Packed 0xRRGGBBAA color of a solid brush.
    u32 rgba() const { return rgba_; }

    /// @brief Gradient descriptor, or nullptr for solid brushes.
    const FixedGradient* gradient() const { return gradient_.get(); }

private:
    Kind kind_ = Kind::Solid;
    u32 rgba_ = 0x000000ff;
    std::shared_ptr<const FixedGradient> gradient_;
};

} // namespace vellum
