#pragma once

#include <cstdint>

/**
 * @file types.hpp
 * @brief Core type aliases and the single-precision geometry used by the backend canvas.
 */

namespace vellum {

using i32 = int32_t;   ///< Signed 32-bit integer.
using u32 = uint32_t;  ///< Unsigned 32-bit integer.
using u64 = uint64_t;  ///< Unsigned 64-bit integer.
using u16 = uint16_t;  ///< Unsigned 16-bit integer.
using u8 = uint8_t;    ///< Unsigned 8-bit integer.
using f32 = float;     ///< 32-bit floating point.
using f64 = double;    ///< 64-bit floating point.

/// @brief A 2D vector (or point) with single-precision coordinates.
struct Vector2F {
    f32 x = 0;  ///< X coordinate.
    f32 y = 0;  ///< Y coordinate.
};

/// @brief A 2D vector with integer coordinates, used for pixel dimensions.
struct Vector2I {
    i32 x = 0;  ///< X component.
    i32 y = 0;  ///< Y component.
};

/// @brief An axis-aligned rectangle defined by origin and size.
struct RectF {
    f32 x = 0;  ///< Left edge X coordinate.
    f32 y = 0;  ///< Top edge Y coordinate.
    f32 w = 0;  ///< Width.
    f32 h = 0;  ///< Height.

    /// @brief Construct from an origin and a size vector.
    static RectF Make(Vector2F origin, Vector2F size) { return {origin.x, origin.y, size.x, size.y}; }

    Vector2F origin() const { return {x, y}; }
    Vector2F size() const { return {w, h}; }
    f32 right() const { return x + w; }
    f32 bottom() const { return y + h; }
};

/// @brief An RGBA color with 8-bit components.
struct ColorU {
    u8 r = 0;    ///< Red component (0–255).
    u8 g = 0;    ///< Green component (0–255).
    u8 b = 0;    ///< Blue component (0–255).
    u8 a = 255;  ///< Alpha component (0–255), default opaque.

    /// @brief Unpack a color stored as 0xRRGGBBAA.
    static ColorU FromU32(u32 rgba) {
        return {u8(rgba >> 24), u8(rgba >> 16), u8(rgba >> 8), u8(rgba)};
    }

    /// @brief Pack the color as 0xRRGGBBAA.
    u32 toU32() const {
        return (u32(r) << 24) | (u32(g) << 16) | (u32(b) << 8) | u32(a);
    }

    static ColorU transparentBlack() { return {0, 0, 0, 0}; }
};

/**
 * @brief 2D affine transform in row-major layout.
 *
 * Maps a point p to (m11*x + m12*y + tx, m21*x + m22*y + ty).
 */
struct Transform2F {
    f32 m11 = 1, m12 = 0;  ///< First matrix row.
    f32 m21 = 0, m22 = 1;  ///< Second matrix row.
    Vector2F vector;       ///< Translation.

    /// @brief Build a transform from its row-major coefficients.
    static Transform2F RowMajor(f32 m11, f32 m12, f32 m21, f32 m22, f32 tx, f32 ty) {
        Transform2F t;
        t.m11 = m11; t.m12 = m12;
        t.m21 = m21; t.m22 = m22;
        t.vector = {tx, ty};
        return t;
    }

    static Transform2F Translation(Vector2F v) { return RowMajor(1, 0, 0, 1, v.x, v.y); }
    static Transform2F Scale(Vector2F s) { return RowMajor(s.x, 0, 0, s.y, 0, 0); }

    bool isIdentity() const {
        return m11 == 1 && m12 == 0 && m21 == 0 && m22 == 1 && vector.x == 0 && vector.y == 0;
    }

    /// @brief Apply the transform to a point.
    Vector2F apply(Vector2F p) const {
        return {m11 * p.x + m12 * p.y + vector.x, m21 * p.x + m22 * p.y + vector.y};
    }

    /// @brief Compose: the result applies @p other first, then this transform.
    Transform2F operator*(const Transform2F& other) const {
        return RowMajor(m11 * other.m11 + m12 * other.m21,
                        m11 * other.m12 + m12 * other.m22,
                        m21 * other.m11 + m22 * other.m21,
                        m21 * other.m12 + m22 * other.m22,
                        m11 * other.vector.x + m12 * other.vector.y + vector.x,
                        m21 * other.vector.x + m22 * other.vector.y + vector.y);
    }

    f32 determinant() const { return m11 * m22 - m12 * m21; }

    /// @brief Invert the transform.
    /// @param out Receives the inverse.
    /// @return False if the matrix is singular.
    bool invert(Transform2F* out) const {
        f32 det = determinant();
        if (det == 0) return false;
        f32 inv = 1.0f / det;
        f32 a = m22 * inv, b = -m12 * inv;
        f32 c = -m21 * inv, d = m11 * inv;
        *out = RowMajor(a, b, c, d,
                        -(a * vector.x + b * vector.y),
                        -(c * vector.x + d * vector.y));
        return true;
    }
};

}
