#pragma once

/**
 * @file recording.hpp
 * @brief Draw operation types, arena allocator, recording, and recorder.
 */

#include "vellum/types.hpp"
#include "vellum/paint.hpp"
#include "vellum/path2d.hpp"
#include <string_view>
#include <vector>
#include <memory>
#include <cstring>

namespace vellum {

// Forward declarations
class DrawOpVisitor;

/// @brief Draw operation type tag.
struct DrawOp {
    /// @brief Operation type enumeration.
    enum class Type : u8 {
        Clear,       ///< Replace the whole target with a color.
        FillRect,    ///< Fill a rectangle.
        FillPath,    ///< Fill a path with a fill rule.
        StrokePath,  ///< Stroke a path outline.
        ClipPath,    ///< Intersect the clip with a path interior.
        ResetClip,   ///< Remove all clip paths.
        Text,        ///< Draw text.
        DrawImage    ///< Paint an image pattern into a rectangle.
    };
};

/// @brief Arena allocator for variable-length DrawOp data (strings).
class DrawOpArena {
public:
    /// @brief Construct an arena with the given initial capacity.
    explicit DrawOpArena(size_t initialCapacity = 4096);

    /// @brief Allocate raw storage.
    /// @return Byte offset into the arena.
    u32 allocate(size_t bytes);

    /// @brief Store a string in the arena.
    /// @return Byte offset to the stored, null-terminated string.
    u32 storeString(std::string_view str);

    /// @brief Retrieve a stored string by offset.
    const char* getString(u32 offset) const;

    /// @brief Reset the arena, discarding all stored data.
    void reset();

private:
    std::vector<u8> data_;
};

/// @brief Compact paint reference: a color, or an index into the recording's patterns.
struct CompactPaint {
    ColorU color;           ///< Solid color (ignored when patternIndex >= 0).
    i32 patternIndex = -1;  ///< Pattern index or -1.
};

/// @brief Compact draw operation structure.
struct CompactDrawOp {
    DrawOp::Type type;      ///< Operation type.
    FillRule fillRule;      ///< Fill rule for FillPath/ClipPath.
    u8 padding[2];          ///< Alignment padding.
    CompactPaint paint;     ///< Fill or stroke paint.
    f32 width;              ///< Stroke width.
    Transform2F transform;  ///< Canvas transform at record time.

    /// @brief Union of per-operation data variants.
    union Data {
        struct { RectF rect; } rect;                                    ///< FillRect / DrawImage destination.
        struct { u32 pathIndex; } path;                                 ///< Path ops (index into paths).
        struct { Vector2F pos; u32 offset; u32 len;
                 u32 fontOffset; f32 fontSize; } text;                  ///< Text data.

        Data() : rect{{}} {}
    } data;                 ///< Per-operation payload.
};

/// @brief Resolved paint handed to visitors.
struct PaintRef {
    ColorU color;                     ///< Solid color.
    const Pattern* pattern = nullptr; ///< Non-null for pattern paints.
};

/// @brief Immutable command buffer containing recorded draw operations (the scene).
///
/// Created by Recorder::finish(). Operations are traversed in recording
/// order via accept().
class Recording {
public:
    Recording(std::vector<CompactDrawOp> ops, DrawOpArena arena,
              std::vector<Path2D> paths, std::vector<Pattern> patterns);

    const std::vector<CompactDrawOp>& ops() const { return ops_; }
    const DrawOpArena& arena() const { return arena_; }
    const std::vector<Path2D>& paths() const { return paths_; }
    const std::vector<Pattern>& patterns() const { return patterns_; }

    /// @brief Get a path by index, or nullptr if out of range.
    const Path2D* getPath(u32 index) const;

    /// @brief Get a pattern by index, or nullptr if out of range.
    const Pattern* getPattern(i32 index) const;

    /// @brief Traverse operations in original recording order.
    void accept(DrawOpVisitor& visitor) const;

private:
    void dispatchOp(const CompactDrawOp& op, DrawOpVisitor& visitor) const;
    PaintRef resolvePaint(const CompactPaint& paint) const;

    std::vector<CompactDrawOp> ops_;
    DrawOpArena arena_;
    std::vector<Path2D> paths_;
    std::vector<Pattern> patterns_;
};

/// @brief Records draw operations into a compact command buffer.
///
/// Call drawing methods to accumulate operations, then finish() to produce
/// an immutable Recording.
class Recorder {
public:
    /// @brief Reset the recorder, discarding all accumulated operations.
    void reset();

    void clear(ColorU c);
    void fillRect(RectF r, const FillStyle& style, const Transform2F& t);
    void fillPath(Path2D path, FillRule rule, const FillStyle& style, const Transform2F& t);
    void strokePath(Path2D path, f32 width, const FillStyle& style, const Transform2F& t);
    void clipPath(Path2D path, FillRule rule, const Transform2F& t);
    void resetClip();
    void drawText(Vector2F p, std::string_view text, std::string_view font, f32 fontSize,
                  const FillStyle& style, const Transform2F& t);
    void drawImage(RectF dst, Pattern pattern, const Transform2F& t);

    /// @brief Number of operations recorded so far.
    size_t opCount() const { return ops_.size(); }

    /// @brief Finish recording and produce an immutable Recording.
    std::unique_ptr<Recording> finish();

private:
    CompactPaint storePaint(const FillStyle& style);
    u32 storePath(Path2D path);

    std::vector<CompactDrawOp> ops_;
    DrawOpArena arena_;
    std::vector<Path2D> paths_;
    std::vector<Pattern> patterns_;
};

}
