#include "vellum/recording.hpp"
#include "vellum/draw_op_visitor.hpp"
#include "vellum/image.hpp"

namespace vellum {

// --- DrawOpArena ---

DrawOpArena::DrawOpArena(size_t initialCapacity) {
    data_.reserve(initialCapacity);
}

u32 DrawOpArena::allocate(size_t bytes) {
    u32 offset = static_cast<u32>(data_.size());
    data_.resize(data_.size() + bytes);
    return offset;
}

u32 DrawOpArena::storeString(std::string_view str) {
    u32 offset = allocate(str.size() + 1);
    std::memcpy(data_.data() + offset, str.data(), str.size());
    data_[offset + str.size()] = '\0';
    return offset;
}

const char* DrawOpArena::getString(u32 offset) const {
    return reinterpret_cast<const char*>(data_.data() + offset);
}

void DrawOpArena::reset() {
    data_.clear();
}

// --- Recording ---

Recording::Recording(std::vector<CompactDrawOp> ops, DrawOpArena arena,
                     std::vector<Path2D> paths, std::vector<Pattern> patterns)
    : ops_(std::move(ops)), arena_(std::move(arena)),
      paths_(std::move(paths)), patterns_(std::move(patterns)) {
}

const Path2D* Recording::getPath(u32 index) const {
    if (index < paths_.size()) {
        return &paths_[index];
    }
    return nullptr;
}

const Pattern* Recording::getPattern(i32 index) const {
    if (index >= 0 && size_t(index) < patterns_.size()) {
        return &patterns_[size_t(index)];
    }
    return nullptr;
}

PaintRef Recording::resolvePaint(const CompactPaint& paint) const {
    PaintRef ref;
    ref.color = paint.color;
    ref.pattern = getPattern(paint.patternIndex);
    return ref;
}

void Recording::dispatchOp(const CompactDrawOp& op, DrawOpVisitor& visitor) const {
    switch (op.type) {
        case DrawOp::Type::Clear:
            visitor.visitClear(op.paint.color);
            break;
        case DrawOp::Type::FillRect:
            visitor.visitFillRect(op.data.rect.rect, resolvePaint(op.paint), op.transform);
            break;
        case DrawOp::Type::FillPath:
            if (const Path2D* path = getPath(op.data.path.pathIndex)) {
                visitor.visitFillPath(*path, op.fillRule, resolvePaint(op.paint), op.transform);
            }
            break;
        case DrawOp::Type::StrokePath:
            if (const Path2D* path = getPath(op.data.path.pathIndex)) {
                visitor.visitStrokePath(*path, op.width, resolvePaint(op.paint), op.transform);
            }
            break;
        case DrawOp::Type::ClipPath:
            if (const Path2D* path = getPath(op.data.path.pathIndex)) {
                visitor.visitClipPath(*path, op.fillRule, op.transform);
            }
            break;
        case DrawOp::Type::ResetClip:
            visitor.visitResetClip();
            break;
        case DrawOp::Type::Text:
            visitor.visitText(
                op.data.text.pos,
                std::string_view(arena_.getString(op.data.text.offset), op.data.text.len),
                arena_.getString(op.data.text.fontOffset),
                op.data.text.fontSize, resolvePaint(op.paint), op.transform);
            break;
        case DrawOp::Type::DrawImage:
            if (const Pattern* pattern = getPattern(op.paint.patternIndex)) {
                visitor.visitDrawImage(op.data.rect.rect, *pattern, op.transform);
            }
            break;
    }
}

void Recording::accept(DrawOpVisitor& visitor) const {
    for (const auto& op : ops_) {
        dispatchOp(op, visitor);
    }
}

// --- Recorder ---

void Recorder::reset() {
    ops_.clear();
    arena_.reset();
    paths_.clear();
    patterns_.clear();
}

CompactPaint Recorder::storePaint(const FillStyle& style) {
    CompactPaint paint;
    paint.color = style.color;
    if (style.kind == FillStyle::Kind::Pattern && style.pattern) {
        paint.patternIndex = static_cast<i32>(patterns_.size());
        patterns_.push_back(*style.pattern);
    }
    return paint;
}

u32 Recorder::storePath(Path2D path) {
    u32 index = static_cast<u32>(paths_.size());
    paths_.push_back(std::move(path));
    return index;
}

void Recorder::clear(ColorU c) {
    CompactDrawOp op{};
    op.type = DrawOp::Type::Clear;
    op.paint.color = c;
    ops_.push_back(op);
}

void Recorder::fillRect(RectF r, const FillStyle& style, const Transform2F& t) {
    CompactDrawOp op{};
    op.type = DrawOp::Type::FillRect;
    op.paint = storePaint(style);
    op.transform = t;
    op.data.rect.rect = r;
    ops_.push_back(op);
}

void Recorder::fillPath(Path2D path, FillRule rule, const FillStyle& style, const Transform2F& t) {
    CompactDrawOp op{};
    op.type = DrawOp::Type::FillPath;
    op.fillRule = rule;
    op.paint = storePaint(style);
    op.transform = t;
    op.data.path.pathIndex = storePath(std::move(path));
    ops_.push_back(op);
}

void Recorder::strokePath(Path2D path, f32 width, const FillStyle& style, const Transform2F& t) {
    CompactDrawOp op{};
    op.type = DrawOp::Type::StrokePath;
    op.paint = storePaint(style);
    op.width = width;
    op.transform = t;
    op.data.path.pathIndex = storePath(std::move(path));
    ops_.push_back(op);
}

void Recorder::clipPath(Path2D path, FillRule rule, const Transform2F& t) {
    CompactDrawOp op{};
    op.type = DrawOp::Type::ClipPath;
    op.fillRule = rule;
    op.transform = t;
    op.data.path.pathIndex = storePath(std::move(path));
    ops_.push_back(op);
}

void Recorder::resetClip() {
    CompactDrawOp op{};
    op.type = DrawOp::Type::ResetClip;
    ops_.push_back(op);
}

void Recorder::drawText(Vector2F p, std::string_view text, std::string_view font, f32 fontSize,
                        const FillStyle& style, const Transform2F& t) {
    CompactDrawOp op{};
    op.type = DrawOp::Type::Text;
    op.paint = storePaint(style);
    op.transform = t;
    op.data.text.pos = p;
    op.data.text.offset = arena_.storeString(text);
    op.data.text.len = static_cast<u32>(text.size());
    op.data.text.fontOffset = arena_.storeString(font);
    op.data.text.fontSize = fontSize;
    ops_.push_back(op);
}

void Recorder::drawImage(RectF dst, Pattern pattern, const Transform2F& t) {
    CompactDrawOp op{};
    op.type = DrawOp::Type::DrawImage;
    op.paint.patternIndex = static_cast<i32>(patterns_.size());
    op.transform = t;
    op.data.rect.rect = dst;
    patterns_.push_back(std::move(pattern));
    ops_.push_back(op);
}

std::unique_ptr<Recording> Recorder::finish() {
    auto recording = std::make_unique<Recording>(std::move(ops_), std::move(arena_),
                                                 std::move(paths_), std::move(patterns_));
    reset();
    return recording;
}

}
