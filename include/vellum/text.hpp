#pragma once

/**
 * @file text.hpp
 * @brief Text factory, layout builder and layout of the generic drawing interface.
 *
 * Layouts keep their text but compute no metrics. Every metric and
 * hit-testing query returns ErrorCode::NotSupported, and hasMetrics()
 * lets callers check up front.
 */

#include "vellum/brush.hpp"
#include "vellum/error.hpp"
#include "vellum/font_source.hpp"
#include "vellum/shape.hpp"
#include <memory>
#include <string>

namespace vellum {

class CompositeFontSource;

/// @brief A font family name accepted by the text factory.
class FontFamily {
public:
    FontFamily() : name_("sans-serif") {}

    /// @brief Family with @p name, without checking that it resolves.
    static FontFamily NewUnchecked(std::string name) { return FontFamily(std::move(name)); }

    static FontFamily SansSerif() { return FontFamily("sans-serif"); }
    static FontFamily Serif() { return FontFamily("serif"); }
    static FontFamily Monospace() { return FontFamily("monospace"); }
    static FontFamily SystemUi() { return FontFamily("system-ui"); }

    const std::string& name() const { return name_; }

    bool operator==(const FontFamily& o) const { return name_ == o.name_; }
    bool operator!=(const FontFamily& o) const { return name_ != o.name_; }

private:
    explicit FontFamily(std::string name) : name_(std::move(name)) {}

    std::string name_;
};

enum class TextAlignment : u8 { Start, End, Center, Justified };

/// @brief A styling attribute for a run of text.
struct TextAttribute {
    enum class Kind : u8 { FontFamily, FontSize, Weight, TextColor, Style, Underline, Strikethrough };

    Kind kind = Kind::FontSize;
    FontFamily family;
    f64 size = 0;
    f32 weight = FontWeight::Normal;
    Color color;
    FontStyle style = FontStyle::Normal;
    bool flag = false;

    static TextAttribute Family(FontFamily f) { TextAttribute a; a.kind = Kind::FontFamily; a.family = std::move(f); return a; }
    static TextAttribute FontSize(f64 s) { TextAttribute a; a.kind = Kind::FontSize; a.size = s; return a; }
    static TextAttribute Weight(f32 w) { TextAttribute a; a.kind = Kind::Weight; a.weight = w; return a; }
    static TextAttribute TextColor(Color c) { TextAttribute a; a.kind = Kind::TextColor; a.color = c; return a; }
    static TextAttribute Style(FontStyle s) { TextAttribute a; a.kind = Kind::Style; a.style = s; return a; }
    static TextAttribute Underline(bool on) { TextAttribute a; a.kind = Kind::Underline; a.flag = on; return a; }
    static TextAttribute Strikethrough(bool on) { TextAttribute a; a.kind = Kind::Strikethrough; a.flag = on; return a; }
};

/// @brief Metrics of one laid-out line.
struct LineMetric {
    size_t startOffset = 0;
    size_t endOffset = 0;
    size_t trailingWhitespace = 0;
    f64 baseline = 0;
    f64 height = 0;
    f64 yOffset = 0;
};

/// @brief Result of hit-testing a point against a layout.
struct HitTestPoint {
    size_t idx = 0;
    bool isInside = false;
};

/// @brief Result of locating a text position in a layout.
struct HitTestPosition {
    Point point;
    size_t line = 0;
};

/// @brief Laid-out text. Holds the builder's text; metrics are not computed.
class TextLayout {
public:
    TextLayout() : text_(std::make_shared<const std::string>()) {}

    /// @brief Exactly the text given to the builder.
    const std::string& text() const { return *text_; }

    /// @brief Whether the metric queries below produce values.
    bool hasMetrics() const { return false; }

    Error size(Size& out) const;
    Error trailingWhitespaceWidth(f64& out) const;
    Error imageBounds(Rect& out) const;
    Error lineText(size_t line, std::string& out) const;
    Error lineMetric(size_t line, LineMetric& out) const;
    Error lineCount(size_t& out) const;
    Error hitTestPoint(Point point, HitTestPoint& out) const;
    Error hitTestTextPosition(size_t idx, HitTestPosition& out) const;

private:
    friend class TextLayoutBuilder;
    explicit TextLayout(std::shared_ptr<const std::string> text) : text_(std::move(text)) {}

    std::shared_ptr<const std::string> text_;
};

/// @brief Collects layout options. Options are accepted but do not affect the layout.
class TextLayoutBuilder {
public:
    explicit TextLayoutBuilder(std::string text)
        : text_(std::make_shared<const std::string>(std::move(text))) {}

    TextLayoutBuilder& maxWidth(f64) { return *this; }
    TextLayoutBuilder& alignment(TextAlignment) { return *this; }
    TextLayoutBuilder& defaultAttribute(const TextAttribute&) { return *this; }
    TextLayoutBuilder& rangeAttribute(size_t, size_t, const TextAttribute&) { return *this; }

    /// @brief Produce the layout. Always succeeds.
    Error build(TextLayout& out) const;

private:
    std::shared_ptr<const std::string> text_;
};

/// @brief Text factory bound to a shared font source.
class Text {
public:
    explicit Text(std::shared_ptr<CompositeFontSource> fonts);

    /// @brief Look up a family by name.
    /// @return False if no provider knows the family.
    bool fontFamily(const std::string& name, FontFamily& out) const;

    /// @brief Register font bytes and return the family they declare.
    Error loadFont(const u8* data, size_t len, FontFamily& out);

    TextLayoutBuilder newTextLayout(std::string text) const;

    const std::shared_ptr<CompositeFontSource>& fontSource() const { return fonts_; }

private:
    std::shared_ptr<CompositeFontSource> fonts_;
};

} // namespace vellum
