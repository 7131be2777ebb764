#include "vellum/text.hpp"
#include "vellum/composite_font_source.hpp"

namespace vellum {

namespace {

Error noMetrics() {
    return {ErrorCode::NotSupported, "text layout metrics are not computed"};
}

} // namespace

// --- TextLayout ---

Error TextLayout::size(Size&) const { return noMetrics(); }
Error TextLayout::trailingWhitespaceWidth(f64&) const { return noMetrics(); }
Error TextLayout::imageBounds(Rect&) const { return noMetrics(); }
Error TextLayout::lineText(size_t, std::string&) const { return noMetrics(); }
Error TextLayout::lineMetric(size_t, LineMetric&) const { return noMetrics(); }
Error TextLayout::lineCount(size_t&) const { return noMetrics(); }
Error TextLayout::hitTestPoint(Point, HitTestPoint&) const { return noMetrics(); }
Error TextLayout::hitTestTextPosition(size_t, HitTestPosition&) const { return noMetrics(); }

// --- TextLayoutBuilder ---

Error TextLayoutBuilder::build(TextLayout& out) const {
    out = TextLayout(text_);
    return {};
}

// --- Text ---

Text::Text(std::shared_ptr<CompositeFontSource> fonts)
    : fonts_(std::move(fonts)) {
}

bool Text::fontFamily(const std::string& name, FontFamily& out) const {
    if (!fonts_) return false;
    FamilyHandle family;
    if (fonts_->selectFamilyByName(name, family) != SelectionError::Ok) return false;
    out = FontFamily::NewUnchecked(name);
    return true;
}

Error Text::loadFont(const u8* data, size_t len, FontFamily& out) {
    if (!fonts_) return {ErrorCode::BackendError, "no font source"};
    std::string family;
    Error err = fonts_->loadFont(data, len, family);
    if (!err.ok()) return err;
    out = FontFamily::NewUnchecked(std::move(family));
    return {};
}

TextLayoutBuilder Text::newTextLayout(std::string text) const {
    return TextLayoutBuilder(std::move(text));
}

} // namespace vellum
