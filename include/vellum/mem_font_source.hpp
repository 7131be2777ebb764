#pragma once

/**
 * @file mem_font_source.hpp
 * @brief Font provider over fonts registered at runtime.
 */

#include "vellum/font_source.hpp"

namespace vellum {

/**
 * MemFontSource - An in-memory font collection.
 *
 * Faces are parsed once when added and kept sorted by family name. The
 * collection is not synchronized; owners that share it across threads
 * guard it themselves.
 */
class MemFontSource : public FontSource {
public:
    MemFontSource() = default;

    /// @brief Parse and register one face.
    /// @param desc Receives the face's names and properties; may be null.
    FontLoadingError addFont(const FontHandle& handle, FontDescription* desc = nullptr);

    /// @brief Number of registered faces.
    size_t size() const { return entries_.size(); }

    SelectionError allFonts(std::vector<FontHandle>& out) const override;
    SelectionError allFamilies(std::vector<std::string>& out) const override;
    SelectionError selectFamilyByName(std::string_view familyName,
                                      FamilyHandle& out) const override;
    SelectionError selectByPostscriptName(std::string_view postscriptName,
                                          FontHandle& out) const override;
    SelectionError selectDescriptionsInFamily(const FamilyHandle& family,
                                              std::vector<Properties>& out) const override;

private:
    struct Entry {
        FontHandle handle;
        FontDescription desc;
    };

    std::vector<Entry> entries_;
};

} // namespace vellum
