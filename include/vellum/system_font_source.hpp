#pragma once

/**
 * @file system_font_source.hpp
 * @brief Font provider over the fonts installed on the system (fontconfig).
 */

#include "vellum/font_source.hpp"
#include <mutex>

struct _FcConfig;

namespace vellum {

/**
 * SystemFontSource - Installed fonts, as listed by fontconfig.
 *
 * Generic families (serif, sans-serif, ...) are resolved through the
 * fontconfig substitution rules. Calls into fontconfig are serialized
 * internally, so one instance may be shared between threads.
 */
class SystemFontSource : public FontSource {
public:
    SystemFontSource();
    ~SystemFontSource() override;

    SystemFontSource(const SystemFontSource&) = delete;
    SystemFontSource& operator=(const SystemFontSource&) = delete;

    /// @brief False if fontconfig could not load its configuration.
    bool valid() const { return config_ != nullptr; }

    SelectionError allFonts(std::vector<FontHandle>& out) const override;
    SelectionError allFamilies(std::vector<std::string>& out) const override;
    SelectionError selectFamilyByName(std::string_view familyName,
                                      FamilyHandle& out) const override;
    SelectionError selectByPostscriptName(std::string_view postscriptName,
                                          FontHandle& out) const override;
    SelectionError selectFamilyByGenericName(const FamilyName& family,
                                             FamilyHandle& out) const override;

private:
    _FcConfig* config_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace vellum
