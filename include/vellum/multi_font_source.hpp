#pragma once

/**
 * @file multi_font_source.hpp
 * @brief Ordered combination of font providers.
 */

#include "vellum/font_source.hpp"
#include <memory>

namespace vellum {

/**
 * MultiFontSource - Queries a fixed list of providers in order.
 *
 * Selections return the first provider's success. Enumerations concatenate
 * every provider's results in order.
 */
class MultiFontSource : public FontSource {
public:
    MultiFontSource() = default;
    explicit MultiFontSource(std::vector<std::shared_ptr<FontSource>> sources);

    size_t sourceCount() const { return sources_.size(); }

    SelectionError allFonts(std::vector<FontHandle>& out) const override;
    SelectionError allFamilies(std::vector<std::string>& out) const override;
    SelectionError selectFamilyByName(std::string_view familyName,
                                      FamilyHandle& out) const override;
    SelectionError selectByPostscriptName(std::string_view postscriptName,
                                          FontHandle& out) const override;
    SelectionError selectFamilyByGenericName(const FamilyName& family,
                                             FamilyHandle& out) const override;
    SelectionError selectBestMatch(const std::vector<FamilyName>& families,
                                   const Properties& properties,
                                   FontHandle& out) const override;
    SelectionError selectDescriptionsInFamily(const FamilyHandle& family,
                                              std::vector<Properties>& out) const override;

private:
    std::vector<std::shared_ptr<FontSource>> sources_;
};

} // namespace vellum
