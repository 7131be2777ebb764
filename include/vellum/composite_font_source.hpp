#pragma once

/**
 * @file composite_font_source.hpp
 * @brief In-memory fonts layered over external font providers.
 */

#include "vellum/error.hpp"
#include "vellum/mem_font_source.hpp"
#include "vellum/multi_font_source.hpp"
#include <memory>
#include <mutex>

namespace vellum {

/// @brief Error reported by CompositeFontSource::loadFont() for a loader failure.
Error fontLoadingToError(FontLoadingError err);

/**
 * CompositeFontSource - Runtime-loaded fonts in front of a fixed list of
 * external providers.
 *
 * Selections try the in-memory collection first and fall through to the
 * external providers, so a loaded font shadows an external family of the
 * same name. Enumerations return the external results followed by the
 * in-memory ones.
 *
 * Shared between threads through std::shared_ptr. The in-memory collection
 * is guarded by one mutex, held for a single call and never while an
 * external provider is queried.
 */
class CompositeFontSource : public FontSource {
public:
    explicit CompositeFontSource(std::vector<std::shared_ptr<FontSource>> external = {});

    /// @brief Composite over the installed system fonts.
    static std::shared_ptr<CompositeFontSource> MakeSystem();

    /**
     * @brief Register a font from shared bytes.
     *
     * @param family Receives the registered face's family name.
     * @return MissingFont when the face index is absent from the data,
     *         FontLoadingFailed for unrecognized or malformed data,
     *         BackendError with the loader's message otherwise.
     */
    Error loadFont(std::shared_ptr<const std::vector<u8>> bytes, std::string& family);

    /// @brief Register a font from a caller buffer; the bytes are copied.
    Error loadFont(const u8* data, size_t len, std::string& family);

    /// @brief Number of fonts registered at runtime.
    size_t loadedFontCount() const;

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
    mutable std::mutex memMutex_;
    MemFontSource mem_;
    MultiFontSource external_;
};

} // namespace vellum
