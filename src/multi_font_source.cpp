#include "vellum/multi_font_source.hpp"
#include <algorithm>

namespace vellum {

namespace {

// First provider that answers Ok wins.
template <typename Fn>
SelectionError firstSuccess(const std::vector<std::shared_ptr<FontSource>>& sources, Fn&& fn) {
    for (const auto& source : sources) {
        if (fn(*source) == SelectionError::Ok) return SelectionError::Ok;
    }
    return SelectionError::NotFound;
}

} // namespace

MultiFontSource::MultiFontSource(std::vector<std::shared_ptr<FontSource>> sources)
    : sources_(std::move(sources)) {
    sources_.erase(std::remove(sources_.begin(), sources_.end(), nullptr), sources_.end());
}

SelectionError MultiFontSource::allFonts(std::vector<FontHandle>& out) const {
    std::vector<FontHandle> all;
    for (const auto& source : sources_) {
        std::vector<FontHandle> fonts;
        SelectionError err = source->allFonts(fonts);
        if (err != SelectionError::Ok) return err;
        all.insert(all.end(), fonts.begin(), fonts.end());
    }
    out = std::move(all);
    return SelectionError::Ok;
}

SelectionError MultiFontSource::allFamilies(std::vector<std::string>& out) const {
    std::vector<std::string> all;
    for (const auto& source : sources_) {
        std::vector<std::string> families;
        SelectionError err = source->allFamilies(families);
        if (err != SelectionError::Ok) return err;
        all.insert(all.end(), families.begin(), families.end());
    }
    out = std::move(all);
    return SelectionError::Ok;
}

SelectionError MultiFontSource::selectFamilyByName(std::string_view familyName,
                                                   FamilyHandle& out) const {
    return firstSuccess(sources_, [&](const FontSource& s) {
        return s.selectFamilyByName(familyName, out);
    });
}

SelectionError MultiFontSource::selectByPostscriptName(std::string_view postscriptName,
                                                       FontHandle& out) const {
    return firstSuccess(sources_, [&](const FontSource& s) {
        return s.selectByPostscriptName(postscriptName, out);
    });
}

SelectionError MultiFontSource::selectFamilyByGenericName(const FamilyName& family,
                                                          FamilyHandle& out) const {
    return firstSuccess(sources_, [&](const FontSource& s) {
        return s.selectFamilyByGenericName(family, out);
    });
}

SelectionError MultiFontSource::selectBestMatch(const std::vector<FamilyName>& families,
                                                const Properties& properties,
                                                FontHandle& out) const {
    return firstSuccess(sources_, [&](const FontSource& s) {
        return s.selectBestMatch(families, properties, out);
    });
}

SelectionError MultiFontSource::selectDescriptionsInFamily(const FamilyHandle& family,
                                                           std::vector<Properties>& out) const {
    return firstSuccess(sources_, [&](const FontSource& s) {
        return s.selectDescriptionsInFamily(family, out);
    });
}

} // namespace vellum
