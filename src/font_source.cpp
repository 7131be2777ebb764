#include "vellum/font_source.hpp"
#include "vellum/font_matching.hpp"

namespace vellum {

const char* selectionErrorName(SelectionError err) {
    switch (err) {
        case SelectionError::Ok:                 return "Ok";
        case SelectionError::NotFound:           return "NotFound";
        case SelectionError::CannotAccessSource: return "CannotAccessSource";
    }
    return "Unknown";
}

const char* fontLoadingErrorName(FontLoadingError err) {
    switch (err) {
        case FontLoadingError::Ok:                     return "Ok";
        case FontLoadingError::UnknownFormat:          return "UnknownFormat";
        case FontLoadingError::NoSuchFontInCollection: return "NoSuchFontInCollection";
        case FontLoadingError::Parse:                  return "Parse";
        case FontLoadingError::Io:                     return "Io";
        case FontLoadingError::LibraryInit:            return "LibraryInit";
    }
    return "Unknown";
}

const char* defaultFamilyName(FamilyName::Kind kind) {
    switch (kind) {
        case FamilyName::Kind::Title:     return "";
        case FamilyName::Kind::Serif:     return "DejaVu Serif";
        case FamilyName::Kind::SansSerif: return "DejaVu Sans";
        case FamilyName::Kind::Monospace: return "DejaVu Sans Mono";
        case FamilyName::Kind::Cursive:   return "DejaVu Sans";
        case FamilyName::Kind::Fantasy:   return "DejaVu Sans";
    }
    return "";
}

SelectionError FontSource::selectFamilyByGenericName(const FamilyName& family,
                                                     FamilyHandle& out) const {
    if (family.kind == FamilyName::Kind::Title) {
        return selectFamilyByName(family.title, out);
    }
    return selectFamilyByName(defaultFamilyName(family.kind), out);
}

SelectionError FontSource::selectBestMatch(const std::vector<FamilyName>& families,
                                           const Properties& properties,
                                           FontHandle& out) const {
    for (const auto& name : families) {
        FamilyHandle family;
        if (selectFamilyByGenericName(name, family) != SelectionError::Ok) continue;

        std::vector<Properties> candidates;
        SelectionError err = selectDescriptionsInFamily(family, candidates);
        if (err != SelectionError::Ok) return err;

        size_t index = 0;
        if (findBestMatch(candidates, properties, index) == SelectionError::Ok) {
            out = family.fonts[index];
            return SelectionError::Ok;
        }
    }
    return SelectionError::NotFound;
}

SelectionError FontSource::selectDescriptionsInFamily(const FamilyHandle& family,
                                                      std::vector<Properties>& out) const {
    std::vector<Properties> props;
    props.reserve(family.fonts.size());
    for (const auto& handle : family.fonts) {
        FontDescription desc;
        if (describeFont(handle, desc) != FontLoadingError::Ok) {
            return SelectionError::CannotAccessSource;
        }
        props.push_back(desc.properties);
    }
    out = std::move(props);
    return SelectionError::Ok;
}

} // namespace vellum
