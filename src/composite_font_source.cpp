#include "vellum/composite_font_source.hpp"
#include "vellum/system_font_source.hpp"
#include <cstdio>

namespace vellum {

Error fontLoadingToError(FontLoadingError err) {
    switch (err) {
        case FontLoadingError::Ok:
            return {};
        case FontLoadingError::NoSuchFontInCollection:
            return {ErrorCode::MissingFont};
        case FontLoadingError::UnknownFormat:
        case FontLoadingError::Parse:
            return {ErrorCode::FontLoadingFailed, fontLoadingErrorName(err)};
        default:
            return {ErrorCode::BackendError, fontLoadingErrorName(err)};
    }
}

CompositeFontSource::CompositeFontSource(std::vector<std::shared_ptr<FontSource>> external)
    : external_(std::move(external)) {
}

std::shared_ptr<CompositeFontSource> CompositeFontSource::MakeSystem() {
    std::vector<std::shared_ptr<FontSource>> sources;
    auto system = std::make_shared<SystemFontSource>();
    if (system->valid()) {
        sources.push_back(std::move(system));
    }
    return std::make_shared<CompositeFontSource>(std::move(sources));
}

Error CompositeFontSource::loadFont(std::shared_ptr<const std::vector<u8>> bytes,
                                    std::string& family) {
    if (!bytes || bytes->empty()) {
        return {ErrorCode::FontLoadingFailed, "empty font data"};
    }

    FontDescription desc;
    FontLoadingError err;
    {
        std::lock_guard<std::mutex> lock(memMutex_);
        err = mem_.addFont(FontHandle::FromMemory(std::move(bytes), 0), &desc);
    }
    if (err != FontLoadingError::Ok) {
        std::fprintf(stderr, "vellum CompositeFontSource: cannot load font (%s)\n",
                     fontLoadingErrorName(err));
        return fontLoadingToError(err);
    }
    family = desc.familyName;
    return {};
}

Error CompositeFontSource::loadFont(const u8* data, size_t len, std::string& family) {
    if (!data || len == 0) {
        return {ErrorCode::FontLoadingFailed, "empty font data"};
    }
    auto bytes = std::make_shared<const std::vector<u8>>(data, data + len);
    return loadFont(std::move(bytes), family);
}

size_t CompositeFontSource::loadedFontCount() const {
    std::lock_guard<std::mutex> lock(memMutex_);
    return mem_.size();
}

SelectionError CompositeFontSource::allFonts(std::vector<FontHandle>& out) const {
    std::vector<FontHandle> all;
    SelectionError err = external_.allFonts(all);
    if (err != SelectionError::Ok) return err;

    std::vector<FontHandle> loaded;
    {
        std::lock_guard<std::mutex> lock(memMutex_);
        err = mem_.allFonts(loaded);
    }
    if (err != SelectionError::Ok) return err;
    all.insert(all.end(), loaded.begin(), loaded.end());
    out = std::move(all);
    return SelectionError::Ok;
}

SelectionError CompositeFontSource::allFamilies(std::vector<std::string>& out) const {
    std::vector<std::string> all;
    SelectionError err = external_.allFamilies(all);
    if (err != SelectionError::Ok) return err;

    std::vector<std::string> loaded;
    {
        std::lock_guard<std::mutex> lock(memMutex_);
        err = mem_.allFamilies(loaded);
    }
    if (err != SelectionError::Ok) return err;
    all.insert(all.end(), loaded.begin(), loaded.end());
    out = std::move(all);
    return SelectionError::Ok;
}

SelectionError CompositeFontSource::selectFamilyByName(std::string_view familyName,
                                                       FamilyHandle& out) const {
    {
        std::lock_guard<std::mutex> lock(memMutex_);
        if (mem_.selectFamilyByName(familyName, out) == SelectionError::Ok) {
            return SelectionError::Ok;
        }
    }
    return external_.selectFamilyByName(familyName, out);
}

SelectionError CompositeFontSource::selectByPostscriptName(std::string_view postscriptName,
                                                           FontHandle& out) const {
    {
        std::lock_guard<std::mutex> lock(memMutex_);
        if (mem_.selectByPostscriptName(postscriptName, out) == SelectionError::Ok) {
            return SelectionError::Ok;
        }
    }
    return external_.selectByPostscriptName(postscriptName, out);
}

SelectionError CompositeFontSource::selectFamilyByGenericName(const FamilyName& family,
                                                              FamilyHandle& out) const {
    {
        std::lock_guard<std::mutex> lock(memMutex_);
        if (mem_.selectFamilyByGenericName(family, out) == SelectionError::Ok) {
            return SelectionError::Ok;
        }
    }
    return external_.selectFamilyByGenericName(family, out);
}

SelectionError CompositeFontSource::selectBestMatch(const std::vector<FamilyName>& families,
                                                    const Properties& properties,
                                                    FontHandle& out) const {
    {
        std::lock_guard<std::mutex> lock(memMutex_);
        if (mem_.selectBestMatch(families, properties, out) == SelectionError::Ok) {
            return SelectionError::Ok;
        }
    }
    return external_.selectBestMatch(families, properties, out);
}

SelectionError CompositeFontSource::selectDescriptionsInFamily(const FamilyHandle& family,
                                                               std::vector<Properties>& out) const {
    {
        std::lock_guard<std::mutex> lock(memMutex_);
        if (mem_.selectDescriptionsInFamily(family, out) == SelectionError::Ok) {
            return SelectionError::Ok;
        }
    }
    return external_.selectDescriptionsInFamily(family, out);
}

} // namespace vellum
