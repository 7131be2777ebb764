#include "vellum/mem_font_source.hpp"
#include <algorithm>

namespace vellum {

FontLoadingError MemFontSource::addFont(const FontHandle& handle, FontDescription* desc) {
    Entry entry;
    entry.handle = handle;
    FontLoadingError err = describeFont(handle, entry.desc);
    if (err != FontLoadingError::Ok) return err;

    if (desc) *desc = entry.desc;
    auto pos = std::upper_bound(entries_.begin(), entries_.end(), entry.desc.familyName,
                                [](const std::string& name, const Entry& e) {
                                    return name < e.desc.familyName;
                                });
    entries_.insert(pos, std::move(entry));
    return FontLoadingError::Ok;
}

SelectionError MemFontSource::allFonts(std::vector<FontHandle>& out) const {
    std::vector<FontHandle> handles;
    handles.reserve(entries_.size());
    for (const auto& e : entries_) handles.push_back(e.handle);
    out = std::move(handles);
    return SelectionError::Ok;
}

SelectionError MemFontSource::allFamilies(std::vector<std::string>& out) const {
    std::vector<std::string> names;
    for (const auto& e : entries_) {
        if (names.empty() || names.back() != e.desc.familyName) {
            names.push_back(e.desc.familyName);
        }
    }
    out = std::move(names);
    return SelectionError::Ok;
}

SelectionError MemFontSource::selectFamilyByName(std::string_view familyName,
                                                 FamilyHandle& out) const {
    FamilyHandle family;
    for (const auto& e : entries_) {
        if (e.desc.familyName == familyName) family.fonts.push_back(e.handle);
    }
    if (family.empty()) return SelectionError::NotFound;
    out = std::move(family);
    return SelectionError::Ok;
}

SelectionError MemFontSource::selectByPostscriptName(std::string_view postscriptName,
                                                     FontHandle& out) const {
    for (const auto& e : entries_) {
        if (e.desc.postscriptName == postscriptName) {
            out = e.handle;
            return SelectionError::Ok;
        }
    }
    return SelectionError::NotFound;
}

SelectionError MemFontSource::selectDescriptionsInFamily(const FamilyHandle& family,
                                                         std::vector<Properties>& out) const {
    std::vector<Properties> props;
    for (const auto& handle : family.fonts) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const Entry& e) { return e.handle == handle; });
        if (it == entries_.end()) return SelectionError::NotFound;
        props.push_back(it->desc.properties);
    }
    out = std::move(props);
    return SelectionError::Ok;
}

} // namespace vellum
