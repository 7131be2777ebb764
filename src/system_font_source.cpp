#include "vellum/system_font_source.hpp"

#include <fontconfig/fontconfig.h>

#include <algorithm>
#include <cstdio>
#include <memory>
#include <string>

namespace vellum {

namespace {

struct PatternDeleter {
    void operator()(FcPattern* p) const { FcPatternDestroy(p); }
};
struct ObjectSetDeleter {
    void operator()(FcObjectSet* s) const { FcObjectSetDestroy(s); }
};
struct FontSetDeleter {
    void operator()(FcFontSet* s) const { FcFontSetDestroy(s); }
};

using PatternPtr = std::unique_ptr<FcPattern, PatternDeleter>;
using ObjectSetPtr = std::unique_ptr<FcObjectSet, ObjectSetDeleter>;
using FontSetPtr = std::unique_ptr<FcFontSet, FontSetDeleter>;

const FcChar8* fcString(const std::string& s) {
    return reinterpret_cast<const FcChar8*>(s.c_str());
}

const char* genericFamilyName(FamilyName::Kind kind) {
    switch (kind) {
        case FamilyName::Kind::Serif:     return "serif";
        case FamilyName::Kind::SansSerif: return "sans-serif";
        case FamilyName::Kind::Monospace: return "monospace";
        case FamilyName::Kind::Cursive:   return "cursive";
        case FamilyName::Kind::Fantasy:   return "fantasy";
        case FamilyName::Kind::Title:     break;
    }
    return nullptr;
}

// List outline fonts matching @p pattern as handles, in fontconfig order.
void listHandles(FcConfig* config, FcPattern* pattern, std::vector<FontHandle>& out) {
    FcPatternAddBool(pattern, FC_OUTLINE, FcTrue);
    ObjectSetPtr objects(FcObjectSetBuild(FC_FILE, FC_INDEX, nullptr));
    FontSetPtr set(FcFontList(config, pattern, objects.get()));
    if (!set) return;

    for (int i = 0; i < set->nfont; ++i) {
        FcChar8* file = nullptr;
        int index = 0;
        if (FcPatternGetString(set->fonts[i], FC_FILE, 0, &file) != FcResultMatch) continue;
        FcPatternGetInteger(set->fonts[i], FC_INDEX, 0, &index);
        out.push_back(FontHandle::FromPath(reinterpret_cast<const char*>(file), u32(index)));
    }
}

} // namespace

SystemFontSource::SystemFontSource()
    : config_(FcInitLoadConfigAndFonts()) {
    if (!config_) {
        std::fprintf(stderr, "vellum SystemFontSource: fontconfig initialization failed\n");
    }
}

SystemFontSource::~SystemFontSource() {
    if (config_) FcConfigDestroy(config_);
}

SelectionError SystemFontSource::allFonts(std::vector<FontHandle>& out) const {
    if (!config_) return SelectionError::CannotAccessSource;
    std::lock_guard<std::mutex> lock(mutex_);

    PatternPtr pattern(FcPatternCreate());
    std::vector<FontHandle> handles;
    listHandles(config_, pattern.get(), handles);
    out = std::move(handles);
    return SelectionError::Ok;
}

SelectionError SystemFontSource::allFamilies(std::vector<std::string>& out) const {
    if (!config_) return SelectionError::CannotAccessSource;
    std::lock_guard<std::mutex> lock(mutex_);

    PatternPtr pattern(FcPatternCreate());
    FcPatternAddBool(pattern.get(), FC_OUTLINE, FcTrue);
    ObjectSetPtr objects(FcObjectSetBuild(FC_FAMILY, nullptr));
    FontSetPtr set(FcFontList(config_, pattern.get(), objects.get()));
    if (!set) return SelectionError::CannotAccessSource;

    std::vector<std::string> names;
    for (int i = 0; i < set->nfont; ++i) {
        FcChar8* family = nullptr;
        if (FcPatternGetString(set->fonts[i], FC_FAMILY, 0, &family) == FcResultMatch) {
            names.emplace_back(reinterpret_cast<const char*>(family));
        }
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    out = std::move(names);
    return SelectionError::Ok;
}

SelectionError SystemFontSource::selectFamilyByName(std::string_view familyName,
                                                    FamilyHandle& out) const {
    if (!config_) return SelectionError::CannotAccessSource;
    std::lock_guard<std::mutex> lock(mutex_);

    std::string name(familyName);
    PatternPtr pattern(FcPatternCreate());
    FcPatternAddString(pattern.get(), FC_FAMILY, fcString(name));

    FamilyHandle family;
    listHandles(config_, pattern.get(), family.fonts);
    if (family.empty()) return SelectionError::NotFound;
    out = std::move(family);
    return SelectionError::Ok;
}

SelectionError SystemFontSource::selectByPostscriptName(std::string_view postscriptName,
                                                        FontHandle& out) const {
    if (!config_) return SelectionError::CannotAccessSource;
    std::lock_guard<std::mutex> lock(mutex_);

    std::string name(postscriptName);
    PatternPtr pattern(FcPatternCreate());
    FcPatternAddString(pattern.get(), FC_POSTSCRIPT_NAME, fcString(name));

    std::vector<FontHandle> handles;
    listHandles(config_, pattern.get(), handles);
    if (handles.empty()) return SelectionError::NotFound;
    out = handles.front();
    return SelectionError::Ok;
}

SelectionError SystemFontSource::selectFamilyByGenericName(const FamilyName& family,
                                                           FamilyHandle& out) const {
    const char* generic = genericFamilyName(family.kind);
    if (!generic) return selectFamilyByName(family.title, out);
    if (!config_) return SelectionError::CannotAccessSource;

    std::string resolved;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PatternPtr pattern(FcNameParse(reinterpret_cast<const FcChar8*>(generic)));
        if (!pattern) return SelectionError::NotFound;
        FcConfigSubstitute(config_, pattern.get(), FcMatchPattern);
        FcDefaultSubstitute(pattern.get());

        FcResult result = FcResultNoMatch;
        PatternPtr match(FcFontMatch(config_, pattern.get(), &result));
        FcChar8* name = nullptr;
        if (!match || FcPatternGetString(match.get(), FC_FAMILY, 0, &name) != FcResultMatch) {
            return SelectionError::NotFound;
        }
        resolved = reinterpret_cast<const char*>(name);
    }
    return selectFamilyByName(resolved, out);
}

} // namespace vellum
