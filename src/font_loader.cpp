#include "vellum/font_source.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <cstdio>
#include <memory>

namespace vellum {

namespace {

struct LibraryDeleter {
    void operator()(FT_Library lib) const { FT_Done_FreeType(lib); }
};
struct FaceDeleter {
    void operator()(FT_Face face) const { FT_Done_Face(face); }
};

using LibraryPtr = std::unique_ptr<FT_LibraryRec_, LibraryDeleter>;
using FacePtr = std::unique_ptr<FT_FaceRec_, FaceDeleter>;

// OS/2 usWidthClass 1..9 to CSS stretch.
constexpr f32 kWidthClassStretch[9] = {0.5f, 0.625f, 0.75f, 0.875f, 1.0f,
                                       1.125f, 1.25f, 1.5f, 2.0f};

// OS/2 fsSelection bit 9.
constexpr FT_UShort kFsSelectionOblique = 1 << 9;

FT_Error openFace(FT_Library lib, const FontHandle& handle, FT_Long index, FT_Face* face) {
    if (handle.kind == FontHandle::Kind::Path) {
        return FT_New_Face(lib, handle.path.c_str(), index, face);
    }
    if (!handle.bytes) return FT_Err_Invalid_Argument;
    return FT_New_Memory_Face(lib, handle.bytes->data(), FT_Long(handle.bytes->size()),
                              index, face);
}

FontLoadingError mapOpenError(const FontHandle& handle, FT_Error err) {
    switch (err) {
        case FT_Err_Unknown_File_Format:
            return FontLoadingError::UnknownFormat;
        case FT_Err_Cannot_Open_Resource:
            return handle.kind == FontHandle::Kind::Path ? FontLoadingError::Io
                                                         : FontLoadingError::Parse;
        default:
            return FontLoadingError::Parse;
    }
}

Properties readProperties(FT_Face face) {
    Properties props;
    props.weight = (face->style_flags & FT_STYLE_FLAG_BOLD) ? FontWeight::Bold : FontWeight::Normal;
    if (face->style_flags & FT_STYLE_FLAG_ITALIC) {
        props.style = FontStyle::Italic;
    }

    auto* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && os2->version != 0xFFFF) {
        if (os2->usWeightClass >= 1 && os2->usWeightClass <= 1000) {
            props.weight = f32(os2->usWeightClass);
        }
        if (os2->usWidthClass >= 1 && os2->usWidthClass <= 9) {
            props.stretch = kWidthClassStretch[os2->usWidthClass - 1];
        }
        if (os2->fsSelection & kFsSelectionOblique) {
            props.style = FontStyle::Oblique;
        }
    }
    return props;
}

} // namespace

FontLoadingError describeFont(const FontHandle& handle, FontDescription& out) {
    FT_Library rawLib = nullptr;
    if (FT_Init_FreeType(&rawLib) != 0) {
        std::fprintf(stderr, "vellum FontLoader: FreeType initialization failed\n");
        return FontLoadingError::LibraryInit;
    }
    LibraryPtr lib(rawLib);

    // A negative index only checks the format and reports the face count.
    FT_Face rawFace = nullptr;
    FT_Error err = openFace(lib.get(), handle, -1, &rawFace);
    if (err != 0) return mapOpenError(handle, err);
    FacePtr first(rawFace);
    if (FT_Long(handle.fontIndex) >= first->num_faces) {
        return FontLoadingError::NoSuchFontInCollection;
    }
    first.reset();

    rawFace = nullptr;
    err = openFace(lib.get(), handle, FT_Long(handle.fontIndex), &rawFace);
    if (err != 0) return mapOpenError(handle, err);
    FacePtr face(rawFace);

    FontDescription desc;
    desc.familyName = face->family_name ? face->family_name : "";
    const char* psName = FT_Get_Postscript_Name(face.get());
    desc.postscriptName = psName ? psName : "";
    desc.properties = readProperties(face.get());
    out = std::move(desc);
    return FontLoadingError::Ok;
}

} // namespace vellum
