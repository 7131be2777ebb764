#pragma once

/**
 * @file font_source.hpp
 * @brief Font handles, properties and the abstract font provider interface.
 */

#include "vellum/types.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vellum {

/// @brief Outcome of a font selection.
enum class SelectionError {
    Ok,
    NotFound,           ///< No font matched.
    CannotAccessSource  ///< The provider itself failed (e.g. unreadable font data).
};

/// @brief Outcome of parsing font data.
enum class FontLoadingError {
    Ok,
    UnknownFormat,           ///< Data is not a recognized font format.
    NoSuchFontInCollection,  ///< Face index beyond the faces in the data.
    Parse,                   ///< Recognized format, malformed contents.
    Io,                      ///< Font file could not be read.
    LibraryInit              ///< The font library could not be initialized.
};

const char* selectionErrorName(SelectionError err);
const char* fontLoadingErrorName(FontLoadingError err);

/// @brief Reference to one face: a file path or shared in-memory bytes, plus a face index.
///
/// In-memory bytes are shared immutably between every copy of the handle.
struct FontHandle {
    enum class Kind : u8 { Path, Memory };

    Kind kind = Kind::Path;
    std::string path;
    std::shared_ptr<const std::vector<u8>> bytes;
    u32 fontIndex = 0;

    static FontHandle FromPath(std::string path, u32 index = 0) {
        FontHandle h;
        h.kind = Kind::Path;
        h.path = std::move(path);
        h.fontIndex = index;
        return h;
    }

    static FontHandle FromMemory(std::shared_ptr<const std::vector<u8>> bytes, u32 index = 0) {
        FontHandle h;
        h.kind = Kind::Memory;
        h.bytes = std::move(bytes);
        h.fontIndex = index;
        return h;
    }

    bool operator==(const FontHandle& o) const {
        return kind == o.kind && fontIndex == o.fontIndex &&
               (kind == Kind::Path ? path == o.path : bytes == o.bytes);
    }
    bool operator!=(const FontHandle& o) const { return !(*this == o); }
};

/// @brief All faces of one family.
struct FamilyHandle {
    std::vector<FontHandle> fonts;

    bool empty() const { return fonts.empty(); }
};

enum class FontStyle : u8 { Normal, Italic, Oblique };

/// @brief Standard font-weight values.
namespace FontWeight {
constexpr f32 Thin = 100;
constexpr f32 Light = 300;
constexpr f32 Normal = 400;
constexpr f32 Medium = 500;
constexpr f32 Bold = 700;
constexpr f32 Black = 900;
}

/// @brief Standard font-stretch values (1.0 is normal width).
namespace FontStretch {
constexpr f32 Condensed = 0.75f;
constexpr f32 Normal = 1.0f;
constexpr f32 Expanded = 1.25f;
}

/// @brief Style, weight and stretch of a face.
struct Properties {
    FontStyle style = FontStyle::Normal;
    f32 weight = FontWeight::Normal;
    f32 stretch = FontStretch::Normal;

    bool operator==(const Properties& o) const {
        return style == o.style && weight == o.weight && stretch == o.stretch;
    }
};

/// @brief A family requested by name, or one of the generic CSS families.
struct FamilyName {
    enum class Kind : u8 { Title, Serif, SansSerif, Monospace, Cursive, Fantasy };

    Kind kind = Kind::Title;
    std::string title;

    static FamilyName Title(std::string name) {
        FamilyName f;
        f.kind = Kind::Title;
        f.title = std::move(name);
        return f;
    }
    static FamilyName Generic(Kind k) {
        FamilyName f;
        f.kind = k;
        return f;
    }
};

/// @brief Default family looked up for a generic family; empty for Title.
const char* defaultFamilyName(FamilyName::Kind kind);

/// @brief Names and properties read from a face.
struct FontDescription {
    std::string familyName;
    std::string postscriptName;
    Properties properties;
};

/**
 * @brief Parse a face with FreeType and read its names and properties.
 *
 * Path handles are opened from disk; memory handles are parsed in place.
 */
FontLoadingError describeFont(const FontHandle& handle, FontDescription& out);

/**
 * FontSource - A provider of fonts: a directory, the system, an in-memory
 * collection, or a combination of providers.
 *
 * Every lookup writes its result through an out-parameter and returns
 * SelectionError::Ok on success. Lookups are const and may be called
 * from several threads at once.
 */
class FontSource {
public:
    virtual ~FontSource() = default;

    /// @brief Every face the provider knows.
    virtual SelectionError allFonts(std::vector<FontHandle>& out) const = 0;

    /// @brief Names of every family the provider knows.
    virtual SelectionError allFamilies(std::vector<std::string>& out) const = 0;

    virtual SelectionError selectFamilyByName(std::string_view familyName,
                                              FamilyHandle& out) const = 0;

    virtual SelectionError selectByPostscriptName(std::string_view postscriptName,
                                                  FontHandle& out) const = 0;

    /// @brief Resolve a family name.
    ///
    /// The base version looks up Title names directly and maps each generic
    /// family to a default family name (see defaultFamilyName()).
    virtual SelectionError selectFamilyByGenericName(const FamilyName& family,
                                                     FamilyHandle& out) const;

    /// @brief Best face for @p properties in the first of @p families that resolves.
    ///
    /// Candidates are ranked with the CSS font matching algorithm.
    virtual SelectionError selectBestMatch(const std::vector<FamilyName>& families,
                                           const Properties& properties,
                                           FontHandle& out) const;

    /// @brief Properties of each face in @p family, in the family's order.
    virtual SelectionError selectDescriptionsInFamily(const FamilyHandle& family,
                                                      std::vector<Properties>& out) const;
};

} // namespace vellum
