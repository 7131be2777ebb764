#pragma once

/// @file version.hpp
/// @brief Library version information.

#define VELLUM_VERSION_MAJOR 0
#define VELLUM_VERSION_MINOR 4
#define VELLUM_VERSION_PATCH 0

namespace vellum {

/// @brief Return the library version string (e.g. "0.4.0").
/// @return Null-terminated version string in "major.minor.patch" format.
inline const char* version() {
    return "0.4.0";
}

/// @brief Return the major version number.
inline int versionMajor() { return VELLUM_VERSION_MAJOR; }
/// @brief Return the minor version number.
inline int versionMinor() { return VELLUM_VERSION_MINOR; }
/// @brief Return the patch version number.
inline int versionPatch() { return VELLUM_VERSION_PATCH; }

} // namespace vellum
