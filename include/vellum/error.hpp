#pragma once

/**
 * @file error.hpp
 * @brief Error taxonomy shared by the adapter, the image bridge and the font sources.
 */

#include <string>
#include <utility>

namespace vellum {

/// @brief Error kinds reported by fallible operations.
enum class ErrorCode {
    Ok,
    UnsupportedFormat,  ///< Pixel format or dimensions the backend cannot represent.
    InvalidInput,       ///< Arguments inconsistent with each other (e.g. buffer length).
    MissingFont,        ///< Requested face is not present in the font data.
    FontLoadingFailed,  ///< Font data is unrecognized or malformed.
    BackendError,       ///< Any other backend failure; detail carries the original message.
    NotSupported        ///< Operation is not implemented by this backend.
};

/// @brief Human-readable name of an error code.
const char* errorCodeName(ErrorCode code);

/// @brief Result of a fallible operation: a code and an optional detail message.
///
/// Fallible operations return Error and write their result through an
/// out-parameter. A default-constructed Error means success.
struct Error {
    ErrorCode code = ErrorCode::Ok;
    std::string detail;

    Error() = default;
    Error(ErrorCode c) : code(c) {}
    Error(ErrorCode c, std::string d) : code(c), detail(std::move(d)) {}

    bool ok() const { return code == ErrorCode::Ok; }
    explicit operator bool() const { return !ok(); }

    /// @brief "Name" or "Name: detail".
    std::string toString() const;
};

inline bool operator==(const Error& e, ErrorCode c) { return e.code == c; }
inline bool operator!=(const Error& e, ErrorCode c) { return e.code != c; }

} // namespace vellum
