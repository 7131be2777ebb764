#include "vellum/error.hpp"

namespace vellum {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                return "Ok";
        case ErrorCode::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorCode::InvalidInput:      return "InvalidInput";
        case ErrorCode::MissingFont:       return "MissingFont";
        case ErrorCode::FontLoadingFailed: return "FontLoadingFailed";
        case ErrorCode::BackendError:      return "BackendError";
        case ErrorCode::NotSupported:      return "NotSupported";
    }
    return "Unknown";
}

std::string Error::toString() const {
    std::string s = errorCodeName(code);
    if (!detail.empty()) {
        s += ": ";
        s += detail;
    }
    return s;
}

} // namespace vellum
