#include "vblobs/types.hpp"

namespace vblobs {

std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidPath: return "InvalidPath";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidOperation: return "InvalidOperation";
        case ErrorCode::NoParent: return "NoParent";
        default: return "Unknown";
    }
}

std::string Error::describe() const {
    if (ok()) {
        return "ok";
    }
    std::string text = ErrorCodeToString(code_) + ": " + message_;
    if (!cause_.empty()) {
        text += " (" + cause_ + ")";
    }
    return text;
}

} // namespace vblobs
