#pragma once

#include <string>
#include <utility>

namespace collager::core {

enum class ErrorCode {
    None,
    InvalidLayout,
    ImageNotFound,
    DecodeError,
    TraversalError,
    OutputError
};

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;

    void set(ErrorCode c, std::string m) {
        code = c;
        message = std::move(m);
    }

    [[nodiscard]] bool ok() const { return code == ErrorCode::None; }
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "none";
        case ErrorCode::InvalidLayout:
            return "invalid layout";
        case ErrorCode::ImageNotFound:
            return "image not found";
        case ErrorCode::DecodeError:
            return "decode error";
        case ErrorCode::TraversalError:
            return "traversal error";
        case ErrorCode::OutputError:
            return "output error";
    }
    return "unknown";
}

} // namespace collager::core
