#include "common/error.hpp"

#include <spdlog/fmt/fmt.h>

namespace kvmock {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::TypeMismatch:         return "TypeMismatch";
        case ErrorKind::InvalidArgument:      return "InvalidArgument";
        case ErrorKind::UnsupportedAggregate: return "UnsupportedAggregate";
        case ErrorKind::UnknownCommand:       return "UnknownCommand";
        case ErrorKind::Unimplemented:        return "Unimplemented";
        case ErrorKind::ResponseError:        return "ResponseError";
    }
    return "Unknown";
}

Error type_mismatch(std::string_view operation, std::string_view expected) {
    return Error{ErrorKind::TypeMismatch,
                 fmt::format("{} requires a {}", operation, expected)};
}

Error invalid_argument(const std::string& message) {
    return Error{ErrorKind::InvalidArgument, message};
}

Error response_error(const std::string& message) {
    return Error{ErrorKind::ResponseError, message};
}

} // namespace kvmock
