#include "error.hpp"
#include <cerrno>
#include <fmt/core.h>

namespace fcopy::infra {

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidInput:     return "invalid input";
        case ErrorCode::FileNotFound:     return "not found";
        case ErrorCode::PermissionDenied: return "permission denied";
        case ErrorCode::AlreadyExists:    return "already exists";
        case ErrorCode::IoFailure:        return "i/o failure";
        case ErrorCode::ByteMismatch:     return "byte mismatch";
        case ErrorCode::Unknown:          break;
    }
    return "unknown";
}

const char* Error::what() const {
    return message.c_str();
}

ErrorCode code_from(const std::error_code& ec) {
    if (!ec) return ErrorCode::Unknown;
    if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
        return ErrorCode::IoFailure;
    }
    switch (ec.value()) {
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::FileNotFound;
        case EACCES:
        case EPERM:
            return ErrorCode::PermissionDenied;
        case EEXIST:
            return ErrorCode::AlreadyExists;
        default:
            return ErrorCode::IoFailure;
    }
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, {}, loc};
}

Error make_error(const std::error_code& cause, std::string_view message,
                 const std::source_location& loc) {
    return Error{code_from(cause), message, cause, loc};
}

Error log_and_return(Error&& err) {
    spdlog::warn("{}", err.message);
    spdlog::debug("[{}:{} in {}] {} ({})",
        err.file, err.line, err.function,
        to_string(err.code), err.cause ? err.cause.message() : "no os error");
    return std::move(err);
}

} // namespace fcopy::infra
