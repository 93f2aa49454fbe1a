#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace fcopy::infra {

enum class ErrorCode {
    // Input validation
    InvalidInput,

    // Filesystem access
    FileNotFound,
    PermissionDenied,
    AlreadyExists,
    IoFailure,

    // Accounting
    ByteMismatch,

    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::error_code cause;
    std::string file;
    int line;
    std::string function;

    // Constructor capturing the call site automatically
    Error(ErrorCode c, std::string_view msg, std::error_code ec = {},
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , cause(ec)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto what() const -> const char*;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

/// Maps an OS error onto the error taxonomy. ENOENT, EACCES/EPERM and EEXIST
/// keep their own kinds, everything else is an IoFailure.
[[nodiscard]] auto code_from(const std::error_code& ec) -> ErrorCode;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Builds an error that keeps the OS cause; the kind is derived with code_from().
[[nodiscard]] auto make_error(
    const std::error_code& cause,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Logs the error with its origin and hands it back
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace fcopy::infra
