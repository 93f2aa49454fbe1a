#pragma once

#include <filesystem>
#include <sys/types.h>
#include "../infra/error_handler/error.hpp"

namespace fcopy::extensions {

/// Applies the permission bits `mode` (as read from the source) to `dst`.
[[nodiscard]] auto copy_permissions(mode_t mode, const std::filesystem::path& dst)
    -> infra::VoidResult;

} // namespace fcopy::extensions
