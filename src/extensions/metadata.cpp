#include <filesystem>
#include <fmt/core.h>
#include "metadata.hpp"

namespace fcopy::extensions {

infra::VoidResult copy_permissions(mode_t mode, const std::filesystem::path& dst) {
    std::error_code ec;
    const auto perms = static_cast<std::filesystem::perms>(mode & 07777);
    std::filesystem::permissions(dst, perms, std::filesystem::perm_options::replace, ec);
    if (ec) {
        return std::unexpected(infra::make_error(ec,
            fmt::format("failure in setting permissions on '{}': {}", dst.string(), ec.message())));
    }
    return {};
}

} // namespace fcopy::extensions
