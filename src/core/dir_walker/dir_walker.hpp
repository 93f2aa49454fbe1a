#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace fcopy::core {

struct DirEntryInfo {
    std::string relative_path;
    std::uint64_t size = 0;
};

/// Lists every non-directory entry below `root`, recursively, with paths
/// relative to `root`. Directories themselves are not listed. The result is
/// sorted by relative path.
///
/// Any directory that cannot be read, or entry whose metadata cannot be read,
/// fails the whole walk; no partial listing is returned.
[[nodiscard]] auto list_dir_recursive(const std::filesystem::path& root)
    -> infra::Result<std::vector<DirEntryInfo>>;

/// Removes the directory tree at `root` bottom-up. Only directories are
/// removed, so any file still inside makes the removal fail. A directory that
/// is already gone is not an error.
[[nodiscard]] auto remove_dir_tree(const std::filesystem::path& root) -> infra::VoidResult;

} // namespace fcopy::core
