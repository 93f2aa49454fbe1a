#include "dir_walker.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fcopy::core {

namespace {

namespace stdfs = std::filesystem;

infra::VoidResult walk_(const stdfs::path& root,
                        const stdfs::path& relative,
                        std::vector<DirEntryInfo>& out)
{
    const auto dir = relative.empty() ? root : root / relative;

    std::error_code ec;
    stdfs::directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected(infra::make_error(ec,
            fmt::format("failure in reading directory '{}': {}", dir.string(), ec.message())));
    }

    const stdfs::directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        const auto rel = relative / entry.path().filename();

        const auto link_status = entry.symlink_status(ec);
        if (ec) {
            return std::unexpected(infra::make_error(ec,
                fmt::format("failure in reading metadata for '{}': {}",
                            entry.path().string(), ec.message())));
        }

        if (stdfs::is_directory(link_status)) {
            auto sub = walk_(root, rel, out);
            if (!sub) return sub;
        } else {
            // Size of what open() will see, i.e. the symlink target
            const auto status = entry.status(ec);
            if (ec) {
                return std::unexpected(infra::make_error(ec,
                    fmt::format("failure in reading metadata for '{}': {}",
                                entry.path().string(), ec.message())));
            }
            if (stdfs::is_regular_file(status)) {
                const auto size = entry.file_size(ec);
                if (ec) {
                    return std::unexpected(infra::make_error(ec,
                        fmt::format("failure in reading size of '{}': {}",
                                    entry.path().string(), ec.message())));
                }
                out.push_back(DirEntryInfo{.relative_path = rel.string(), .size = size});
            } else {
                spdlog::debug("Skipping non-regular file '{}'", entry.path().string());
            }
        }

        it.increment(ec);
        if (ec) {
            return std::unexpected(infra::make_error(ec,
                fmt::format("failure in reading directory entry in '{}': {}",
                            dir.string(), ec.message())));
        }
    }
    return {};
}

} // namespace

auto list_dir_recursive(const std::filesystem::path& root)
    -> infra::Result<std::vector<DirEntryInfo>>
{
    std::vector<DirEntryInfo> entries;
    auto walked = walk_(root, {}, entries);
    if (!walked) {
        return std::unexpected(std::move(walked.error()));
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirEntryInfo& a, const DirEntryInfo& b) {
                  return a.relative_path < b.relative_path;
              });
    return entries;
}

auto remove_dir_tree(const std::filesystem::path& root) -> infra::VoidResult {
    std::error_code ec;
    std::vector<stdfs::path> subdirs;
    {
        stdfs::directory_iterator it(root, ec);
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory) return {};
            return std::unexpected(infra::make_error(ec,
                fmt::format("failure in reading directory '{}': {}", root.string(), ec.message())));
        }
        const stdfs::directory_iterator end;
        while (it != end) {
            const auto link_status = it->symlink_status(ec);
            if (ec) {
                return std::unexpected(infra::make_error(ec,
                    fmt::format("failure in reading metadata for '{}': {}",
                                it->path().string(), ec.message())));
            }
            if (stdfs::is_directory(link_status)) {
                subdirs.push_back(it->path());
            }
            it.increment(ec);
            if (ec) {
                return std::unexpected(infra::make_error(ec,
                    fmt::format("failure in reading directory entry in '{}': {}",
                                root.string(), ec.message())));
            }
        }
    }

    for (const auto& subdir : subdirs) {
        auto removed = remove_dir_tree(subdir);
        if (!removed) return removed;
    }

    stdfs::remove(root, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(infra::make_error(ec,
            fmt::format("failure in removing directory '{}': {}", root.string(), ec.message())));
    }
    spdlog::debug("Removed directory '{}'", root.string());
    return {};
}

} // namespace fcopy::core
