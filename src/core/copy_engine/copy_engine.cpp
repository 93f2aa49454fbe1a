#include "copy_engine.hpp"
#include <algorithm>
#include <chrono>
#include <optional>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"
#include "../../extensions/metadata.hpp"
#include "../../infra/units/units.hpp"
#include "../dir_walker/dir_walker.hpp"

namespace fcopy::core {

namespace {

// Name the source keeps inside an existing destination directory.
// Empty for paths without a usable last component ("/", ".", "..").
std::filesystem::path basename_of(const std::filesystem::path& p) {
    const auto path = p.has_filename() ? p : p.parent_path();
    auto name = path.filename();
    if (name == "." || name == "..") {
        return {};
    }
    return name;
}

bool is_absent(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

} // namespace

CopyEngine::CopyEngine(const infra::Config& config,
                       infra::ProgressReporter& reporter)
    : config_(config), reporter_(reporter) {}

auto CopyEngine::run(const std::string& source, const std::string& destination)
    -> infra::Result<infra::TransferStats>
{
    if (source == destination) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidInput,
                                                 "destination is same as the source"));
    }

    const std::filesystem::path src{source};
    std::filesystem::path dst{destination};

    auto src_info = adapters::fs::stat(src);
    if (!src_info) {
        const auto& ec = src_info.error();
        return std::unexpected(infra::make_error(ec,
            fmt::format("stat failed for source path '{}': {}", source, ec.message())));
    }

    if (src_info->is_directory && !config_.recursive) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidInput,
            "source is a directory but --recursive option not specified"));
    }

    if (auto dst_info = adapters::fs::stat(dst)) {
        if (dst_info->is_directory) {
            const auto name = basename_of(src);
            if (!name.empty()) {
                dst /= name;
            }
        } else if (src_info->is_directory) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidInput,
                "source is a directory, destination is a file"));
        }
    }

    std::error_code ec;
    if (std::filesystem::exists(dst, ec) && std::filesystem::equivalent(src, dst, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidInput,
            fmt::format("'{}' and '{}' are the same file", source, dst.string())));
    }

    spdlog::debug("{} '{}' -> '{}'", config_.move ? "Moving" : "Copying", src.string(), dst.string());

    infra::TransferStats stats{};
    const auto start = std::chrono::steady_clock::now();

    if (src_info->is_directory) {
        auto copied = copy_directory(src, dst, stats);
        if (!copied) {
            return std::unexpected(std::move(copied.error()));
        }
    } else {
        stats.total = src_info->size;
        auto copied = copy_file(src, dst, stats);
        if (!copied) {
            return std::unexpected(std::move(copied.error()));
        }
        if (config_.move) {
            std::filesystem::remove(src, ec);
            if (ec) {
                return std::unexpected(infra::make_error(ec,
                    fmt::format("failed to remove source file '{}': {}", src.string(), ec.message())));
            }
        }
    }

    const auto end = std::chrono::steady_clock::now();

    // Catches undercounting that no lower layer reported, e.g. a swallowed read error
    if (stats.transferred != stats.total) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ByteMismatch,
            fmt::format("error in copy: transferred={}, total={}", stats.transferred, stats.total)));
    }

    stats.time_taken = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    if (config_.stats) {
        report_stats_(stats);
    }
    return stats;
}

auto CopyEngine::copy_file(const std::filesystem::path& src,
                           const std::filesystem::path& dst,
                           infra::TransferStats& stats)
    -> infra::Result<std::uint64_t>
{
    auto src_handle = adapters::fs::open_read(src);
    if (!src_handle) {
        const auto& ec = src_handle.error();
        return std::unexpected(infra::make_error(ec,
            fmt::format("failure in opening source file '{}': {}", src.string(), ec.message())));
    }

    auto src_info = adapters::fs::stat(*src_handle);
    if (!src_info) {
        const auto& ec = src_info.error();
        return std::unexpected(infra::make_error(ec,
            fmt::format("failure in fetching metadata for source file '{}': {}", src.string(), ec.message())));
    }

    std::optional<adapters::fs::FileInfo> dst_info;
    if (auto probe = adapters::fs::stat(dst)) {
        if (!config_.force && !config_.resume) {
            return std::unexpected(infra::make_error(infra::ErrorCode::AlreadyExists,
                fmt::format("file '{}' exists, can't copy file without --force or --continue option",
                            dst.string())));
        }
        dst_info = *probe;
    } else if (is_absent(probe.error())) {
        if (dst.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(dst.parent_path(), ec);
            if (ec && ec != std::errc::file_exists) {
                return std::unexpected(infra::make_error(ec,
                    fmt::format("failure in creating destination directory '{}': {}",
                                dst.parent_path().string(), ec.message())));
            }
        }
    } else {
        const auto& ec = probe.error();
        return std::unexpected(infra::make_error(ec,
            fmt::format("failure in probing destination '{}': {}", dst.string(), ec.message())));
    }

    const bool resuming = config_.resume && dst_info.has_value();

    // A resumed file keeps its own mode until the copy is finalized below
    const mode_t mode = resuming ? dst_info->mode : src_info->mode;
    auto dst_handle = adapters::fs::open_write(dst, mode, resuming);
    if (!dst_handle) {
        const auto& ec = dst_handle.error();
        return std::unexpected(infra::make_error(ec,
            fmt::format("failure in opening destination file '{}': {}", dst.string(), ec.message())));
    }

    const auto file_size = src_info->size;
    std::uint64_t bytes_transferred = 0;

    if (resuming) {
        const auto offset = dst_info->size;
        if (auto sought = adapters::fs::seek_to(*src_handle, offset); !sought) {
            const auto& ec = sought.error();
            return std::unexpected(infra::make_error(ec,
                fmt::format("failed to resume copy due to seek fail on source file '{}': {}",
                            src.string(), ec.message())));
        }
        bytes_transferred = offset;
        stats.transferred += offset;
        spdlog::debug("Resuming '{}' at byte {} of {}", src.string(), offset, file_size);
    }

    const auto block_size = config_.effective_block_size();
    while (bytes_transferred < file_size) {
        const auto request = static_cast<std::size_t>(std::min(block_size, file_size - bytes_transferred));
        auto copied = adapters::fs::copy_n(*src_handle, *dst_handle, request);
        if (!copied) {
            const auto& ec = copied.error();
            return std::unexpected(infra::make_error(ec,
                fmt::format("error while copying file '{}': {}", src.string(), ec.message())));
        }
        if (*copied == 0) {
            break;
        }

        bytes_transferred += *copied;
        stats.transferred += *copied;

        if (config_.progress) {
            reporter_.report(src, dst, bytes_transferred, file_size, stats);
        }
    }

    if (bytes_transferred < file_size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ByteMismatch,
            fmt::format("error while copying file '{}': missing {} bytes in destination",
                        src.string(), file_size - bytes_transferred)));
    }
    if (bytes_transferred > file_size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ByteMismatch,
            fmt::format("error while copying file '{}': destination has {} bytes more than the source",
                        src.string(), bytes_transferred - file_size)));
    }

    if (auto synced = extensions::copy_permissions(src_info->mode, dst); !synced) {
        return std::unexpected(std::move(synced.error()));
    }

    if (config_.progress) {
        fmt::print("\r{} file '{}'\n", config_.move ? "Moved" : "Copied", src.filename().string());
    }
    return bytes_transferred;
}

auto CopyEngine::copy_directory(const std::filesystem::path& src,
                                const std::filesystem::path& dst,
                                infra::TransferStats& stats)
    -> infra::VoidResult
{
    auto listing = list_dir_recursive(src);
    if (!listing) {
        return std::unexpected(std::move(listing.error()));
    }

    // Whole tree is sized up front so progress totals are right from the first byte
    for (const auto& entry : *listing) {
        stats.total += entry.size;
    }
    spdlog::debug("{} files ({} bytes) under '{}'", listing->size(), stats.total, src.string());

    for (const auto& entry : *listing) {
        const auto from = src / entry.relative_path;
        const auto to = dst / entry.relative_path;

        auto copied = copy_file(from, to, stats);
        if (!copied) {
            if (!config_.no_dir_error) {
                return std::unexpected(std::move(copied.error()));
            }
            (void)infra::log_and_return(std::move(copied.error()));
            continue;
        }

        if (config_.move) {
            std::error_code ec;
            std::filesystem::remove(from, ec);
            if (ec) {
                auto err = infra::make_error(ec,
                    fmt::format("failed to remove source file '{}': {}", from.string(), ec.message()));
                if (!config_.no_dir_error) {
                    return std::unexpected(std::move(err));
                }
                (void)infra::log_and_return(std::move(err));
            }
        }
    }

    if (config_.move) {
        if (auto removed = remove_dir_tree(src); !removed) {
            const auto& err = removed.error();
            return std::unexpected(infra::Error{err.code,
                fmt::format("failed to remove source directory: {}", err.message), err.cause});
        }
    }
    return {};
}

void CopyEngine::report_stats_(const infra::TransferStats& stats) const {
    const auto seconds = std::chrono::duration<double>(stats.time_taken).count();
    spdlog::info("Time taken to copy: {:.6f}s", seconds);
    spdlog::info("Bytes transferred: {} ({})", stats.transferred,
                 infra::format_size_precise(stats.transferred));
    spdlog::info("Transfer speed: {}/s",
                 infra::format_size_precise(static_cast<std::uint64_t>(stats.bytes_per_second())));
}

} // namespace fcopy::core
