#pragma once

#include <filesystem>
#include <expected>
#include <cstddef>
#include <cstdint>
#include <system_error>

#include <sys/types.h>

namespace fcopy::adapters::fs {

template<typename T>
using IoResult = std::expected<T, std::error_code>;

// Owning POSIX file descriptor, closed on destruction.
class FileHandle {
public:
    FileHandle() = default;
    explicit FileHandle(int fd) noexcept : fd_(fd) {}
    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto is_open() const noexcept -> bool { return fd_ >= 0; }

private:
    void reset_() noexcept;

    int fd_ = -1;
};

struct FileInfo {
    std::uint64_t size = 0;
    mode_t mode = 0;           // permission bits only (07777)
    bool is_directory = false;
};

// Size of the internal buffer used by copy_n()
inline constexpr std::size_t kTransferBufferSize = 32 * 1024;

[[nodiscard]] auto open_read(const std::filesystem::path& path) -> IoResult<FileHandle>;

/// Opens (creating if needed) for writing. `append` keeps existing contents,
/// otherwise the file is truncated. `mode` applies only when the file is created.
[[nodiscard]] auto open_write(const std::filesystem::path& path, mode_t mode, bool append)
    -> IoResult<FileHandle>;

[[nodiscard]] auto stat(const FileHandle& handle) -> IoResult<FileInfo>;

// Follows symlinks.
[[nodiscard]] auto stat(const std::filesystem::path& path) -> IoResult<FileInfo>;

[[nodiscard]] auto seek_to(const FileHandle& handle, std::uint64_t offset) -> IoResult<void>;

/// Copies up to `max_bytes` from `src` to `dst` through a kTransferBufferSize
/// buffer and returns how many bytes were moved. Stops early at end of input.
/// A read error also stops the transfer early: it is logged and the partial
/// count returned, so callers detect it through their byte accounting.
/// Write errors are returned.
[[nodiscard]] auto copy_n(const FileHandle& src, const FileHandle& dst, std::size_t max_bytes)
    -> IoResult<std::size_t>;

} // namespace fcopy::adapters::fs
