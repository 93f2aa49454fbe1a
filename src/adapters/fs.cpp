#include "fs.hpp"

#include <algorithm>
#include <cerrno>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fcopy::adapters::fs {

namespace {

std::error_code last_error() {
    return {errno, std::generic_category()};
}

FileInfo to_info(const struct stat& sb) {
    return FileInfo{
        .size = static_cast<std::uint64_t>(sb.st_size),
        .mode = static_cast<mode_t>(sb.st_mode & 07777),
        .is_directory = S_ISDIR(sb.st_mode),
    };
}

// Writes the whole buffer, retrying short writes and EINTR.
IoResult<void> write_all(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(last_error());
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return {};
}

} // namespace

FileHandle::~FileHandle() {
    reset_();
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        reset_();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void FileHandle::reset_() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

IoResult<FileHandle> open_read(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        return std::unexpected(last_error());
    }
    return FileHandle{fd};
}

IoResult<FileHandle> open_write(const std::filesystem::path& path, mode_t mode, bool append) {
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= append ? O_APPEND : O_TRUNC;
    const int fd = ::open(path.c_str(), flags, mode);
    if (fd == -1) {
        return std::unexpected(last_error());
    }
    return FileHandle{fd};
}

IoResult<FileInfo> stat(const FileHandle& handle) {
    struct stat sb;
    if (::fstat(handle.get(), &sb) == -1) {
        return std::unexpected(last_error());
    }
    return to_info(sb);
}

IoResult<FileInfo> stat(const std::filesystem::path& path) {
    struct stat sb;
    if (::stat(path.c_str(), &sb) == -1) {
        return std::unexpected(last_error());
    }
    return to_info(sb);
}

IoResult<void> seek_to(const FileHandle& handle, std::uint64_t offset) {
    if (::lseek(handle.get(), static_cast<off_t>(offset), SEEK_SET) == static_cast<off_t>(-1)) {
        return std::unexpected(last_error());
    }
    return {};
}

IoResult<std::size_t> copy_n(const FileHandle& src, const FileHandle& dst, std::size_t max_bytes) {
    std::vector<char> buffer(kTransferBufferSize);
    std::size_t remaining = max_bytes;

    while (remaining > 0) {
        const std::size_t to_read = std::min(remaining, kTransferBufferSize);
        const ssize_t read_cnt = ::read(src.get(), buffer.data(), to_read);
        if (read_cnt < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("Read error after {} bytes, stopping transfer: {}",
                         max_bytes - remaining, last_error().message());
            break;
        }
        if (read_cnt == 0) {
            break;
        }

        auto written = write_all(dst.get(), buffer.data(), static_cast<std::size_t>(read_cnt));
        if (!written) {
            return std::unexpected(written.error());
        }
        remaining -= static_cast<std::size_t>(read_cnt);
    }

    return max_bytes - remaining;
}

} // namespace fcopy::adapters::fs
