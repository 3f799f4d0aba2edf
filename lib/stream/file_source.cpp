// SPDX-License-Identifier: MIT

// lib/stream/file_source.cpp
#include "lib/stream/file_source.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <utility>

#include <fmt/format.h>

namespace sockstream {

Result<FileSource> FileSource::Open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        return std::unexpected(SystemError(ErrorCode::FileError,
                                           fmt::format("open({})", path), err));
    }
    return FileSource(fd);
}

FileSource& FileSource::operator=(FileSource&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void FileSource::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<std::size_t> FileSource::Read(std::span<std::byte> buf) {
    if (fd_ < 0) {
        return std::unexpected(Error{ErrorCode::InvalidArgument, "read on closed file source"});
    }

    // Loop so that short reads only happen at end of file; the chunk
    // pattern seen by the stream then depends on the options alone.
    std::size_t filled = 0;
    while (filled < buf.size()) {
        ssize_t n = ::read(fd_, buf.data() + filled, buf.size() - filled);
        if (n > 0) {
            filled += static_cast<std::size_t>(n);
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            return std::unexpected(SystemError(ErrorCode::FileError, "read()", errno));
        }
    }
    return filled;
}

Result<std::uint64_t> FileSource::Skip(std::uint64_t n) {
    if (fd_ < 0) {
        return std::unexpected(Error{ErrorCode::InvalidArgument, "skip on closed file source"});
    }
    if (n == 0) return 0;

    struct stat st{};
    if (::fstat(fd_, &st) < 0) {
        return std::unexpected(SystemError(ErrorCode::FileError, "fstat()", errno));
    }
    if (!S_ISREG(st.st_mode)) {
        return DiscardByReading(n);
    }

    off_t current = ::lseek(fd_, 0, SEEK_CUR);
    if (current < 0) {
        if (errno == ESPIPE) return DiscardByReading(n);
        return std::unexpected(SystemError(ErrorCode::FileError, "lseek()", errno));
    }

    auto size = static_cast<std::uint64_t>(st.st_size);
    auto pos = static_cast<std::uint64_t>(current);
    std::uint64_t skipped = std::min(n, size > pos ? size - pos : std::uint64_t{0});

    if (::lseek(fd_, static_cast<off_t>(pos + skipped), SEEK_SET) < 0) {
        return std::unexpected(SystemError(ErrorCode::FileError, "lseek()", errno));
    }
    return skipped;
}

Result<std::uint64_t> FileSource::DiscardByReading(std::uint64_t n) {
    std::array<std::byte, 4096> scratch;
    std::uint64_t skipped = 0;
    while (skipped < n) {
        auto want = static_cast<std::size_t>(
            std::min<std::uint64_t>(n - skipped, scratch.size()));
        auto got = Read(std::span(scratch.data(), want));
        if (!got) return std::unexpected(std::move(got.error()));
        if (*got == 0) break;
        skipped += *got;
    }
    return skipped;
}

Result<std::uint64_t> FileSource::Size() const {
    struct stat st{};
    if (::fstat(fd_, &st) < 0) {
        return std::unexpected(SystemError(ErrorCode::FileError, "fstat()", errno));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

}  // namespace sockstream
