// SPDX-License-Identifier: MIT

// lib/stream/plain_stream.cpp
#include "lib/stream/plain_stream.hpp"

#include <sys/sendfile.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "lib/stream/fd_wait.hpp"
#include "lib/stream/file_source.hpp"
#include "lib/stream/file_transfer.hpp"

namespace sockstream {

namespace {

ErrorCode ClassifySocketErrno(int err) {
    return (err == ECONNRESET || err == EPIPE) ? ErrorCode::ConnectionReset
                                               : ErrorCode::ConnectionFailed;
}

}  // namespace

Result<void> PlainStream::CheckValid() const {
    if (fd_ < 0) {
        return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid socket descriptor"});
    }
    return {};
}

Result<void> PlainStream::Send(std::span<const std::byte> data) {
    if (auto ok = CheckValid(); !ok) return ok;

    while (!data.empty()) {
        ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
        if (n >= 0) {
            data = data.subspan(static_cast<std::size_t>(n));
            continue;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            // Non-blocking socket: block here, the contract is synchronous
            if (auto ready = WaitFd(fd_, Readiness::Writable); !ready) return ready;
            continue;
        }
        int err = errno;
        return std::unexpected(SystemError(ClassifySocketErrno(err), "send()", err));
    }
    return {};
}

ReceiveResult PlainStream::Receive(std::size_t length, const TransferOptions& options) {
    if (auto ok = CheckValid(); !ok) return std::unexpected(std::move(ok.error()));

    const Deadline deadline = DeadlineAfter(options.timeout);

    const bool exact = length > 0;
    const std::size_t want = exact ? length : kDefaultReceiveSize;
    std::vector<std::byte> buffer;
    std::size_t filled = 0;

    while (filled < want) {
        if (auto ready = WaitFd(fd_, Readiness::Readable, TimeLeft(deadline)); !ready) {
            return std::unexpected(std::move(ready.error()));
        }

        // Grows with the data actually received, never by the requested length
        buffer.resize(filled + std::min(want - filled, kDefaultReceiveSize));

        ssize_t n = ::recv(fd_, buffer.data() + filled, buffer.size() - filled, 0);
        if (n > 0) {
            filled += static_cast<std::size_t>(n);
            if (!exact) break;
            continue;
        }

        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (errno != ECONNRESET) {
                return std::unexpected(SystemError(ErrorCode::ConnectionFailed, "recv()", errno));
            }
        }

        // Peer closed (orderly EOF or reset)
        if (filled == 0) return std::nullopt;
        break;
    }

    buffer.resize(filled);
    return buffer;
}

Result<void> PlainStream::File(const std::string& path, const TransferOptions& options) {
    if (auto ok = CheckValid(); !ok) return ok;
    if (options.chunk_size && *options.chunk_size == 0) {
        return std::unexpected(Error{ErrorCode::InvalidArgument, "chunk_size must be positive"});
    }

    auto file = FileSource::Open(path);
    if (!file) return std::unexpected(std::move(file.error()));

    auto file_size = file->Size();
    if (!file_size) return std::unexpected(std::move(file_size.error()));

    const std::uint64_t count = FileRangeLength(options, *file_size);

    auto offset = static_cast<off_t>(options.offset);
    std::uint64_t remaining = count;

    while (remaining > 0) {
        std::uint64_t request = remaining;
        if (options.chunk_size) request = std::min<std::uint64_t>(request, *options.chunk_size);

        ssize_t n = ::sendfile(fd_, file->fd(), &offset, static_cast<std::size_t>(request));
        if (n > 0) {
            remaining -= static_cast<std::uint64_t>(n);
            continue;
        }
        if (n == 0) break;  // File shrank underneath us

        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (auto ready = WaitFd(fd_, Readiness::Writable); !ready) return ready;
            continue;
        }
        if ((errno == EINVAL || errno == ENOSYS) && remaining == count) {
            // Descriptor pair not supported by sendfile(2); copy through user space
            return StreamFileRange(*this, *file, options);
        }
        int err = errno;
        return std::unexpected(SystemError(ClassifySocketErrno(err), "sendfile()", err));
    }
    return {};
}

Result<void> PlainStream::Shutdown(ShutdownMode mode) {
    if (auto ok = CheckValid(); !ok) return ok;

    int how = SHUT_RDWR;
    switch (mode) {
        case ShutdownMode::Read:  how = SHUT_RD; break;
        case ShutdownMode::Write: how = SHUT_WR; break;
        case ShutdownMode::Both:  how = SHUT_RDWR; break;
    }

    if (::shutdown(fd_, how) < 0) {
        return std::unexpected(SystemError(ErrorCode::ShutdownFailed, "shutdown()", errno));
    }
    return {};
}

}  // namespace sockstream
