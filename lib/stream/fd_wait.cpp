// SPDX-License-Identifier: MIT

// lib/stream/fd_wait.cpp
#include "lib/stream/fd_wait.hpp"

#include <fcntl.h>
#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <climits>

#include <fmt/format.h>

namespace sockstream {

Result<void> WaitFd(int fd, Readiness readiness,
                    std::optional<std::chrono::milliseconds> timeout) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = readiness == Readiness::Readable ? POLLIN : POLLOUT;

    // Recomputed on EINTR so signals do not extend the wait
    const Deadline deadline = DeadlineAfter(timeout);

    while (true) {
        auto left = TimeLeft(deadline);
        int wait_ms = -1;
        if (left) {
            // Longer waits are served by looping on the deadline
            wait_ms = static_cast<int>(
                std::min<std::chrono::milliseconds::rep>(left->count(), INT_MAX));
        }

        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret > 0) return {};
        if (ret == 0) {
            if (TimeLeft(deadline)->count() > 0) continue;
            return std::unexpected(Error{
                ErrorCode::Timeout,
                fmt::format("timed out after {}ms waiting on fd {}", timeout->count(), fd)});
        }
        if (errno != EINTR) {
            return std::unexpected(SystemError(ErrorCode::ConnectionFailed, "poll()", errno));
        }
    }
}

Result<NonBlockingGuard> NonBlockingGuard::Enable(int fd) {
    if (fd < 0) return NonBlockingGuard(-1, 0);

    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0) {
        return std::unexpected(SystemError(ErrorCode::ConnectionFailed, "fcntl(F_GETFL)", errno));
    }
    if ((flags & O_NONBLOCK) != 0) return NonBlockingGuard(-1, 0);

    if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::unexpected(SystemError(ErrorCode::ConnectionFailed, "fcntl(F_SETFL)", errno));
    }
    return NonBlockingGuard(fd, flags);
}

NonBlockingGuard::~NonBlockingGuard() {
    if (fd_ >= 0) ::fcntl(fd_, F_SETFL, saved_flags_);
}

}  // namespace sockstream
