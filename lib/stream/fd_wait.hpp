// SPDX-License-Identifier: MIT

// lib/stream/fd_wait.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <utility>

#include "lib/stream/error.hpp"

namespace sockstream {

enum class Readiness { Readable, Writable };

// Absolute point in time an operation must finish by; unset means never.
using Deadline = std::optional<std::chrono::steady_clock::time_point>;

inline Deadline DeadlineAfter(std::optional<std::chrono::milliseconds> timeout) {
    if (!timeout) return std::nullopt;
    return std::chrono::steady_clock::now() + *timeout;
}

// Time left until deadline, clamped at zero.
inline std::optional<std::chrono::milliseconds> TimeLeft(const Deadline& deadline) {
    if (!deadline) return std::nullopt;
    auto left = std::chrono::ceil<std::chrono::milliseconds>(
        *deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

// Block until fd is ready in the requested direction or the timeout elapses.
//
// Error/hangup conditions count as ready so the following I/O call reports
// them. An unset timeout waits forever. Returns ErrorCode::Timeout on expiry.
Result<void> WaitFd(int fd, Readiness readiness,
                    std::optional<std::chrono::milliseconds> timeout = {});

// NonBlockingGuard - put a caller-owned fd into O_NONBLOCK for a scope
//
// The original file status flags are restored on destruction. Enable() on a
// negative fd, or on one that is already non-blocking, returns a guard that
// restores nothing.
class NonBlockingGuard {
public:
    static Result<NonBlockingGuard> Enable(int fd);

    ~NonBlockingGuard();

    NonBlockingGuard(NonBlockingGuard&& other) noexcept
        : fd_(std::exchange(other.fd_, -1)), saved_flags_(other.saved_flags_) {}

    NonBlockingGuard(const NonBlockingGuard&) = delete;
    NonBlockingGuard& operator=(const NonBlockingGuard&) = delete;
    NonBlockingGuard& operator=(NonBlockingGuard&&) = delete;

private:
    NonBlockingGuard(int fd, int saved_flags) : fd_(fd), saved_flags_(saved_flags) {}

    int fd_ = -1;
    int saved_flags_ = 0;
};

}  // namespace sockstream
