// SPDX-License-Identifier: MIT

// lib/stream/secure_stream.cpp
#include "lib/stream/secure_stream.hpp"

#include <openssl/err.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/fd_wait.hpp"
#include "lib/stream/file_source.hpp"
#include "lib/stream/file_transfer.hpp"

namespace sockstream {

namespace {

int ClampToInt(std::size_t n) {
    return static_cast<int>(std::min<std::size_t>(n, INT_MAX));
}

}  // namespace

Result<void> SecureStream::CheckValid() const {
    if (ssl_ == nullptr) {
        return std::unexpected(Error{ErrorCode::InvalidArgument, "null SSL handle"});
    }
    return {};
}

Result<void> SecureStream::Send(std::span<const std::byte> data) {
    if (auto ok = CheckValid(); !ok) return ok;

    while (!data.empty()) {
        ERR_clear_error();
        errno = 0;
        // A retry after WANT_READ/WANT_WRITE repeats the same buffer and length
        int ret = SSL_write(ssl_, data.data(), ClampToInt(data.size()));
        if (ret > 0) {
            data = data.subspan(static_cast<std::size_t>(ret));
            continue;
        }

        auto step = HandleSslResult(ret, "SSL_write", std::nullopt);
        if (!step) return std::unexpected(std::move(step.error()));
        if (*step == SslStep::PeerClosed) {
            return std::unexpected(Error{ErrorCode::ConnectionReset,
                                         "SSL_write failed: peer closed the connection"});
        }
    }
    return {};
}

ReceiveResult SecureStream::Receive(std::size_t length, const TransferOptions& options) {
    if (auto ok = CheckValid(); !ok) return std::unexpected(std::move(ok.error()));

    const Deadline deadline = DeadlineAfter(options.timeout);

    // Records without application data (session tickets, a partial record)
    // make the socket readable while SSL_read still has nothing to return.
    // Non-blocking, such reads surface as SSL_ERROR_WANT_READ and the wait
    // goes back to poll(2) with the remaining time.
    auto nonblocking = NonBlockingGuard::Enable(SSL_get_fd(ssl_));
    if (!nonblocking) return std::unexpected(std::move(nonblocking.error()));

    const bool exact = length > 0;
    const std::size_t want = exact ? length : kDefaultReceiveSize;
    std::vector<std::byte> buffer;
    std::size_t filled = 0;

    while (filled < want) {
        buffer.resize(filled + std::min(want - filled, kDefaultReceiveSize));

        ERR_clear_error();
        errno = 0;
        int ret = SSL_read(ssl_, buffer.data() + filled, ClampToInt(buffer.size() - filled));
        if (ret > 0) {
            filled += static_cast<std::size_t>(ret);
            if (!exact) break;
            continue;
        }

        auto step = HandleSslResult(ret, "SSL_read", TimeLeft(deadline));
        if (!step) return std::unexpected(std::move(step.error()));
        if (*step == SslStep::Retry) continue;

        if (filled == 0) return std::nullopt;
        break;
    }

    buffer.resize(filled);
    return buffer;
}

Result<void> SecureStream::File(const std::string& path, const TransferOptions& options) {
    if (auto ok = CheckValid(); !ok) return ok;

    auto file = FileSource::Open(path);
    if (!file) return std::unexpected(std::move(file.error()));

    return StreamFileRange(*this, *file, options);
}

Result<void> SecureStream::Shutdown(ShutdownMode mode) {
    if (auto ok = CheckValid(); !ok) return ok;

    const int fd = SSL_get_fd(ssl_);
    int how = SHUT_RDWR;

    switch (mode) {
        case ShutdownMode::Read:
            how = SHUT_RD;
            break;
        case ShutdownMode::Write:
            how = SHUT_WR;
            [[fallthrough]];
        case ShutdownMode::Both:
            if (auto sent = SendCloseNotify(); !sent) {
                return std::unexpected(Error{ErrorCode::ShutdownFailed,
                                             std::move(sent.error().message),
                                             sent.error().os_errno});
            }
            break;
    }

    if (fd < 0) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     "SSL handle is not bound to a socket"});
    }
    if (::shutdown(fd, how) < 0) {
        return std::unexpected(SystemError(ErrorCode::ShutdownFailed, "shutdown()", errno));
    }
    return {};
}

Result<void> SecureStream::SendCloseNotify() {
    // A second SSL_shutdown() would block waiting for the peer's close_notify
    if ((SSL_get_shutdown(ssl_) & SSL_SENT_SHUTDOWN) != 0) return {};

    while (true) {
        ERR_clear_error();
        errno = 0;
        int ret = SSL_shutdown(ssl_);
        if (ret >= 0) return {};

        auto step = HandleSslResult(ret, "SSL_shutdown", std::nullopt);
        if (!step) return std::unexpected(std::move(step.error()));
        if (*step == SslStep::PeerClosed) return {};
    }
}

Result<SecureStream::SslStep> SecureStream::HandleSslResult(
    int ret, const char* operation, std::optional<std::chrono::milliseconds> timeout) {
    const int saved_errno = errno;
    const int ssl_error = SSL_get_error(ssl_, ret);

    switch (ssl_error) {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE: {
            const int fd = SSL_get_fd(ssl_);
            if (fd < 0) {
                return std::unexpected(Error{ErrorCode::InvalidArgument,
                                             "SSL handle is not bound to a socket"});
            }
            auto readiness = ssl_error == SSL_ERROR_WANT_READ ? Readiness::Readable
                                                              : Readiness::Writable;
            if (auto ready = WaitFd(fd, readiness, timeout); !ready) {
                return std::unexpected(std::move(ready.error()));
            }
            return SslStep::Retry;
        }

        case SSL_ERROR_ZERO_RETURN:
            // close_notify received
            return SslStep::PeerClosed;

        case SSL_ERROR_SYSCALL:
            // EOF without close_notify, or a reset, with nothing on the error queue
            if (ERR_peek_error() == 0 && (saved_errno == 0 || saved_errno == ECONNRESET)) {
                return SslStep::PeerClosed;
            }
            if (saved_errno != 0) {
                return std::unexpected(SystemError(
                    saved_errno == EPIPE || saved_errno == ECONNRESET
                        ? ErrorCode::ConnectionReset
                        : ErrorCode::ConnectionFailed,
                    operation, saved_errno));
            }
            return std::unexpected(Error{ErrorCode::TlsError,
                                         fmt::format("{} failed: {}", operation, GetSslErrorString())});

        case SSL_ERROR_SSL:
            if (ERR_GET_REASON(ERR_peek_error()) == SSL_R_UNEXPECTED_EOF_WHILE_READING) {
                ERR_clear_error();
                return SslStep::PeerClosed;
            }
            return std::unexpected(Error{ErrorCode::TlsError,
                                         fmt::format("{} failed: {}", operation, GetSslErrorString())});

        default:
            return std::unexpected(Error{ErrorCode::TlsError,
                                         fmt::format("{} failed: error code {}", operation, ssl_error)});
    }
}

std::string SecureStream::GetSslErrorString() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "unknown error";

    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

}  // namespace sockstream
