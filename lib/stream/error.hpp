// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <cstring>
#include <expected>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace sockstream {

/// Error codes for all stream operations.
enum class ErrorCode {
    // Caller
    InvalidArgument,       ///< Bad option value or invalid handle

    // Connection
    ConnectionFailed,      ///< Native send/recv failed
    ConnectionReset,       ///< Peer reset the connection mid-operation
    Timeout,               ///< Receive timeout elapsed with no data
    ShutdownFailed,        ///< shutdown(2) / SSL_shutdown failed

    // Byte sources
    FileError,             ///< open/stat/seek/read on a file descriptor failed
    SourceError,           ///< Generic byte source reported a read failure

    // TLS
    TlsError,              ///< OpenSSL record layer failure
};

/// Error payload returned by every fallible operation.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
};

/// Result of a stream operation: a value, or the Error that prevented it.
template <typename T>
using Result = std::expected<T, Error>;

/// Return a short category string for an error code (e.g. "connection", "tls").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:
            return "argument";
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionReset:
        case ErrorCode::ShutdownFailed:
            return "connection";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::FileError:
        case ErrorCode::SourceError:
            return "io";
        case ErrorCode::TlsError:
            return "tls";
    }
    return "unknown";
}

/// Build an Error for a failed system call, e.g. "send() failed: Broken pipe".
inline Error SystemError(ErrorCode code, std::string_view operation, int err) {
    return Error{code, fmt::format("{} failed: {}", operation, std::strerror(err)), err};
}

}  // namespace sockstream
