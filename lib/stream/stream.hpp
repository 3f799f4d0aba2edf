// SPDX-License-Identifier: MIT

// lib/stream/stream.hpp
#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/transfer_options.hpp"

namespace sockstream {

// Bytes received from a stream, or nullopt once the peer has closed.
using ReceiveResult = Result<std::optional<std::vector<std::byte>>>;

// Stream interface - transport-agnostic connection operations
//
// Implemented by PlainStream (stream socket fd), SecureStream (OpenSSL SSL*)
// and AnyStream (runtime choice between the two). Code written against this
// concept never branches on the transport.
//
// Send       - write every byte of the span, blocking as needed
// Receive    - length 0 reads whatever is available; length > 0 reads exactly
//              that many bytes. Peer closure yields nullopt, not an error.
// File       - send [offset, offset + size) of a file
// Shutdown   - close one or both directions
template <typename S>
concept Stream = requires(S& s,
                          std::span<const std::byte> data,
                          std::size_t length,
                          const TransferOptions& options,
                          const std::string& path,
                          ShutdownMode mode) {
    { s.Send(data) } -> std::same_as<Result<void>>;

    { s.Receive() } -> std::same_as<ReceiveResult>;
    { s.Receive(length) } -> std::same_as<ReceiveResult>;
    { s.Receive(options) } -> std::same_as<ReceiveResult>;
    { s.Receive(length, options) } -> std::same_as<ReceiveResult>;

    { s.File(path) } -> std::same_as<Result<void>>;
    { s.File(path, options) } -> std::same_as<Result<void>>;

    { s.Shutdown() } -> std::same_as<Result<void>>;
    { s.Shutdown(mode) } -> std::same_as<Result<void>>;
};

}  // namespace sockstream
