// SPDX-License-Identifier: MIT

// lib/stream/transfer_options.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace sockstream {

/// Chunk size used when TransferOptions::chunk_size is unset.
inline constexpr std::size_t kDefaultChunkSize = 4096;

/// Upper bound for a Receive() call with length 0.
inline constexpr std::size_t kDefaultReceiveSize = 64 * 1024;

/// Options for Receive(), File() and StreamFrom().
///
/// Fields that are not meaningful for an operation are ignored by it:
/// Receive() only reads `timeout`, File() and StreamFrom() ignore it.
struct TransferOptions {
    /// Bytes to skip at the start of the source before sending.
    std::uint64_t offset = 0;

    /// Bytes to send after the offset. Unset means "until end of source".
    std::optional<std::uint64_t> size = {};

    /// Bytes read from the source per send. Unset means kDefaultChunkSize
    /// for chunked transfers, and "no cap" for sendfile(2).
    std::optional<std::size_t> chunk_size = {};

    /// Receive timeout. Unset waits forever.
    std::optional<std::chrono::milliseconds> timeout = {};

    std::size_t ChunkSize() const { return chunk_size.value_or(kDefaultChunkSize); }
};

/// Direction(s) closed by Shutdown().
enum class ShutdownMode { Read, Write, Both };

}  // namespace sockstream
