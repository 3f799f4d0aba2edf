// SPDX-License-Identifier: MIT

// lib/stream/file_transfer.hpp
#pragma once

#include <algorithm>
#include <cstdint>
#include <utility>

#include "lib/stream/chunked_io.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/file_source.hpp"
#include "lib/stream/stream.hpp"
#include "lib/stream/transfer_options.hpp"

namespace sockstream {

// Bytes of [offset, offset + size) that lie inside a file of file_size bytes.
// An unset size runs to the end of the file.
inline std::uint64_t FileRangeLength(const TransferOptions& options, std::uint64_t file_size) {
    if (options.offset >= file_size) return 0;
    const std::uint64_t available = file_size - options.offset;
    return options.size ? std::min(*options.size, available) : available;
}

// StreamFileRange - copy a byte range of a freshly opened file through a stream
//
// `file` must still be positioned at its start. The range is clipped to the
// file's current size and sent with StreamFrom(), so chunking and chunk_size
// validation are the same as for any other source. This is the user-space
// file path: SecureStream::File() always takes it, PlainStream::File() when
// sendfile(2) rejects the descriptor pair.
template <Stream S>
Result<void> StreamFileRange(S& stream, FileSource& file, const TransferOptions& options) {
    auto file_size = file.Size();
    if (!file_size) return std::unexpected(std::move(file_size.error()));

    TransferOptions resolved = options;
    resolved.size = FileRangeLength(options, *file_size);
    return StreamFrom(stream, file, resolved);
}

}  // namespace sockstream
