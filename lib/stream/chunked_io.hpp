// SPDX-License-Identifier: MIT

// lib/stream/chunked_io.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <span>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/byte_source.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/stream.hpp"
#include "lib/stream/transfer_options.hpp"

namespace sockstream {

namespace detail {

// Discard `offset` bytes from source. Returns false if the source ended first.
template <ByteSource Src>
Result<bool> DiscardPrefix(Src& source, std::uint64_t offset, std::span<std::byte> scratch) {
    if constexpr (SkippableByteSource<Src>) {
        auto skipped = source.Skip(offset);
        if (!skipped) return std::unexpected(std::move(skipped.error()));
        return *skipped == offset;
    } else {
        std::uint64_t discarded = 0;
        while (discarded < offset) {
            auto want = static_cast<std::size_t>(
                std::min<std::uint64_t>(offset - discarded, scratch.size()));
            auto got = source.Read(scratch.first(want));
            if (!got) return std::unexpected(std::move(got.error()));
            if (*got == 0) return false;
            discarded += *got;
        }
        return true;
    }
}

}  // namespace detail

// StreamFrom - send the content of a byte source through a stream in chunks
//
// Skips options.offset bytes, then repeatedly reads up to chunk_size bytes
// and sends them, stopping after options.size bytes when a size is set.
// The last chunk of a bounded transfer is shortened so the bound is met
// exactly. Reaching end-of-source early, including during the offset skip,
// is a successful (possibly empty) transfer. options.timeout is ignored.
//
// Used directly to stream arbitrary sources, and through StreamFileRange()
// for file transfers that cannot go through sendfile(2).
template <Stream S, ByteSource Src>
Result<void> StreamFrom(S& stream, Src& source, const TransferOptions& options = {}) {
    const std::size_t chunk_size = options.ChunkSize();
    if (chunk_size == 0) {
        return std::unexpected(Error{ErrorCode::InvalidArgument, "chunk_size must be positive"});
    }

    std::vector<std::byte> buffer;
    try {
        buffer.resize(chunk_size);
    } catch (const std::exception& e) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     fmt::format("chunk_size {} cannot be allocated: {}",
                                                 chunk_size, e.what())});
    }

    if (options.offset > 0) {
        auto reached = detail::DiscardPrefix(source, options.offset, std::span(buffer));
        if (!reached) return std::unexpected(std::move(reached.error()));
        if (!*reached) return {};
    }

    std::uint64_t total_sent = 0;
    while (true) {
        std::size_t want = chunk_size;
        if (options.size && total_sent + chunk_size > *options.size) {
            want = static_cast<std::size_t>(*options.size - total_sent);
            if (want == 0) return {};
        }

        auto got = source.Read(std::span(buffer.data(), want));
        if (!got) return std::unexpected(std::move(got.error()));
        if (*got == 0) return {};

        auto sent = stream.Send(std::span<const std::byte>(buffer.data(), *got));
        if (!sent) return sent;

        total_sent += *got;
    }
}

}  // namespace sockstream
