// SPDX-License-Identifier: MIT

// lib/stream/byte_source.hpp
#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

#include "lib/stream/error.hpp"

namespace sockstream {

// ByteSource - readable producer of bytes
//
// Read() fills at most buf.size() bytes and returns how many it wrote.
// A return of 0 for a non-empty buffer signals end-of-source.
template <typename S>
concept ByteSource = requires(S& s, std::span<std::byte> buf) {
    { s.Read(buf) } -> std::same_as<Result<std::size_t>>;
};

// SkippableByteSource - source that can discard bytes without copying them
//
// Skip() returns the number of bytes actually skipped; fewer than requested
// means the source ended.
template <typename S>
concept SkippableByteSource = ByteSource<S> && requires(S& s, std::uint64_t n) {
    { s.Skip(n) } -> std::same_as<Result<std::uint64_t>>;
};

}  // namespace sockstream
