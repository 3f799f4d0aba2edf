// SPDX-License-Identifier: MIT

// lib/stream/file_source.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "lib/stream/byte_source.hpp"
#include "lib/stream/error.hpp"

namespace sockstream {

// FileSource - owned read-only file descriptor exposed as a ByteSource
//
// Works with regular files and with unseekable descriptors (pipes, FIFOs);
// Skip() falls back to read-and-discard when lseek() is not supported.
class FileSource {
public:
    // Open `path` read-only.
    static Result<FileSource> Open(const std::string& path);

    // Take ownership of an already open descriptor.
    static FileSource Adopt(int fd) { return FileSource(fd); }

    ~FileSource() { Close(); }

    // Move-only
    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;
    FileSource(FileSource&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    FileSource& operator=(FileSource&& other) noexcept;

    // Fill buf until it is full or the file ends. Returns 0 at end of file.
    Result<std::size_t> Read(std::span<std::byte> buf);

    // Advance the read position by up to n bytes.
    Result<std::uint64_t> Skip(std::uint64_t n);

    // Total size reported by fstat().
    Result<std::uint64_t> Size() const;

    void Close();

    int fd() const { return fd_; }

private:
    explicit FileSource(int fd) : fd_(fd) {}

    Result<std::uint64_t> DiscardByReading(std::uint64_t n);

    int fd_ = -1;
};

static_assert(SkippableByteSource<FileSource>, "FileSource must satisfy SkippableByteSource");

}  // namespace sockstream
