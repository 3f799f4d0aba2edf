// SPDX-License-Identifier: MIT

// lib/stream/plain_stream.hpp
#pragma once

#include <cstddef>
#include <span>
#include <string>

#include "lib/stream/error.hpp"
#include "lib/stream/stream.hpp"
#include "lib/stream/transfer_options.hpp"

namespace sockstream {

// PlainStream - Stream over an unencrypted, connected stream socket
//
// Non-owning view of the descriptor: the caller opens, connects and closes
// it. Copies refer to the same socket. File() uses sendfile(2), so file
// content never passes through user space.
class PlainStream {
public:
    explicit PlainStream(int fd) : fd_(fd) {}

    Result<void> Send(std::span<const std::byte> data);

    ReceiveResult Receive() { return Receive(0, TransferOptions{}); }
    ReceiveResult Receive(std::size_t length) { return Receive(length, TransferOptions{}); }
    ReceiveResult Receive(const TransferOptions& options) { return Receive(0, options); }
    ReceiveResult Receive(std::size_t length, const TransferOptions& options);

    Result<void> File(const std::string& path) { return File(path, TransferOptions{}); }
    Result<void> File(const std::string& path, const TransferOptions& options);

    Result<void> Shutdown(ShutdownMode mode = ShutdownMode::Both);

    int fd() const { return fd_; }

private:
    Result<void> CheckValid() const;

    int fd_;
};

static_assert(Stream<PlainStream>, "PlainStream must satisfy Stream");

}  // namespace sockstream
