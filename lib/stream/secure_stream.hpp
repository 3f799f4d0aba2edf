// SPDX-License-Identifier: MIT

// lib/stream/secure_stream.hpp
#pragma once

#include <openssl/ssl.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <string>

#include "lib/stream/error.hpp"
#include "lib/stream/stream.hpp"
#include "lib/stream/transfer_options.hpp"

namespace sockstream {

// SecureStream - Stream over an established OpenSSL connection
//
// Non-owning view of an SSL* whose handshake has completed. The SSL object
// must be bound to a socket descriptor (SSL_set_fd); that descriptor is
// polled for timeouts and half-closed by Shutdown(). The caller keeps
// ownership of both and frees them after the stream is no longer used.
// Receive() switches the descriptor to O_NONBLOCK for the duration of the
// call and restores its flags before returning.
//
// TLS records cannot be produced by the kernel, so File() reads the file
// through StreamFileRange() and encrypts it chunk by chunk.
//
// OpenSSL writes to the socket with write(2): callers should ignore SIGPIPE
// to get an Error instead of a signal when the peer has gone away.
class SecureStream {
public:
    explicit SecureStream(SSL* ssl) : ssl_(ssl) {}

    Result<void> Send(std::span<const std::byte> data);

    ReceiveResult Receive() { return Receive(0, TransferOptions{}); }
    ReceiveResult Receive(std::size_t length) { return Receive(length, TransferOptions{}); }
    ReceiveResult Receive(const TransferOptions& options) { return Receive(0, options); }
    ReceiveResult Receive(std::size_t length, const TransferOptions& options);

    Result<void> File(const std::string& path) { return File(path, TransferOptions{}); }
    Result<void> File(const std::string& path, const TransferOptions& options);

    Result<void> Shutdown(ShutdownMode mode = ShutdownMode::Both);

    SSL* ssl() const { return ssl_; }

private:
    // What to do after an SSL_* call returned ret <= 0
    enum class SslStep { Retry, PeerClosed };

    Result<void> CheckValid() const;

    // Classify the failure of `operation`, waiting on the socket when OpenSSL
    // asks for it. `timeout` bounds that wait.
    Result<SslStep> HandleSslResult(int ret, const char* operation,
                                    std::optional<std::chrono::milliseconds> timeout);

    Result<void> SendCloseNotify();

    static std::string GetSslErrorString();

    SSL* ssl_;
};

static_assert(Stream<SecureStream>, "SecureStream must satisfy Stream");

}  // namespace sockstream
