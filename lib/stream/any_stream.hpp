// SPDX-License-Identifier: MIT

// lib/stream/any_stream.hpp
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <variant>

#include "lib/stream/error.hpp"
#include "lib/stream/plain_stream.hpp"
#include "lib/stream/secure_stream.hpp"
#include "lib/stream/stream.hpp"
#include "lib/stream/transfer_options.hpp"

namespace sockstream {

// AnyStream - either a PlainStream or a SecureStream, chosen at runtime
//
// For code that accepts connections of both kinds through one non-template
// interface. The variant set is closed; every call is a std::visit.
class AnyStream {
public:
    AnyStream(PlainStream plain) : impl_(plain) {}
    AnyStream(SecureStream secure) : impl_(secure) {}

    Result<void> Send(std::span<const std::byte> data) {
        return std::visit([&](auto& s) { return s.Send(data); }, impl_);
    }

    ReceiveResult Receive() { return Receive(0, TransferOptions{}); }
    ReceiveResult Receive(std::size_t length) { return Receive(length, TransferOptions{}); }
    ReceiveResult Receive(const TransferOptions& options) { return Receive(0, options); }
    ReceiveResult Receive(std::size_t length, const TransferOptions& options) {
        return std::visit([&](auto& s) { return s.Receive(length, options); }, impl_);
    }

    Result<void> File(const std::string& path) { return File(path, TransferOptions{}); }
    Result<void> File(const std::string& path, const TransferOptions& options) {
        return std::visit([&](auto& s) { return s.File(path, options); }, impl_);
    }

    Result<void> Shutdown(ShutdownMode mode = ShutdownMode::Both) {
        return std::visit([&](auto& s) { return s.Shutdown(mode); }, impl_);
    }

    bool is_secure() const { return std::holds_alternative<SecureStream>(impl_); }

private:
    std::variant<PlainStream, SecureStream> impl_;
};

static_assert(Stream<AnyStream>, "AnyStream must satisfy Stream");

}  // namespace sockstream
