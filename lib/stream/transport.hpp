// SPDX-License-Identifier: MIT

// lib/stream/transport.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"

namespace chanserv {

/// One ordered, reliable byte stream between two virtual addresses.
///
/// Read() and Write() block; Close() may be called from any thread and
/// releases a Read() or Write() blocked on this end.
class IConnection {
public:
    virtual ~IConnection() = default;

    /// Read up to buf.size() bytes.
    /// @return bytes read, 0 on clean end-of-stream, or an error
    ///         (ConnectionReset on failure, ConnectionClosed after Close()).
    virtual std::expected<size_t, Error> Read(std::span<std::byte> buf) = 0;

    /// Write all of @p data, blocking on transport flow control.
    virtual std::expected<void, Error> Write(std::span<const std::byte> data) = 0;

    /// Half-close: the peer drains what was written, then sees end-of-stream.
    virtual void CloseWrite() = 0;

    /// Full close of this end. Idempotent.
    virtual void Close() = 0;

    virtual std::string LocalAddr() const = 0;
    virtual std::string RemoteAddr() const = 0;
};

/// A bound virtual address accepting inbound connections.
class IListener {
public:
    virtual ~IListener() = default;

    /// Block until a connection arrives.
    /// @return the connection, or ConnectionClosed once Close() was called.
    virtual std::expected<std::unique_ptr<IConnection>, Error> Accept() = 0;

    /// Unbind the address and release a blocked Accept(). Idempotent, thread-safe.
    virtual void Close() = 0;

    virtual std::string Addr() const = 0;
};

/// Routing hints passed through to discovery/dialing.
struct DialOptions {
    /// Shard preference for hash-based balancing; forwarded verbatim.
    std::optional<std::string> bucket;
};

/// Transport capability: bind a virtual address, dial one with a timeout.
///
/// Discovery of the address, framing, retransmission and ordering are the
/// multiplexer's business.
class IMultiplexer {
public:
    virtual ~IMultiplexer() = default;

    /// @return a listener, or AddressInUse / BindFailed.
    virtual std::expected<std::shared_ptr<IListener>, Error> Bind(std::string_view vaddr) = 0;

    /// @return a connection, or DialTimeout / DialFailed.
    virtual std::expected<std::unique_ptr<IConnection>, Error> DialTimeout(
        std::string_view vaddr,
        std::chrono::milliseconds timeout,
        const DialOptions& options) = 0;
};

}  // namespace chanserv
