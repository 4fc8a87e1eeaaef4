// SPDX-License-Identifier: MIT

// lib/stream/memory_transport.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"
#include "lib/stream/transport.hpp"

namespace chanserv {

/// In-process implementation of the transport capability.
///
/// Each connection is a pair of bounded byte pipes, so a reader that stops
/// reading eventually blocks the writer exactly like a socket would.
/// Dialing an address nobody has bound yet waits for a Bind() until the
/// dial timeout elapses.
///
/// Thread safety: all methods are thread-safe. Listeners and connections
/// may outlive the multiplexer.
class MemoryMultiplexer : public IMultiplexer {
public:
    static constexpr size_t kDefaultPipeCapacity = 64 * 1024;

    explicit MemoryMultiplexer(size_t pipe_capacity = kDefaultPipeCapacity);
    ~MemoryMultiplexer() override;

    MemoryMultiplexer(const MemoryMultiplexer&) = delete;
    MemoryMultiplexer& operator=(const MemoryMultiplexer&) = delete;

    std::expected<std::shared_ptr<IListener>, Error> Bind(std::string_view vaddr) override;

    std::expected<std::unique_ptr<IConnection>, Error> DialTimeout(
        std::string_view vaddr,
        std::chrono::milliseconds timeout,
        const DialOptions& options) override;

    /// Reset every live connection that was accepted on @p vaddr.
    /// Both ends then fail reads and writes with ConnectionReset.
    /// @return number of connections severed.
    size_t Sever(std::string_view vaddr);

    /// @return true while a listener is bound to @p vaddr.
    bool IsBound(std::string_view vaddr) const;

    /// @return number of currently bound addresses.
    size_t BoundCount() const;

    /// @return number of addresses still tracked for Sever(). An address is
    /// forgotten once every connection dialed to it is gone.
    size_t LinkedAddressCount() const;

    struct State;

private:
    std::shared_ptr<State> state_;
};

}  // namespace chanserv
