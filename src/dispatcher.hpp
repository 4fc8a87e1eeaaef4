// SPDX-License-Identifier: MIT

// src/dispatcher.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/service_loop.hpp"
#include "lib/stream/task_group.hpp"
#include "lib/stream/transport.hpp"
#include "src/chanserv.hpp"
#include "src/config.hpp"

namespace chanserv {

/// Server role: answers requests on a virtual address with announced Sources.
///
/// Each accepted connection is served on its own thread: the request is
/// read, the SourceFunc is invoked with its body, and every Source it
/// yields is bound on a fresh sub-address `<vaddr>#<n>` before its
/// announcement is written. The Source's frames are streamed once the
/// subscriber dials that sub-address. A Source whose announcement cannot be
/// encoded or written is never served: its sub-address is unbound and its
/// Source abandoned. A sub-address nobody dials within
/// ServerConfig::source_timeout is unbound, its Source is abandoned (the
/// producer's next send fails) and SourceTimeout is reported.
///
/// The master connection's write side is shut down after the SourceFunc's
/// sequence closes. A sequence that never closes holds the master
/// connection open until the subscriber disconnects or Stop() is called;
/// there is no limit on the number of announcements.
///
/// The multiplexer must outlive the dispatcher.
class Dispatcher {
public:
    explicit Dispatcher(IMultiplexer& mux, ServerConfig config = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

    /// Bind @p vaddr and start accepting in the background.
    /// @return AddressInUse / BindFailed from the transport, or InvalidState
    ///         if already started or stopped.
    std::expected<void, Error> Start(std::string_view vaddr, SourceFunc fn);

    /// Start(), then block until Stop() is called from another thread.
    std::expected<void, Error> ListenAndServe(std::string_view vaddr, SourceFunc fn);

    /// Unbind, cancel every connection and Source, and join all threads.
    /// Idempotent. Must not be called from a SourceFunc.
    void Stop();

    /// Bound virtual address, empty before Start().
    std::string Addr() const;

private:
    void AcceptLoop(std::stop_token stop);
    void ServeRequest(std::shared_ptr<IConnection> conn, std::stop_token stop);
    // A bound sub-address and its encoded announcement, not yet written
    struct Announcement {
        std::vector<std::byte> record;
        std::shared_ptr<IListener> listener;
    };

    std::expected<Announcement, Error> Announce(const SourcePtr& source);
    void Withdraw(const std::shared_ptr<IListener>& listener, const SourcePtr& source);
    void ServeSource(std::shared_ptr<IListener> listener, SourcePtr source, std::stop_token stop);

    IMultiplexer& mux_;
    const ServerConfig config_;
    ServiceLoop service_;

    mutable std::mutex mutex_;
    std::condition_variable stopped_cv_;
    bool started_ = false;
    bool stopping_ = false;
    bool stopped_ = false;
    std::string vaddr_;
    std::shared_ptr<IListener> listener_;
    SourceFunc fn_;
    std::atomic<uint64_t> next_sub_{1};

    // Last member: destroyed (and joined) before everything tasks use
    TaskGroup tasks_;
};

}  // namespace chanserv
