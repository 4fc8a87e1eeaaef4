// SPDX-License-Identifier: MIT

// lib/stream/service_loop.hpp
#pragma once

#include <chrono>
#include <functional>
#include <thread>

#include "lib/stream/error.hpp"
#include "lib/stream/epoll_event_loop.hpp"

namespace chanserv {

/// Diagnostic hook for background stream failures.
using ErrorHandler = std::function<void(const Error&)>;

/// Housekeeping event loop running on its own thread.
///
/// Owned by one Dispatcher or Subscriber. Background tasks use it to
/// report errors without ever running the user's diagnostic hook on their
/// own thread, and to arm one-shot timers.
///
/// Thread safety: Report() and After() may be called from any thread.
/// Work queued after Stop() is dropped.
class ServiceLoop {
public:
    explicit ServiceLoop(ErrorHandler on_error = {});
    ~ServiceLoop();

    ServiceLoop(const ServiceLoop&) = delete;
    ServiceLoop& operator=(const ServiceLoop&) = delete;
    ServiceLoop(ServiceLoop&&) = delete;
    ServiceLoop& operator=(ServiceLoop&&) = delete;

    /// Log @p e and hand it to the diagnostic hook on the loop thread.
    void Report(const Error& e);

    /// Run @p fn on the loop thread once @p delay has elapsed.
    void After(std::chrono::milliseconds delay, std::function<void()> fn);

    /// Stop the loop and join its thread. Idempotent.
    void Stop();

private:
    IEventLoop& loop() { return loop_; }

    EpollEventLoop loop_;
    ErrorHandler on_error_;
    std::jthread thread_;
};

}  // namespace chanserv
