// SPDX-License-Identifier: MIT

// lib/stream/event_loop.hpp
#pragma once

#include <chrono>
#include <functional>

namespace chanserv {

/// Work queue behind a ServiceLoop.
///
/// Callbacks posted through Defer() or Schedule() always run on the thread
/// driving the loop, never on the caller's. Both are safe from any thread.
class IEventLoop {
public:
    using Task = std::function<void()>;

    virtual ~IEventLoop() = default;

    /// Run @p fn on the loop thread during the next iteration.
    virtual void Defer(Task fn) = 0;

    /// Run @p fn on the loop thread once @p delay has elapsed.
    /// Timers with equal deadlines fire in the order they were scheduled.
    virtual void Schedule(std::chrono::milliseconds delay, Task fn) = 0;

    virtual bool IsInEventLoopThread() const = 0;
};

}  // namespace chanserv
