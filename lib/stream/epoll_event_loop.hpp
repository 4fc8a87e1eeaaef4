// SPDX-License-Identifier: MIT

// lib/stream/epoll_event_loop.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

#include "lib/stream/event_loop.hpp"

namespace chanserv {

/// IEventLoop on Linux epoll.
///
/// Three descriptors: the epoll set, an eventfd that other threads poke
/// after queueing work, and one timerfd kept armed for the earliest
/// pending deadline.
///
/// Run() drives the loop until Stop(). A Stop() that arrives before Run()
/// makes Run() return at once; pending deferred work and timers are then
/// dropped with the loop.
class EpollEventLoop : public IEventLoop {
public:
    EpollEventLoop();
    ~EpollEventLoop() override;

    EpollEventLoop(const EpollEventLoop&) = delete;
    EpollEventLoop& operator=(const EpollEventLoop&) = delete;
    EpollEventLoop(EpollEventLoop&&) = delete;
    EpollEventLoop& operator=(EpollEventLoop&&) = delete;

    void Defer(Task fn) override;
    void Schedule(std::chrono::milliseconds delay, Task fn) override;
    bool IsInEventLoopThread() const override;

    /// One iteration: wait up to @p timeout_ms (-1 blocks), then run due
    /// timers and deferred work.
    void Poll(int timeout_ms);

    void Run();
    void Stop();

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        Clock::time_point deadline;
        uint64_t seq;
        Task fn;
    };
    struct LaterFirst {
        bool operator()(const Timer& a, const Timer& b) const {
            if (a.deadline != b.deadline) return a.deadline > b.deadline;
            return a.seq > b.seq;
        }
    };

    void Wake();
    void DrainWake();
    void RunDueTimers();
    void RunDeferred();
    // Requires mutex_.
    void ArmLocked();

    enum class State { Idle, Running, Stopped };

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    int timer_fd_ = -1;
    std::atomic<State> state_{State::Idle};
    std::atomic<std::thread::id> loop_thread_{};

    std::mutex mutex_;
    std::vector<Task> deferred_;
    // Min-heap on (deadline, seq) under LaterFirst.
    std::vector<Timer> timers_;
    uint64_t next_seq_ = 0;

    static constexpr int kMaxEvents = 8;
};

}  // namespace chanserv
