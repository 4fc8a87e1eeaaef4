// SPDX-License-Identifier: MIT

#include "lib/stream/epoll_event_loop.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace chanserv {

namespace {

[[noreturn]] void ThrowErrno(const char* call) {
    throw std::runtime_error(std::string(call) + " failed: " + std::strerror(errno));
}

void Watch(int epoll_fd, int fd) {
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &ev) < 0) {
        ThrowErrno("epoll_ctl");
    }
}

// Reads the 8-byte counter of an eventfd or timerfd. EAGAIN just means
// another pass already consumed it.
void Consume(int fd) {
    uint64_t count = 0;
    [[maybe_unused]] ssize_t n = read(fd, &count, sizeof(count));
}

}  // namespace

EpollEventLoop::EpollEventLoop() {
    try {
        epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) ThrowErrno("epoll_create1");

        wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd_ < 0) ThrowErrno("eventfd");

        timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
        if (timer_fd_ < 0) ThrowErrno("timerfd_create");

        Watch(epoll_fd_, wake_fd_);
        Watch(epoll_fd_, timer_fd_);
    } catch (...) {
        for (int fd : {timer_fd_, wake_fd_, epoll_fd_}) {
            if (fd >= 0) close(fd);
        }
        throw;
    }
}

EpollEventLoop::~EpollEventLoop() {
    close(timer_fd_);
    close(wake_fd_);
    close(epoll_fd_);
}

void EpollEventLoop::Defer(Task fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deferred_.push_back(std::move(fn));
    }
    if (!IsInEventLoopThread()) {
        Wake();
    }
}

void EpollEventLoop::Schedule(std::chrono::milliseconds delay, Task fn) {
    auto deadline = Clock::now() + std::max(delay, std::chrono::milliseconds{0});

    std::lock_guard<std::mutex> lock(mutex_);
    timers_.push_back(Timer{deadline, next_seq_++, std::move(fn)});
    std::push_heap(timers_.begin(), timers_.end(), LaterFirst{});
    // Only a new earliest deadline moves the timerfd.
    if (timers_.front().seq == next_seq_ - 1) {
        ArmLocked();
    }
}

bool EpollEventLoop::IsInEventLoopThread() const {
    return std::this_thread::get_id() == loop_thread_.load();
}

void EpollEventLoop::ArmLocked() {
    itimerspec spec{};
    if (!timers_.empty()) {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      timers_.front().deadline.time_since_epoch())
                      .count();
        // Absolute CLOCK_MONOTONIC time; steady_clock shares its epoch.
        // An all-zero value would disarm, so keep at least 1ns.
        ns = std::max<int64_t>(ns, 1);
        spec.it_value.tv_sec = static_cast<time_t>(ns / 1'000'000'000);
        spec.it_value.tv_nsec = static_cast<long>(ns % 1'000'000'000);
    }
    if (timerfd_settime(timer_fd_, TFD_TIMER_ABSTIME, &spec, nullptr) < 0) {
        ThrowErrno("timerfd_settime");
    }
}

void EpollEventLoop::Poll(int timeout_ms) {
    loop_thread_.store(std::this_thread::get_id());

    epoll_event events[kMaxEvents];
    int n = epoll_wait(epoll_fd_, events, kMaxEvents, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) return;
        ThrowErrno("epoll_wait");
    }

    bool timer_ready = false;
    for (int i = 0; i < n; ++i) {
        if (events[i].data.fd == timer_fd_) {
            timer_ready = true;
        } else {
            Consume(wake_fd_);
        }
    }
    if (timer_ready) {
        Consume(timer_fd_);
        RunDueTimers();
    }
    RunDeferred();
}

void EpollEventLoop::RunDueTimers() {
    std::vector<Task> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        while (!timers_.empty() && timers_.front().deadline <= now) {
            std::pop_heap(timers_.begin(), timers_.end(), LaterFirst{});
            due.push_back(std::move(timers_.back().fn));
            timers_.pop_back();
        }
        ArmLocked();
    }
    for (auto& fn : due) {
        if (fn) fn();
    }
}

void EpollEventLoop::RunDeferred() {
    std::vector<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(deferred_);
    }
    for (auto& fn : batch) {
        if (fn) fn();
    }
}

void EpollEventLoop::Run() {
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Running)) {
        return;
    }
    // Work deferred before Run() has no wakeup of its own.
    RunDeferred();
    while (state_.load() == State::Running) {
        Poll(-1);
    }
}

void EpollEventLoop::Stop() {
    state_.store(State::Stopped);
    Wake();
}

void EpollEventLoop::Wake() {
    uint64_t one = 1;
    [[maybe_unused]] ssize_t n = write(wake_fd_, &one, sizeof(one));
}

}  // namespace chanserv
