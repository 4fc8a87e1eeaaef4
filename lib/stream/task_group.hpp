// SPDX-License-Identifier: MIT

// lib/stream/task_group.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace chanserv {

/// Owner of the background tasks spawned by one Dispatcher or Subscriber.
///
/// Each task runs on its own std::jthread and receives that thread's stop
/// token. Finished tasks are reaped on the next Spawn(). Destroying the
/// group requests stop on every task and joins them.
///
/// Thread safety: all methods may be called from any thread, including
/// from inside a running task (except Join(), which would self-deadlock).
class TaskGroup {
public:
    using Task = std::function<void(std::stop_token)>;

    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;
    TaskGroup(TaskGroup&&) = delete;
    TaskGroup& operator=(TaskGroup&&) = delete;

    /// Start @p task on a new thread.
    /// @return false if the group is already stopping (task is not run).
    bool Spawn(Task task);

    /// Fire the stop token of every running task. New spawns are refused.
    void RequestStop();

    /// Wait for every task to finish.
    void Join();

    /// @return number of tasks that have not finished yet.
    std::size_t Active() const;

private:
    struct Entry {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done = std::make_shared<std::atomic<bool>>(false);
    };

    void ReapLocked();

    mutable std::mutex mutex_;
    std::list<std::unique_ptr<Entry>> entries_;
    bool stopping_ = false;
};

}  // namespace chanserv
