// SPDX-License-Identifier: MIT

#include "lib/stream/task_group.hpp"

#include <utility>

namespace chanserv {

TaskGroup::~TaskGroup() {
    RequestStop();
    Join();
}

bool TaskGroup::Spawn(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        return false;
    }
    ReapLocked();

    auto entry = std::make_unique<Entry>();
    entry->thread = std::jthread([done = entry->done, task = std::move(task)](std::stop_token stop) {
        task(stop);
        done->store(true, std::memory_order_release);
    });
    entries_.push_back(std::move(entry));
    return true;
}

void TaskGroup::RequestStop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    for (auto& entry : entries_) {
        entry->thread.request_stop();
    }
}

void TaskGroup::Join() {
    std::list<std::unique_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.swap(entries_);
    }
    for (auto& entry : entries) {
        if (!entry->thread.joinable()) continue;
        if (entry->thread.get_id() == std::this_thread::get_id()) {
            // Last owner released from inside one of its own tasks
            entry->thread.detach();
            continue;
        }
        entry->thread.join();
    }
}

std::size_t TaskGroup::Active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t active = 0;
    for (const auto& entry : entries_) {
        if (!entry->done->load(std::memory_order_acquire)) {
            ++active;
        }
    }
    return active;
}

void TaskGroup::ReapLocked() {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if ((*it)->done->load(std::memory_order_acquire)) {
            (*it)->thread.join();
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace chanserv
