// SPDX-License-Identifier: MIT

// lib/stream/channel.hpp
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace chanserv {

namespace detail {

// Shared state of one bounded channel.
//
// Producer side: Send() blocks while full, Close() ends the sequence.
// Consumer side: Receive() blocks while empty, Abandon() drops the queue
// and makes any further Send() fail.
// Every blocking wait also returns when the caller's stop token fires.
template <typename T>
class ChannelState {
public:
    explicit ChannelState(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    bool Send(T item, std::stop_token stop) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_full_.wait(lock, stop, [this] {
            return abandoned_ || closed_ || queue_.size() < capacity_;
        });
        if (!ready || abandoned_ || closed_) {
            return false;
        }
        queue_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> Receive(std::stop_token stop) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_empty_.wait(lock, stop, [this] {
            return !queue_.empty() || closed_ || abandoned_;
        });
        if (!ready || queue_.empty()) {
            return std::nullopt;
        }
        return PopLocked(lock);
    }

    std::optional<T> TryReceive() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        return PopLocked(lock);
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    void Abandon() {
        std::deque<T> dropped;
        std::function<void()> on_abandon;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (abandoned_) return;
            abandoned_ = true;
            dropped.swap(queue_);
            on_abandon.swap(on_abandon_);
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        // Queued items are destroyed outside the lock
        if (on_abandon) on_abandon();
    }

    void OnAbandon(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!abandoned_) {
                on_abandon_ = std::move(cb);
                return;
            }
        }
        if (cb) cb();
    }

    bool Closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool Drained() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && queue_.empty();
    }

    bool Abandoned() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return abandoned_;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t Capacity() const { return capacity_; }

private:
    std::optional<T> PopLocked(std::unique_lock<std::mutex>& lock) {
        std::optional<T> item(std::move(queue_.front()));
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable_any not_empty_;
    std::condition_variable_any not_full_;
    std::deque<T> queue_;
    const std::size_t capacity_;
    bool closed_ = false;
    bool abandoned_ = false;
    std::function<void()> on_abandon_;
};

}  // namespace detail

/// Producing end of a bounded channel.
///
/// Move-only. The sequence is closed exactly once: by Close() or, at the
/// latest, when the Sender is destroyed.
template <typename T>
class Sender {
public:
    Sender() = default;
    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {}

    ~Sender() { Close(); }

    Sender(const Sender&) = delete;
    Sender& operator=(const Sender&) = delete;

    Sender(Sender&& other) noexcept = default;
    Sender& operator=(Sender&& other) noexcept {
        if (this != &other) {
            Close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    /// Push one item, blocking while the channel is full.
    /// @return false if the receiver abandoned the channel, the channel
    ///         was closed, or @p stop fired before there was room.
    bool Send(T item, std::stop_token stop = {}) {
        if (!state_) return false;
        return state_->Send(std::move(item), std::move(stop));
    }

    /// End the sequence. Idempotent.
    void Close() {
        if (state_) state_->Close();
    }

    /// @return true once the receiving end has been abandoned.
    bool Abandoned() const { return !state_ || state_->Abandoned(); }

    /// Run @p cb once when the receiving end is abandoned (immediately if
    /// it already was). Replaces any previous callback; runs on the
    /// abandoning thread.
    void OnAbandon(std::function<void()> cb) {
        if (state_) state_->OnAbandon(std::move(cb));
    }

    explicit operator bool() const { return state_ != nullptr; }

private:
    std::shared_ptr<detail::ChannelState<T>> state_;
};

/// Consuming end of a bounded channel.
///
/// Move-only. Destroying the Receiver abandons the channel, so a producer
/// blocked in Send() is released instead of waiting forever.
template <typename T>
class Receiver {
public:
    Receiver() = default;
    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
        : state_(std::move(state)) {}

    ~Receiver() { Abandon(); }

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    Receiver(Receiver&& other) noexcept = default;
    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            Abandon();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    /// Pop the next item, blocking while the channel is empty.
    /// @return nullopt once the sequence is closed and drained, or when
    ///         @p stop fires first.
    std::optional<T> Receive(std::stop_token stop = {}) {
        if (!state_) return std::nullopt;
        return state_->Receive(std::move(stop));
    }

    /// Pop the next item if one is queued.
    std::optional<T> TryReceive() {
        if (!state_) return std::nullopt;
        return state_->TryReceive();
    }

    /// Stop consuming. Queued items are dropped and further sends fail.
    void Abandon() {
        if (state_) state_->Abandon();
    }

    /// @return true if the producer closed the sequence and every item was consumed.
    bool Drained() const { return !state_ || state_->Drained(); }

    /// @return true if the producer closed the sequence.
    bool Closed() const { return !state_ || state_->Closed(); }

    std::size_t Size() const { return state_ ? state_->Size() : 0; }

    explicit operator bool() const { return state_ != nullptr; }

private:
    std::shared_ptr<detail::ChannelState<T>> state_;
};

/// Create a bounded channel holding at most @p capacity items (minimum 1).
template <typename T>
std::pair<Sender<T>, Receiver<T>> MakeChannel(std::size_t capacity) {
    auto state = std::make_shared<detail::ChannelState<T>>(capacity);
    return {Sender<T>(state), Receiver<T>(state)};
}

}  // namespace chanserv
