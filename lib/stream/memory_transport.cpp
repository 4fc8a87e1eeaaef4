// SPDX-License-Identifier: MIT

#include "lib/stream/memory_transport.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/log.hpp"

namespace chanserv {

namespace {

// One direction of a connection: bounded byte FIFO with close/reset flags.
class Pipe {
public:
    explicit Pipe(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

    std::expected<void, Error> Write(std::span<const std::byte> data) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!data.empty()) {
            cv_.wait(lock, [this] {
                return reset_ || writer_closed_ || reader_closed_ || buffer_.size() < capacity_;
            });
            if (reset_) {
                return std::unexpected(Error{ErrorCode::ConnectionReset, "connection reset"});
            }
            if (writer_closed_) {
                return std::unexpected(Error{ErrorCode::ConnectionClosed, "write after close"});
            }
            if (reader_closed_) {
                return std::unexpected(Error{ErrorCode::ConnectionClosed, "peer closed connection"});
            }
            size_t n = std::min(capacity_ - buffer_.size(), data.size());
            buffer_.insert(buffer_.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(n));
            data = data.subspan(n);
            cv_.notify_all();
        }
        return {};
    }

    std::expected<size_t, Error> Read(std::span<std::byte> buf) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] {
            return reset_ || reader_closed_ || writer_closed_ || !buffer_.empty();
        });
        if (reset_) {
            return std::unexpected(Error{ErrorCode::ConnectionReset, "connection reset"});
        }
        if (reader_closed_) {
            return std::unexpected(Error{ErrorCode::ConnectionClosed, "connection closed locally"});
        }
        if (buffer_.empty()) {
            return size_t{0};  // writer closed and drained
        }
        size_t n = std::min(buf.size(), buffer_.size());
        std::copy_n(buffer_.begin(), n, buf.begin());
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(n));
        cv_.notify_all();
        return n;
    }

    void CloseWrite() { Set(writer_closed_); }

    void CloseRead() {
        std::lock_guard<std::mutex> lock(mutex_);
        reader_closed_ = true;
        buffer_.clear();
        cv_.notify_all();
    }

    void Reset() { Set(reset_); }

private:
    void Set(bool& flag) {
        std::lock_guard<std::mutex> lock(mutex_);
        flag = true;
        cv_.notify_all();
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::byte> buffer_;
    const size_t capacity_;
    bool writer_closed_ = false;
    bool reader_closed_ = false;
    bool reset_ = false;
};

class MemoryConnection : public IConnection {
public:
    MemoryConnection(std::shared_ptr<Pipe> in, std::shared_ptr<Pipe> out,
                     std::string local, std::string remote)
        : in_(std::move(in)), out_(std::move(out)),
          local_(std::move(local)), remote_(std::move(remote)) {}

    ~MemoryConnection() override { Close(); }

    std::expected<size_t, Error> Read(std::span<std::byte> buf) override {
        return in_->Read(buf);
    }

    std::expected<void, Error> Write(std::span<const std::byte> data) override {
        return out_->Write(data);
    }

    void CloseWrite() override { out_->CloseWrite(); }

    void Close() override {
        out_->CloseWrite();
        in_->CloseRead();
    }

    std::string LocalAddr() const override { return local_; }
    std::string RemoteAddr() const override { return remote_; }

private:
    std::shared_ptr<Pipe> in_;
    std::shared_ptr<Pipe> out_;
    std::string local_;
    std::string remote_;
};

}  // namespace

struct MemoryMultiplexer::State {
    struct Link {
        std::weak_ptr<Pipe> up;
        std::weak_ptr<Pipe> down;
    };

    std::mutex mutex;
    std::condition_variable bound_cv;
    std::map<std::string, std::weak_ptr<IListener>, std::less<>> listeners;
    std::map<std::string, std::vector<Link>, std::less<>> links;
    size_t pipe_capacity = kDefaultPipeCapacity;
    uint64_t next_endpoint = 1;

    void Unbind(const std::string& vaddr, const IListener* listener) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = listeners.find(vaddr);
        if (it == listeners.end()) return;
        auto current = it->second.lock();
        if (!current || current.get() == listener) {
            listeners.erase(it);
        }
    }

    // Requires mutex. Drops links whose connections are both gone, and
    // addresses left with no live link.
    void PruneLinksLocked() {
        for (auto it = links.begin(); it != links.end();) {
            std::erase_if(it->second, [](const Link& l) {
                return l.up.expired() && l.down.expired();
            });
            if (it->second.empty()) {
                it = links.erase(it);
            } else {
                ++it;
            }
        }
    }
};

namespace {

class MemoryListener : public IListener {
public:
    MemoryListener(std::shared_ptr<MemoryMultiplexer::State> state, std::string vaddr)
        : state_(std::move(state)), vaddr_(std::move(vaddr)) {}

    ~MemoryListener() override { Close(); }

    std::expected<std::unique_ptr<IConnection>, Error> Accept() override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !backlog_.empty(); });
        if (closed_) {
            return std::unexpected(Error{ErrorCode::ConnectionClosed,
                fmt::format("listener {} closed", vaddr_)});
        }
        auto conn = std::move(backlog_.front());
        backlog_.pop_front();
        return conn;
    }

    void Close() override {
        std::deque<std::unique_ptr<IConnection>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            closed_ = true;
            pending.swap(backlog_);
        }
        cv_.notify_all();
        state_->Unbind(vaddr_, this);
        // Unaccepted connections see end-of-stream on the dialing side
        for (auto& conn : pending) {
            conn->Close();
        }
    }

    std::string Addr() const override { return vaddr_; }

    // Called by the multiplexer while dialing
    bool Enqueue(std::unique_ptr<IConnection> conn) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            backlog_.push_back(std::move(conn));
        }
        cv_.notify_one();
        return true;
    }

private:
    std::shared_ptr<MemoryMultiplexer::State> state_;
    std::string vaddr_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<IConnection>> backlog_;
    bool closed_ = false;
};

}  // namespace

MemoryMultiplexer::MemoryMultiplexer(size_t pipe_capacity)
    : state_(std::make_shared<State>()) {
    state_->pipe_capacity = pipe_capacity;
}

MemoryMultiplexer::~MemoryMultiplexer() = default;

std::expected<std::shared_ptr<IListener>, Error> MemoryMultiplexer::Bind(std::string_view vaddr) {
    if (vaddr.empty()) {
        return std::unexpected(Error{ErrorCode::BindFailed, "empty virtual address"});
    }
    std::shared_ptr<IListener> listener;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->listeners.find(vaddr);
        if (it != state_->listeners.end() && !it->second.expired()) {
            return std::unexpected(Error{ErrorCode::AddressInUse,
                fmt::format("address {} already bound", vaddr)});
        }
        listener = std::make_shared<MemoryListener>(state_, std::string(vaddr));
        state_->listeners.insert_or_assign(std::string(vaddr), listener);
    }
    state_->bound_cv.notify_all();
    CHANSERV_DEBUG("memory transport: bound {}", vaddr);
    return listener;
}

std::expected<std::unique_ptr<IConnection>, Error> MemoryMultiplexer::DialTimeout(
    std::string_view vaddr,
    std::chrono::milliseconds timeout,
    const DialOptions& options) {
    std::unique_lock<std::mutex> lock(state_->mutex);

    std::shared_ptr<MemoryListener> listener;
    auto found = [&] {
        auto it = state_->listeners.find(vaddr);
        if (it == state_->listeners.end()) return false;
        listener = std::static_pointer_cast<MemoryListener>(it->second.lock());
        return listener != nullptr;
    };
    if (!state_->bound_cv.wait_for(lock, timeout, found)) {
        return std::unexpected(Error{ErrorCode::DialTimeout,
            fmt::format("no listener at {} within {}ms", vaddr, timeout.count())});
    }

    auto up = std::make_shared<Pipe>(state_->pipe_capacity);    // dialer -> listener
    auto down = std::make_shared<Pipe>(state_->pipe_capacity);  // listener -> dialer
    std::string endpoint = fmt::format("mem:{}", state_->next_endpoint++);

    state_->PruneLinksLocked();
    state_->links[std::string(vaddr)].push_back(State::Link{up, down});
    lock.unlock();

    auto client = std::make_unique<MemoryConnection>(down, up, endpoint, std::string(vaddr));
    auto server = std::make_unique<MemoryConnection>(up, down, std::string(vaddr), endpoint);
    if (!listener->Enqueue(std::move(server))) {
        return std::unexpected(Error{ErrorCode::DialFailed,
            fmt::format("listener at {} closed while dialing", vaddr)});
    }
    CHANSERV_DEBUG("memory transport: {} dialed {}{}", endpoint, vaddr,
                   options.bucket ? fmt::format(" (bucket {})", *options.bucket) : std::string{});
    return client;
}

size_t MemoryMultiplexer::Sever(std::string_view vaddr) {
    std::vector<State::Link> links;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->links.find(vaddr);
        if (it == state_->links.end()) return 0;
        links = it->second;
    }
    size_t severed = 0;
    for (auto& link : links) {
        auto up = link.up.lock();
        auto down = link.down.lock();
        if (up) up->Reset();
        if (down) down->Reset();
        if (up || down) ++severed;
    }
    CHANSERV_DEBUG("memory transport: severed {} connection(s) on {}", severed, vaddr);
    return severed;
}

bool MemoryMultiplexer::IsBound(std::string_view vaddr) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->listeners.find(vaddr);
    return it != state_->listeners.end() && !it->second.expired();
}

size_t MemoryMultiplexer::LinkedAddressCount() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->links.size();
}

size_t MemoryMultiplexer::BoundCount() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return static_cast<size_t>(std::count_if(state_->listeners.begin(), state_->listeners.end(),
        [](const auto& kv) { return !kv.second.expired(); }));
}

}  // namespace chanserv
