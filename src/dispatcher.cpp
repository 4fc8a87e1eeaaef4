// SPDX-License-Identifier: MIT

#include "src/dispatcher.hpp"

#include <exception>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "lib/stream/bridge.hpp"
#include "lib/stream/log.hpp"
#include "lib/stream/record_io.hpp"
#include "src/compression.hpp"
#include "src/envelope.hpp"

namespace chanserv {

namespace {

// Sub-address lifecycle, shared with the grace timer
enum SubAddressState : int {
    kWaiting = 0,
    kAccepted = 1,
    kExpired = 2,
};

}  // namespace

Dispatcher::Dispatcher(IMultiplexer& mux, ServerConfig config)
    : mux_(mux), config_(std::move(config)), service_(config_.on_error) {}

Dispatcher::~Dispatcher() {
    Stop();
}

std::expected<void, Error> Dispatcher::Start(std::string_view vaddr, SourceFunc fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || stopping_) {
        return std::unexpected(Error{ErrorCode::InvalidState,
            started_ ? "dispatcher already started" : "dispatcher stopped"});
    }
    if (!fn) {
        return std::unexpected(Error{ErrorCode::InvalidState, "empty source callback"});
    }

    auto listener = mux_.Bind(vaddr);
    if (!listener) {
        return std::unexpected(std::move(listener.error()));
    }
    vaddr_ = std::string(vaddr);
    listener_ = std::move(*listener);
    fn_ = std::move(fn);
    started_ = true;

    CHANSERV_DEBUG("dispatcher: serving {}", vaddr_);
    tasks_.Spawn([this](std::stop_token stop) { AcceptLoop(stop); });
    return {};
}

std::expected<void, Error> Dispatcher::ListenAndServe(std::string_view vaddr, SourceFunc fn) {
    auto started = Start(vaddr, std::move(fn));
    if (!started) {
        return started;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    stopped_cv_.wait(lock, [this] { return stopped_; });
    return {};
}

void Dispatcher::Stop() {
    std::shared_ptr<IListener> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
        listener = listener_;
    }

    // Stop first so the accept loop treats the listener close as shutdown
    tasks_.RequestStop();
    if (listener) {
        listener->Close();
    }
    tasks_.Join();
    service_.Stop();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    stopped_cv_.notify_all();
    if (listener) {
        CHANSERV_DEBUG("dispatcher: stopped {}", listener->Addr());
    }
}

std::string Dispatcher::Addr() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return vaddr_;
}

void Dispatcher::AcceptLoop(std::stop_token stop) {
    std::stop_callback close_on_stop(stop, [listener = listener_] { listener->Close(); });

    for (;;) {
        auto accepted = listener_->Accept();
        if (!accepted) {
            if (!stop.stop_requested()) {
                service_.Report(accepted.error());
            }
            return;
        }
        std::shared_ptr<IConnection> conn(std::move(*accepted));
        CHANSERV_DEBUG("dispatcher: {} accepted {}", vaddr_, conn->RemoteAddr());
        if (!tasks_.Spawn([this, conn](std::stop_token s) { ServeRequest(conn, s); })) {
            conn->Close();
            return;
        }
    }
}

void Dispatcher::ServeRequest(std::shared_ptr<IConnection> conn, std::stop_token stop) {
    std::stop_callback close_on_stop(stop, [conn] { conn->Close(); });

    RecordReader reader(*conn, config_.max_record_size);
    auto record = reader.Next();
    if (!record) {
        if (!stop.stop_requested()) {
            service_.Report(record.error());
        }
        conn->Close();
        return;
    }
    if (!*record) {
        CHANSERV_DEBUG("dispatcher: {} closed before sending a request", conn->RemoteAddr());
        conn->Close();
        return;
    }

    auto request = DecodeRequest(**record);
    if (!request) {
        service_.Report(request.error());
        conn->Close();
        return;
    }
    if (auto bucket = request->tags.find(RequestTag::Bucket); bucket != request->tags.end()) {
        CHANSERV_DEBUG("dispatcher: request from {} for bucket {}", conn->RemoteAddr(), bucket->second);
    }

    Receiver<SourcePtr> sources;
    try {
        sources = fn_(request->body);
    } catch (const std::exception& e) {
        service_.Report(Error{ErrorCode::CallbackFailed,
            fmt::format("source callback threw: {}", e.what())});
        conn->Close();
        return;
    }

    // Bound by the encoder, served only once its announcement is written
    std::shared_ptr<IListener> unwritten;
    SourcePtr unwritten_source;
    Encoder<SourcePtr> encode = [this, &unwritten, &unwritten_source](const SourcePtr& source)
        -> std::expected<std::vector<std::byte>, Error> {
        auto announced = Announce(source);
        if (!announced) {
            return std::unexpected(std::move(announced.error()));
        }
        unwritten = std::move(announced->listener);
        unwritten_source = source;
        return std::move(announced->record);
    };
    WrittenHook<SourcePtr> serve = [this, &unwritten, &unwritten_source](const SourcePtr& source) {
        auto listener = std::exchange(unwritten, nullptr);
        unwritten_source.reset();
        if (!tasks_.Spawn([this, listener, source](std::stop_token s) {
                ServeSource(listener, source, s);
            })) {
            Withdraw(listener, source);
            return;
        }
        CHANSERV_DEBUG("dispatcher: announced {}", listener->Addr());
    };
    ErrorHandler report = [this](const Error& e) { service_.Report(e); };
    auto result = RunOutbound<SourcePtr>(conn, sources, encode, report, stop,
                                         config_.max_record_size, serve);
    if (unwritten) {
        // The last announcement never made it onto the connection
        Withdraw(unwritten, unwritten_source);
    }
    CHANSERV_DEBUG("dispatcher: announcements to {} {}", conn->RemoteAddr(),
                   bridge_result_name(result));
}

std::expected<Dispatcher::Announcement, Error> Dispatcher::Announce(const SourcePtr& source) {
    if (!source) {
        return std::unexpected(Error{ErrorCode::InvalidState, "source callback yielded a null Source"});
    }

    std::string sub_address = fmt::format("{}#{}", vaddr_, next_sub_.fetch_add(1));
    auto header = source->Header();
    AnnouncementRecord announcement{
        .header = std::vector<std::byte>(header.begin(), header.end()),
        .sub_address = sub_address,
        .origin_hint = vaddr_,
        .compressed = config_.compression_level > 0,
    };
    auto record = EncodeAnnouncement(announcement);
    if (record && record->size() > config_.max_record_size) {
        record = std::unexpected(Error{ErrorCode::BufferOverflow,
            fmt::format("announcement of {} bytes for {} exceeds limit of {}",
                        record->size(), sub_address, config_.max_record_size)});
    }
    if (!record) {
        Withdraw(nullptr, source);
        return std::unexpected(std::move(record.error()));
    }

    // Bound before the announcement is written, so it can be dialed at once
    auto bound = mux_.Bind(sub_address);
    if (!bound) {
        Withdraw(nullptr, source);
        return std::unexpected(std::move(bound.error()));
    }
    return Announcement{std::move(*record), std::move(*bound)};
}

void Dispatcher::Withdraw(const std::shared_ptr<IListener>& listener, const SourcePtr& source) {
    if (listener) {
        CHANSERV_DEBUG("dispatcher: withdrawing {}", listener->Addr());
        listener->Close();
    }
    if (source) {
        source->Out().Abandon();
    }
}

void Dispatcher::ServeSource(std::shared_ptr<IListener> listener, SourcePtr source,
                             std::stop_token stop) {
    auto state = std::make_shared<std::atomic<int>>(kWaiting);
    service_.After(config_.source_timeout, [listener, state] {
        int waiting = kWaiting;
        if (state->compare_exchange_strong(waiting, kExpired)) {
            listener->Close();
        }
    });
    std::stop_callback close_on_stop(stop, [listener] { listener->Close(); });

    auto accepted = listener->Accept();
    // One connection per sub-address
    listener->Close();

    if (!accepted) {
        if (state->load() == kExpired) {
            service_.Report(Error{ErrorCode::SourceTimeout,
                fmt::format("{} was not dialed within {}ms", listener->Addr(),
                            config_.source_timeout.count())});
        } else if (!stop.stop_requested()) {
            service_.Report(accepted.error());
        }
        source->Out().Abandon();
        return;
    }
    int waiting = kWaiting;
    state->compare_exchange_strong(waiting, kAccepted);

    std::shared_ptr<IConnection> conn(std::move(*accepted));
    CHANSERV_DEBUG("dispatcher: {} dialed by {}", listener->Addr(), conn->RemoteAddr());

    const int level = config_.compression_level;
    Encoder<FramePtr> encode = [level](const FramePtr& frame)
        -> std::expected<std::vector<std::byte>, Error> {
        std::span<const std::byte> payload;
        if (frame) {
            payload = frame->Bytes();
        }
        if (level <= 0) {
            return EncodeItem(payload);
        }
        auto packed = Compress(payload, level);
        if (!packed) {
            return std::unexpected(std::move(packed.error()));
        }
        return EncodeItem(*packed);
    };
    ErrorHandler report = [this](const Error& e) { service_.Report(e); };
    auto result = RunOutbound<FramePtr>(conn, source->Out(), encode, report, stop,
                                        config_.max_record_size);
    CHANSERV_DEBUG("dispatcher: {} {}", listener->Addr(), bridge_result_name(result));
}

}  // namespace chanserv
