// SPDX-License-Identifier: MIT

#include "src/subscriber.hpp"

#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "lib/stream/bridge.hpp"
#include "lib/stream/log.hpp"
#include "lib/stream/record_io.hpp"
#include "lib/stream/service_loop.hpp"
#include "lib/stream/task_group.hpp"
#include "src/compression.hpp"
#include "src/envelope.hpp"

namespace chanserv {

// State shared by a Subscriber and the Source handles it hands out.
// Tasks hold it by raw pointer; the Subscriber joins them before letting go.
struct Subscriber::Context {
    Context(IMultiplexer& m, ClientConfig c)
        : mux(m), config(std::move(c)), service(config.on_error) {}

    IMultiplexer& mux;
    const ClientConfig config;
    ServiceLoop service;
    TaskGroup tasks;
};

namespace {

class RemoteMeta : public MetaData {
public:
    explicit RemoteMeta(std::string addr) : addr_(std::move(addr)) {}
    std::string RemoteAddr() const override { return addr_; }

private:
    std::string addr_;
};

class RemoteSource : public Source {
public:
    RemoteSource(std::weak_ptr<Subscriber::Context> ctx,
                 AnnouncementRecord announcement,
                 const std::string& master_addr)
        : ctx_(std::move(ctx)),
          announcement_(std::move(announcement)),
          meta_(announcement_.origin_hint.empty() ? master_addr : announcement_.origin_hint) {}

    std::span<const std::byte> Header() const override { return announcement_.header; }
    const MetaData* Meta() const override { return &meta_; }

    Receiver<FramePtr>& Out() override {
        std::call_once(subscribed_, [this] { Subscribe(); });
        return out_;
    }

private:
    void Subscribe();

    std::weak_ptr<Subscriber::Context> ctx_;
    AnnouncementRecord announcement_;
    RemoteMeta meta_;
    std::once_flag subscribed_;
    Receiver<FramePtr> out_;
};

void RemoteSource::Subscribe() {
    auto ctx = ctx_.lock();
    if (!ctx) {
        // Subscriber is gone: hand out an already closed sequence
        auto [frames, out] = MakeChannel<FramePtr>(1);
        out_ = std::move(out);
        return;
    }

    auto [tx, rx] = MakeChannel<FramePtr>(ctx->config.frame_buffer);
    out_ = std::move(rx);
    auto frames = std::make_shared<Sender<FramePtr>>(std::move(tx));

    Subscriber::Context* raw = ctx.get();
    ctx->tasks.Spawn([raw, frames, sub_address = announcement_.sub_address,
                      compressed = announcement_.compressed](std::stop_token stop) {
        auto dialed = raw->mux.DialTimeout(sub_address, raw->config.dial_timeout, DialOptions{});
        if (!dialed) {
            if (!stop.stop_requested()) {
                raw->service.Report(dialed.error());
            }
            frames->Close();
            return;
        }
        std::shared_ptr<IConnection> conn(std::move(*dialed));
        CHANSERV_DEBUG("subscriber: dialed {}", sub_address);

        const size_t max_record_size = raw->config.max_record_size;
        Decoder<FramePtr> decode = [compressed, max_record_size](std::vector<std::byte>&& record)
            -> std::expected<FramePtr, Error> {
            auto payload = DecodeItem(std::move(record));
            if (!payload) {
                return std::unexpected(std::move(payload.error()));
            }
            if (!compressed) {
                return std::make_shared<BytesFrame>(std::move(*payload));
            }
            auto plain = Decompress(*payload, max_record_size);
            if (!plain) {
                return std::unexpected(std::move(plain.error()));
            }
            return std::make_shared<BytesFrame>(std::move(*plain));
        };
        ErrorHandler report = [raw](const Error& e) { raw->service.Report(e); };
        auto result = RunInbound<FramePtr>(conn, *frames, decode, report, stop, max_record_size);
        CHANSERV_DEBUG("subscriber: {} {}", sub_address, bridge_result_name(result));
    });
    // A refused spawn drops the last Sender, which closes the sequence
}

}  // namespace

Subscriber::Subscriber(IMultiplexer& mux, ClientConfig config)
    : ctx_(std::make_shared<Context>(mux, std::move(config))) {}

Subscriber::~Subscriber() {
    ctx_->tasks.RequestStop();
    ctx_->tasks.Join();
    ctx_->service.Stop();
}

std::expected<Receiver<SourcePtr>, Error> Subscriber::LookupAndPost(
    std::string_view vaddr,
    std::span<const std::byte> body,
    const RequestTags& tags) {
    DialOptions options;
    if (auto bucket = tags.find(RequestTag::Bucket); bucket != tags.end()) {
        options.bucket = bucket->second;
    }

    auto dialed = ctx_->mux.DialTimeout(vaddr, ctx_->config.dial_timeout, options);
    if (!dialed) {
        return std::unexpected(std::move(dialed.error()));
    }
    std::shared_ptr<IConnection> conn(std::move(*dialed));

    auto record = EncodeRequest(RequestRecord{
        .body = std::vector<std::byte>(body.begin(), body.end()),
        .tags = tags,
    });
    if (!record) {
        conn->Close();
        return std::unexpected(std::move(record.error()));
    }
    if (auto written = WriteRecord(*conn, *record, ctx_->config.max_record_size); !written) {
        conn->Close();
        return std::unexpected(std::move(written.error()));
    }

    auto [tx, rx] = MakeChannel<SourcePtr>(ctx_->config.source_buffer);
    auto sources = std::make_shared<Sender<SourcePtr>>(std::move(tx));

    Context* raw = ctx_.get();
    std::weak_ptr<Context> weak = ctx_;
    std::string master_addr = conn->RemoteAddr();
    bool spawned = ctx_->tasks.Spawn([raw, weak, conn, sources, master_addr](std::stop_token stop) {
        Decoder<SourcePtr> decode = [&weak, &master_addr](std::vector<std::byte>&& record)
            -> std::expected<SourcePtr, Error> {
            auto announcement = DecodeAnnouncement(record);
            if (!announcement) {
                return std::unexpected(std::move(announcement.error()));
            }
            CHANSERV_DEBUG("subscriber: {} announced {}", master_addr, announcement->sub_address);
            return std::make_shared<RemoteSource>(weak, std::move(*announcement), master_addr);
        };
        ErrorHandler report = [raw](const Error& e) { raw->service.Report(e); };
        auto result = RunInbound<SourcePtr>(conn, *sources, decode, report, stop,
                                            raw->config.max_record_size);
        CHANSERV_DEBUG("subscriber: announcements from {} {}", master_addr,
                       bridge_result_name(result));
    });
    if (!spawned) {
        conn->Close();
        return std::unexpected(Error{ErrorCode::InvalidState, "subscriber is shutting down"});
    }
    return std::move(rx);
}

}  // namespace chanserv
