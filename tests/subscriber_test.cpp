// SPDX-License-Identifier: MIT

// tests/subscriber_test.cpp
#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "lib/stream/memory_transport.hpp"
#include "lib/stream/record_io.hpp"
#include "src/dispatcher.hpp"
#include "src/envelope.hpp"
#include "src/subscriber.hpp"

using namespace chanserv;
using namespace std::chrono_literals;

namespace {

class ErrorSink {
public:
    ErrorHandler Handler() {
        return [this](const Error& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            errors_.push_back(e);
            cv_.notify_all();
        };
    }

    bool WaitFor(size_t n, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return errors_.size() >= n; });
    }

    std::vector<Error> errors() {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Error> errors_;
};

// Records every dial and forwards it to an in-process multiplexer
class MockMultiplexer : public IMultiplexer {
public:
    struct Dial {
        std::string vaddr;
        std::optional<std::string> bucket;
    };

    explicit MockMultiplexer(MemoryMultiplexer& real) : real_(real) {}

    std::expected<std::shared_ptr<IListener>, Error> Bind(std::string_view vaddr) override {
        return real_.Bind(vaddr);
    }

    std::expected<std::unique_ptr<IConnection>, Error> DialTimeout(
        std::string_view vaddr,
        std::chrono::milliseconds timeout,
        const DialOptions& options) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dials_.push_back(Dial{std::string(vaddr), options.bucket});
        }
        return real_.DialTimeout(vaddr, timeout, options);
    }

    std::vector<Dial> dials() {
        std::lock_guard<std::mutex> lock(mutex_);
        return dials_;
    }

private:
    MemoryMultiplexer& real_;
    std::mutex mutex_;
    std::vector<Dial> dials_;
};

SourceFunc OneSource(std::string header, std::vector<std::string> frames) {
    return [header, frames](std::span<const std::byte>) {
        auto [tx, rx] = MakeChannel<SourcePtr>(1);
        auto feed = MakeSource(ToBytes(header), frames.size() + 1);
        for (const auto& f : frames) {
            feed.frames.Send(BytesFrame::From(f));
        }
        tx.Send(feed.source);
        return std::move(rx);
    };
}

std::vector<std::string> Drain(Receiver<FramePtr>& frames) {
    std::vector<std::string> out;
    while (auto frame = frames.Receive()) {
        out.push_back(ToString((*frame)->Bytes()));
    }
    return out;
}

}  // namespace

class SubscriberTest : public ::testing::Test {
protected:
    ClientConfig Config() {
        ClientConfig config;
        config.dial_timeout = 500ms;
        config.on_error = sink_.Handler();
        return config;
    }

    // Accept one master connection on @p vaddr and return it with its request
    std::pair<std::shared_ptr<IConnection>, RequestRecord> AcceptRequest(IListener& listener) {
        auto accepted = listener.Accept();
        EXPECT_TRUE(accepted.has_value());
        if (!accepted) return {};
        std::shared_ptr<IConnection> conn(std::move(*accepted));
        RecordReader reader(*conn);
        auto record = reader.Next();
        EXPECT_TRUE(record.has_value() && record->has_value());
        if (!record || !*record) return {conn, {}};
        auto request = DecodeRequest(**record);
        EXPECT_TRUE(request.has_value());
        return {conn, request ? std::move(*request) : RequestRecord{}};
    }

    MemoryMultiplexer mux_;
    ErrorSink sink_;
};

TEST_F(SubscriberTest, DialTimeoutWhenNothingIsBound) {
    auto config = Config();
    config.dial_timeout = 50ms;
    Subscriber subscriber(mux_, config);

    auto start = std::chrono::steady_clock::now();
    auto sources = subscriber.LookupAndPost("nobody", ToBytes("hello"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(sources.has_value());
    EXPECT_EQ(sources.error().code, ErrorCode::DialTimeout);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(SubscriberTest, ReceivesHeaderMetaAndFrames) {
    Dispatcher dispatcher(mux_);
    ASSERT_TRUE(dispatcher.Start("svc", OneSource("source @0", {"x", "y"})).has_value());

    Subscriber subscriber(mux_, Config());
    auto sources = subscriber.LookupAndPost("svc", ToBytes("hello"));
    ASSERT_TRUE(sources.has_value());

    auto source = sources->Receive();
    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(ToString((*source)->Header()), "source @0");
    ASSERT_NE((*source)->Meta(), nullptr);
    EXPECT_EQ((*source)->Meta()->RemoteAddr(), "svc");

    EXPECT_EQ(Drain((*source)->Out()), (std::vector<std::string>{"x", "y"}));
    EXPECT_FALSE(sources->Receive().has_value());
    EXPECT_TRUE(sink_.errors().empty());
}

TEST_F(SubscriberTest, RequestCarriesBodyAndTags) {
    auto bound = mux_.Bind("svc");
    ASSERT_TRUE(bound.has_value());

    Subscriber subscriber(mux_, Config());
    auto sources = subscriber.LookupAndPost("svc", ToBytes("payload"),
                                            {{RequestTag::Bucket, "shard-3"}});
    ASSERT_TRUE(sources.has_value());

    auto [conn, request] = AcceptRequest(**bound);
    ASSERT_TRUE(conn);
    EXPECT_EQ(ToString(request.body), "payload");
    EXPECT_EQ(request.tags.at(RequestTag::Bucket), "shard-3");

    conn->CloseWrite();
    EXPECT_FALSE(sources->Receive().has_value());
}

TEST_F(SubscriberTest, BucketIsForwardedToMasterDialOnly) {
    Dispatcher dispatcher(mux_);
    ASSERT_TRUE(dispatcher.Start("svc", OneSource("", {"f"})).has_value());

    MockMultiplexer mock(mux_);
    Subscriber subscriber(mock, Config());
    auto sources = subscriber.LookupAndPost("svc", ToBytes(""), {{RequestTag::Bucket, "shard-3"}});
    ASSERT_TRUE(sources.has_value());
    auto source = sources->Receive();
    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(Drain((*source)->Out()), (std::vector<std::string>{"f"}));

    auto dials = mock.dials();
    ASSERT_EQ(dials.size(), 2u);
    EXPECT_EQ(dials[0].vaddr, "svc");
    EXPECT_EQ(dials[0].bucket, std::optional<std::string>("shard-3"));
    EXPECT_EQ(dials[1].vaddr, "svc#1");
    EXPECT_FALSE(dials[1].bucket.has_value());
}

TEST_F(SubscriberTest, NoBucketWithoutTag) {
    Dispatcher dispatcher(mux_);
    ASSERT_TRUE(dispatcher.Start("svc", [](std::span<const std::byte>) {
        auto [tx, rx] = MakeChannel<SourcePtr>(1);
        return std::move(rx);
    }).has_value());

    MockMultiplexer mock(mux_);
    Subscriber subscriber(mock, Config());
    auto sources = subscriber.LookupAndPost("svc", ToBytes(""), {{RequestTag::Meta, "m"}});
    ASSERT_TRUE(sources.has_value());
    EXPECT_FALSE(sources->Receive().has_value());

    auto dials = mock.dials();
    ASSERT_EQ(dials.size(), 1u);
    EXPECT_FALSE(dials[0].bucket.has_value());
}

TEST_F(SubscriberTest, SubAddressIsDialedOnFirstOut) {
    Dispatcher dispatcher(mux_);
    ASSERT_TRUE(dispatcher.Start("svc", OneSource("lazy", {"1", "2", "3"})).has_value());

    MockMultiplexer mock(mux_);
    Subscriber subscriber(mock, Config());
    auto sources = subscriber.LookupAndPost("svc", ToBytes(""));
    ASSERT_TRUE(sources.has_value());
    auto source = sources->Receive();
    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(ToString((*source)->Header()), "lazy");

    std::this_thread::sleep_for(30ms);
    ASSERT_EQ(mock.dials().size(), 1u);

    EXPECT_EQ(Drain((*source)->Out()), (std::vector<std::string>{"1", "2", "3"}));
    auto dials = mock.dials();
    ASSERT_EQ(dials.size(), 2u);
    EXPECT_EQ(dials[1].vaddr, "svc#1");

    // Repeated Out() returns the same, now drained, sequence
    EXPECT_FALSE((*source)->Out().Receive().has_value());
    EXPECT_EQ(mock.dials().size(), 2u);
}

TEST_F(SubscriberTest, OriginFallsBackToMasterAddress) {
    auto bound = mux_.Bind("svc");
    ASSERT_TRUE(bound.has_value());

    Subscriber subscriber(mux_, Config());
    auto sources = subscriber.LookupAndPost("svc", ToBytes(""));
    ASSERT_TRUE(sources.has_value());

    auto [conn, request] = AcceptRequest(**bound);
    ASSERT_TRUE(conn);
    auto record = EncodeAnnouncement(AnnouncementRecord{.sub_address = "elsewhere#1"});
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(WriteRecord(*conn, *record).has_value());
    conn->CloseWrite();

    auto source = sources->Receive();
    ASSERT_TRUE(source.has_value());
    ASSERT_NE((*source)->Meta(), nullptr);
    EXPECT_EQ((*source)->Meta()->RemoteAddr(), "svc");
    EXPECT_FALSE(sources->Receive().has_value());
}

TEST_F(SubscriberTest, UnreachableSubAddressClosesFramesAndReports) {
    auto bound = mux_.Bind("svc");
    ASSERT_TRUE(bound.has_value());

    auto config = Config();
    config.dial_timeout = 50ms;
    Subscriber subscriber(mux_, config);
    auto sources = subscriber.LookupAndPost("svc", ToBytes(""));
    ASSERT_TRUE(sources.has_value());

    auto [conn, request] = AcceptRequest(**bound);
    ASSERT_TRUE(conn);
    auto record = EncodeAnnouncement(AnnouncementRecord{.sub_address = "svc#9", .origin_hint = "svc"});
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(WriteRecord(*conn, *record).has_value());

    auto source = sources->Receive();
    ASSERT_TRUE(source.has_value());
    EXPECT_FALSE((*source)->Out().Receive().has_value());

    ASSERT_TRUE(sink_.WaitFor(1));
    EXPECT_EQ(sink_.errors()[0].code, ErrorCode::DialTimeout);
}

TEST_F(SubscriberTest, MalformedAnnouncementEndsSequenceAndReports) {
    auto bound = mux_.Bind("svc");
    ASSERT_TRUE(bound.has_value());

    Subscriber subscriber(mux_, Config());
    auto sources = subscriber.LookupAndPost("svc", ToBytes(""));
    ASSERT_TRUE(sources.has_value());

    auto [conn, request] = AcceptRequest(**bound);
    ASSERT_TRUE(conn);
    ASSERT_TRUE(WriteRecord(*conn, EncodeItem(ToBytes("stray"))).has_value());

    // Closed like a normal end; the failure goes to the hook only
    EXPECT_FALSE(sources->Receive().has_value());
    ASSERT_TRUE(sink_.WaitFor(1));
    EXPECT_EQ(sink_.errors()[0].code, ErrorCode::UnexpectedRecord);
}

TEST_F(SubscriberTest, DroppingSourcesClosesMasterConnection) {
    auto bound = mux_.Bind("svc");
    ASSERT_TRUE(bound.has_value());

    Subscriber subscriber(mux_, Config());
    auto sources = subscriber.LookupAndPost("svc", ToBytes(""));
    ASSERT_TRUE(sources.has_value());

    auto [conn, request] = AcceptRequest(**bound);
    ASSERT_TRUE(conn);

    sources->Abandon();
    std::array<std::byte, 8> buf;
    auto n = conn->Read(buf);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(*n, 0u);
}

TEST_F(SubscriberTest, SourceOutlivingSubscriberIsEmpty) {
    Dispatcher dispatcher(mux_);
    ASSERT_TRUE(dispatcher.Start("svc", OneSource("orphan", {"never seen"})).has_value());

    SourcePtr source;
    {
        Subscriber subscriber(mux_, Config());
        auto sources = subscriber.LookupAndPost("svc", ToBytes(""));
        ASSERT_TRUE(sources.has_value());
        auto received = sources->Receive();
        ASSERT_TRUE(received.has_value());
        source = *received;
    }

    EXPECT_EQ(ToString(source->Header()), "orphan");
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(source->Out().Receive().has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}
