// SPDX-License-Identifier: MIT

// tests/record_io_test.cpp
#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "lib/stream/record_io.hpp"

using namespace chanserv;

namespace {

// Connection replaying scripted reads and recording writes
class ScriptedConnection : public IConnection {
public:
    void Feed(std::vector<std::byte> chunk) { reads_.push_back(std::move(chunk)); }
    void FailNextRead(Error e) { fail_ = std::move(e); }

    std::expected<size_t, Error> Read(std::span<std::byte> buf) override {
        if (reads_.empty()) {
            if (fail_) return std::unexpected(*fail_);
            return size_t{0};
        }
        auto& front = reads_.front();
        size_t n = std::min(buf.size(), front.size());
        std::copy_n(front.begin(), n, buf.begin());
        front.erase(front.begin(), front.begin() + static_cast<std::ptrdiff_t>(n));
        if (front.empty()) reads_.pop_front();
        return n;
    }

    std::expected<void, Error> Write(std::span<const std::byte> data) override {
        written_.insert(written_.end(), data.begin(), data.end());
        ++writes_;
        return {};
    }

    void CloseWrite() override {}
    void Close() override {}
    std::string LocalAddr() const override { return "local"; }
    std::string RemoteAddr() const override { return "remote"; }

    const std::vector<std::byte>& written() const { return written_; }
    int writes() const { return writes_; }

private:
    std::deque<std::vector<std::byte>> reads_;
    std::optional<Error> fail_;
    std::vector<std::byte> written_;
    int writes_ = 0;
};

std::vector<std::byte> Bytes(std::string_view s) {
    std::vector<std::byte> out(s.size());
    std::memcpy(out.data(), s.data(), s.size());
    return out;
}

std::string Str(const std::vector<std::byte>& b) {
    return std::string(reinterpret_cast<const char*>(b.data()), b.size());
}

}  // namespace

TEST(RecordIoTest, WriteRecordPrefixesLength) {
    ScriptedConnection conn;
    ASSERT_TRUE(WriteRecord(conn, Bytes("abc")).has_value());

    const auto& w = conn.written();
    ASSERT_EQ(w.size(), 7u);
    EXPECT_EQ(std::to_integer<int>(w[0]), 0);
    EXPECT_EQ(std::to_integer<int>(w[3]), 3);
    EXPECT_EQ(Str({w.begin() + 4, w.end()}), "abc");
    // Header and body go out in one write
    EXPECT_EQ(conn.writes(), 1);
}

TEST(RecordIoTest, WriteRecordRejectsOversized) {
    ScriptedConnection conn;
    auto result = WriteRecord(conn, Bytes("too long"), 4);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::BufferOverflow);
    EXPECT_TRUE(conn.written().empty());
}

TEST(RecordIoTest, ReadsRecordsSplitAcrossReads) {
    ScriptedConnection out;
    ASSERT_TRUE(WriteRecord(out, Bytes("first")).has_value());
    ASSERT_TRUE(WriteRecord(out, Bytes("")).has_value());
    ASSERT_TRUE(WriteRecord(out, Bytes("third")).has_value());

    // Replay the stream one byte at a time
    ScriptedConnection in;
    for (auto b : out.written()) in.Feed({b});

    RecordReader reader(in);
    auto r1 = reader.Next();
    ASSERT_TRUE(r1.has_value() && r1->has_value());
    EXPECT_EQ(Str(**r1), "first");
    auto r2 = reader.Next();
    ASSERT_TRUE(r2.has_value() && r2->has_value());
    EXPECT_TRUE((*r2)->empty());
    auto r3 = reader.Next();
    ASSERT_TRUE(r3.has_value() && r3->has_value());
    EXPECT_EQ(Str(**r3), "third");

    auto end = reader.Next();
    ASSERT_TRUE(end.has_value());
    EXPECT_FALSE(end->has_value());
}

TEST(RecordIoTest, ReadsManyRecordsFromOneChunk) {
    ScriptedConnection out;
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(WriteRecord(out, Bytes(std::to_string(i))).has_value());
    }
    ScriptedConnection in;
    in.Feed(out.written());

    RecordReader reader(in);
    for (int i = 0; i < 10; ++i) {
        auto r = reader.Next();
        ASSERT_TRUE(r.has_value() && r->has_value());
        EXPECT_EQ(Str(**r), std::to_string(i));
    }
    auto end = reader.Next();
    ASSERT_TRUE(end.has_value());
    EXPECT_FALSE(end->has_value());
}

TEST(RecordIoTest, EndOfStreamInsideHeaderIsParseError) {
    ScriptedConnection in;
    in.Feed({std::byte{0}, std::byte{0}});

    RecordReader reader(in);
    auto r = reader.Next();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ParseError);
}

TEST(RecordIoTest, EndOfStreamInsideBodyIsParseError) {
    ScriptedConnection in;
    in.Feed({std::byte{0}, std::byte{0}, std::byte{0}, std::byte{8}, std::byte{'a'}});

    RecordReader reader(in);
    auto r = reader.Next();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ParseError);
    EXPECT_NE(r.error().message.find("1 of 8"), std::string::npos);
}

TEST(RecordIoTest, OversizedLengthIsRejected) {
    ScriptedConnection in;
    in.Feed({std::byte{0}, std::byte{1}, std::byte{0}, std::byte{0}});

    RecordReader reader(in, 1024);
    auto r = reader.Next();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::BufferOverflow);
}

TEST(RecordIoTest, ReadErrorIsPassedThrough) {
    ScriptedConnection in;
    in.FailNextRead(Error{ErrorCode::ConnectionReset, "reset"});

    RecordReader reader(in);
    auto r = reader.Next();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ConnectionReset);
}
