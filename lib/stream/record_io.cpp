// SPDX-License-Identifier: MIT

#include "lib/stream/record_io.hpp"

#include <utility>

#include <fmt/format.h>

#include "lib/stream/byte_buffer.hpp"

namespace chanserv {

std::expected<void, Error> WriteRecord(IConnection& conn,
                                       std::span<const std::byte> body,
                                       size_t max_record_size) {
    if (body.size() > max_record_size) {
        return std::unexpected(Error{ErrorCode::BufferOverflow,
            fmt::format("record of {} bytes exceeds limit of {}", body.size(), max_record_size)});
    }
    ByteBuffer buf;
    buf.reserve(kRecordHeaderSize + body.size());
    buf.put_uint32_be(static_cast<uint32_t>(body.size()));
    buf.put_bytes(body);
    return conn.Write(buf.view());
}

std::expected<std::optional<std::vector<std::byte>>, Error> RecordReader::Next() {
    auto header = Fill(kRecordHeaderSize);
    if (!header) return std::unexpected(std::move(header.error()));
    if (!*header) {
        if (Buffered() == 0) {
            return std::optional<std::vector<std::byte>>{};
        }
        return std::unexpected(Error{ErrorCode::ParseError,
            fmt::format("stream ended inside record header ({} bytes)", Buffered())});
    }

    ByteReader reader(std::span<const std::byte>(buffer_).subspan(start_, kRecordHeaderSize));
    auto length = reader.get_uint32_be();
    if (!length) return std::unexpected(std::move(length.error()));
    if (*length > max_record_size_) {
        return std::unexpected(Error{ErrorCode::BufferOverflow,
            fmt::format("record of {} bytes exceeds limit of {}", *length, max_record_size_)});
    }

    auto body = Fill(kRecordHeaderSize + *length);
    if (!body) return std::unexpected(std::move(body.error()));
    if (!*body) {
        return std::unexpected(Error{ErrorCode::ParseError,
            fmt::format("stream ended inside record: have {} of {} bytes",
                        Buffered() - kRecordHeaderSize, *length)});
    }

    auto first = buffer_.begin() + static_cast<std::ptrdiff_t>(start_ + kRecordHeaderSize);
    std::vector<std::byte> record(first, first + static_cast<std::ptrdiff_t>(*length));
    start_ += kRecordHeaderSize + *length;

    // Compact once everything buffered has been consumed
    if (start_ == buffer_.size()) {
        buffer_.clear();
        start_ = 0;
    }
    return std::optional<std::vector<std::byte>>(std::move(record));
}

std::expected<bool, Error> RecordReader::Fill(size_t need) {
    if (Buffered() >= need) return true;

    if (start_ > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(start_));
        start_ = 0;
    }
    while (buffer_.size() < need) {
        size_t old_size = buffer_.size();
        buffer_.resize(old_size + kReadChunk);
        auto n = conn_.Read(std::span<std::byte>(buffer_).subspan(old_size));
        if (!n) {
            buffer_.resize(old_size);
            return std::unexpected(std::move(n.error()));
        }
        buffer_.resize(old_size + *n);
        if (*n == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace chanserv
