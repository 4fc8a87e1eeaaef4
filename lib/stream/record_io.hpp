// SPDX-License-Identifier: MIT

// lib/stream/record_io.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

#include "lib/stream/error.hpp"
#include "lib/stream/transport.hpp"

namespace chanserv {

/// Record framing: u32 big-endian body length, then the body.
inline constexpr size_t kRecordHeaderSize = 4;
inline constexpr size_t kDefaultMaxRecordSize = 64 * 1024 * 1024;

/// Write one framed record.
/// @return BufferOverflow if @p body exceeds @p max_record_size, or the
///         connection's write error.
std::expected<void, Error> WriteRecord(IConnection& conn,
                                       std::span<const std::byte> body,
                                       size_t max_record_size = kDefaultMaxRecordSize);

/// Buffered reader splitting a connection's byte stream into records.
///
/// Not thread-safe; one reader per connection.
class RecordReader {
public:
    explicit RecordReader(IConnection& conn, size_t max_record_size = kDefaultMaxRecordSize)
        : conn_(conn), max_record_size_(max_record_size) {}

    RecordReader(const RecordReader&) = delete;
    RecordReader& operator=(const RecordReader&) = delete;

    /// Read the next record body.
    /// @return the body; nullopt on clean end-of-stream at a record
    ///         boundary; ParseError if the stream ends inside a record;
    ///         BufferOverflow if the announced length exceeds the limit;
    ///         otherwise the connection's read error.
    std::expected<std::optional<std::vector<std::byte>>, Error> Next();

private:
    // Ensure at least @p need bytes are buffered. false = end-of-stream first.
    std::expected<bool, Error> Fill(size_t need);
    size_t Buffered() const { return buffer_.size() - start_; }

    static constexpr size_t kReadChunk = 16 * 1024;

    IConnection& conn_;
    size_t max_record_size_;
    std::vector<std::byte> buffer_;
    size_t start_ = 0;
};

}  // namespace chanserv
