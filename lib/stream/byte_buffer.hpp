// SPDX-License-Identifier: MIT

// lib/stream/byte_buffer.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"

namespace chanserv {

// Big-endian writer for record bodies
class ByteBuffer {
public:
    void put_uint8(uint8_t val);
    void put_uint16_be(uint16_t val);
    void put_uint32_be(uint32_t val);
    void put_uint64_be(uint64_t val);
    void put_bytes(std::span<const std::byte> data);

    std::span<const std::byte> view() const { return data_; }
    std::vector<std::byte> take() { return std::move(data_); }
    void reserve(size_t n) { data_.reserve(n); }
    void clear() { data_.clear(); }
    size_t size() const { return data_.size(); }

private:
    std::vector<std::byte> data_;
};

// Bounds-checked big-endian reader over a borrowed span.
// Every getter fails with ErrorCode::ParseError when the input is short.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::byte> data) : data_(data) {}

    std::expected<uint8_t, Error> get_uint8();
    std::expected<uint16_t, Error> get_uint16_be();
    std::expected<uint32_t, Error> get_uint32_be();
    std::expected<uint64_t, Error> get_uint64_be();
    std::expected<std::span<const std::byte>, Error> get_bytes(size_t n);

    std::span<const std::byte> rest() const { return data_.subspan(pos_); }
    size_t remaining() const { return data_.size() - pos_; }
    bool empty() const { return remaining() == 0; }

private:
    std::expected<uint64_t, Error> get_be(size_t width);

    std::span<const std::byte> data_;
    size_t pos_ = 0;
};

}  // namespace chanserv
