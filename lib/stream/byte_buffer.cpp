// SPDX-License-Identifier: MIT

#include "lib/stream/byte_buffer.hpp"

#include <string>
#include <utility>

namespace chanserv {

void ByteBuffer::put_uint8(uint8_t val) {
    data_.push_back(static_cast<std::byte>(val));
}

void ByteBuffer::put_uint16_be(uint16_t val) {
    data_.push_back(static_cast<std::byte>(val >> 8));
    data_.push_back(static_cast<std::byte>(val));
}

void ByteBuffer::put_uint32_be(uint32_t val) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        data_.push_back(static_cast<std::byte>(val >> shift));
    }
}

void ByteBuffer::put_uint64_be(uint64_t val) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        data_.push_back(static_cast<std::byte>(val >> shift));
    }
}

void ByteBuffer::put_bytes(std::span<const std::byte> data) {
    data_.insert(data_.end(), data.begin(), data.end());
}

std::expected<uint64_t, Error> ByteReader::get_be(size_t width) {
    if (remaining() < width) {
        return std::unexpected(Error{ErrorCode::ParseError,
            "truncated field: need " + std::to_string(width) + " bytes, have " +
            std::to_string(remaining())});
    }
    uint64_t val = 0;
    for (size_t i = 0; i < width; ++i) {
        val = (val << 8) | std::to_integer<uint64_t>(data_[pos_ + i]);
    }
    pos_ += width;
    return val;
}

std::expected<uint8_t, Error> ByteReader::get_uint8() {
    auto v = get_be(1);
    if (!v) return std::unexpected(std::move(v.error()));
    return static_cast<uint8_t>(*v);
}

std::expected<uint16_t, Error> ByteReader::get_uint16_be() {
    auto v = get_be(2);
    if (!v) return std::unexpected(std::move(v.error()));
    return static_cast<uint16_t>(*v);
}

std::expected<uint32_t, Error> ByteReader::get_uint32_be() {
    auto v = get_be(4);
    if (!v) return std::unexpected(std::move(v.error()));
    return static_cast<uint32_t>(*v);
}

std::expected<uint64_t, Error> ByteReader::get_uint64_be() {
    return get_be(8);
}

std::expected<std::span<const std::byte>, Error> ByteReader::get_bytes(size_t n) {
    if (remaining() < n) {
        return std::unexpected(Error{ErrorCode::ParseError,
            "truncated payload: need " + std::to_string(n) + " bytes, have " +
            std::to_string(remaining())});
    }
    auto out = data_.subspan(pos_, n);
    pos_ += n;
    return out;
}

}  // namespace chanserv
