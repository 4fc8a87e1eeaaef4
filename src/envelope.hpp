// SPDX-License-Identifier: MIT

// src/envelope.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "lib/stream/error.hpp"
#include "src/chanserv.hpp"

namespace chanserv {

// Record bodies exchanged by Dispatcher and Subscriber. Every body starts
// with a one-byte kind:
//
//   Request       u16 tag_count, {u8 tag, u32 len, bytes}*, u32 body_len, body
//   Announcement  u8 flags, u32 header_len, header, u16 addr_len, sub_address,
//                 u16 hint_len, origin_hint
//   Item          payload bytes
//
// All integers are big-endian.

enum class RecordKind : uint8_t {
    Request = 1,
    Announcement = 2,
    Item = 3,
};

/// Announcement flag: item payloads on the sub-address are zstd frames.
inline constexpr uint8_t kAnnounceCompressed = 0x01;

struct RequestRecord {
    std::vector<std::byte> body;
    RequestTags tags;
};

struct AnnouncementRecord {
    std::vector<std::byte> header;
    std::string sub_address;
    std::string origin_hint;    ///< Announcing dispatcher's virtual address
    bool compressed = false;
};

std::expected<std::vector<std::byte>, Error> EncodeRequest(const RequestRecord& request);
std::expected<RequestRecord, Error> DecodeRequest(std::span<const std::byte> record);

std::expected<std::vector<std::byte>, Error> EncodeAnnouncement(const AnnouncementRecord& announcement);
std::expected<AnnouncementRecord, Error> DecodeAnnouncement(std::span<const std::byte> record);

std::vector<std::byte> EncodeItem(std::span<const std::byte> payload);

/// Strip the kind byte in place and return the payload.
std::expected<std::vector<std::byte>, Error> DecodeItem(std::vector<std::byte>&& record);

}  // namespace chanserv
