// SPDX-License-Identifier: MIT

#include "src/envelope.hpp"

#include <limits>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/byte_buffer.hpp"

namespace chanserv {

namespace {

std::expected<ByteReader, Error> OpenRecord(std::span<const std::byte> record, RecordKind want) {
    ByteReader reader(record);
    auto kind = reader.get_uint8();
    if (!kind) {
        return std::unexpected(Error{ErrorCode::ParseError, "empty record"});
    }
    if (*kind != static_cast<uint8_t>(want)) {
        return std::unexpected(Error{ErrorCode::UnexpectedRecord,
            fmt::format("expected record kind {}, got {}", static_cast<int>(want), *kind)});
    }
    return reader;
}

std::expected<void, Error> CheckFits(size_t size, size_t limit, const char* what) {
    if (size > limit) {
        return std::unexpected(Error{ErrorCode::BufferOverflow,
            fmt::format("{} of {} bytes exceeds field limit of {}", what, size, limit)});
    }
    return {};
}

std::expected<std::string, Error> GetShortString(ByteReader& reader) {
    auto len = reader.get_uint16_be();
    if (!len) return std::unexpected(std::move(len.error()));
    auto bytes = reader.get_bytes(*len);
    if (!bytes) return std::unexpected(std::move(bytes.error()));
    return ToString(*bytes);
}

std::expected<void, Error> ExpectEnd(const ByteReader& reader, const char* what) {
    if (!reader.empty()) {
        return std::unexpected(Error{ErrorCode::ParseError,
            fmt::format("{} has {} trailing bytes", what, reader.remaining())});
    }
    return {};
}

}  // namespace

std::expected<std::vector<std::byte>, Error> EncodeRequest(const RequestRecord& request) {
    constexpr size_t kU16 = std::numeric_limits<uint16_t>::max();
    constexpr size_t kU32 = std::numeric_limits<uint32_t>::max();

    if (auto ok = CheckFits(request.tags.size(), kU16, "tag map"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    if (auto ok = CheckFits(request.body.size(), kU32, "request body"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    ByteBuffer buf;
    buf.put_uint8(static_cast<uint8_t>(RecordKind::Request));
    buf.put_uint16_be(static_cast<uint16_t>(request.tags.size()));
    for (const auto& [tag, value] : request.tags) {
        if (auto ok = CheckFits(value.size(), kU32, "tag value"); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        buf.put_uint8(static_cast<uint8_t>(tag));
        buf.put_uint32_be(static_cast<uint32_t>(value.size()));
        buf.put_bytes(std::as_bytes(std::span(value.data(), value.size())));
    }
    buf.put_uint32_be(static_cast<uint32_t>(request.body.size()));
    buf.put_bytes(request.body);
    return buf.take();
}

std::expected<RequestRecord, Error> DecodeRequest(std::span<const std::byte> record) {
    auto reader = OpenRecord(record, RecordKind::Request);
    if (!reader) return std::unexpected(std::move(reader.error()));

    RequestRecord request;
    auto count = reader->get_uint16_be();
    if (!count) return std::unexpected(std::move(count.error()));
    for (uint16_t i = 0; i < *count; ++i) {
        auto tag = reader->get_uint8();
        if (!tag) return std::unexpected(std::move(tag.error()));
        auto len = reader->get_uint32_be();
        if (!len) return std::unexpected(std::move(len.error()));
        auto value = reader->get_bytes(*len);
        if (!value) return std::unexpected(std::move(value.error()));
        // Unknown tag ids are kept; consumers look up only the tags they know
        request.tags.insert_or_assign(static_cast<RequestTag>(*tag), ToString(*value));
    }

    auto body_len = reader->get_uint32_be();
    if (!body_len) return std::unexpected(std::move(body_len.error()));
    auto body = reader->get_bytes(*body_len);
    if (!body) return std::unexpected(std::move(body.error()));
    request.body.assign(body->begin(), body->end());

    if (auto end = ExpectEnd(*reader, "request"); !end) {
        return std::unexpected(std::move(end.error()));
    }
    return request;
}

std::expected<std::vector<std::byte>, Error> EncodeAnnouncement(const AnnouncementRecord& announcement) {
    constexpr size_t kU16 = std::numeric_limits<uint16_t>::max();
    constexpr size_t kU32 = std::numeric_limits<uint32_t>::max();

    if (auto ok = CheckFits(announcement.header.size(), kU32, "source header"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    if (auto ok = CheckFits(announcement.sub_address.size(), kU16, "sub-address"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    if (auto ok = CheckFits(announcement.origin_hint.size(), kU16, "origin hint"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }

    ByteBuffer buf;
    buf.put_uint8(static_cast<uint8_t>(RecordKind::Announcement));
    buf.put_uint8(announcement.compressed ? kAnnounceCompressed : 0);
    buf.put_uint32_be(static_cast<uint32_t>(announcement.header.size()));
    buf.put_bytes(announcement.header);
    buf.put_uint16_be(static_cast<uint16_t>(announcement.sub_address.size()));
    buf.put_bytes(std::as_bytes(std::span(announcement.sub_address.data(),
                                          announcement.sub_address.size())));
    buf.put_uint16_be(static_cast<uint16_t>(announcement.origin_hint.size()));
    buf.put_bytes(std::as_bytes(std::span(announcement.origin_hint.data(),
                                          announcement.origin_hint.size())));
    return buf.take();
}

std::expected<AnnouncementRecord, Error> DecodeAnnouncement(std::span<const std::byte> record) {
    auto reader = OpenRecord(record, RecordKind::Announcement);
    if (!reader) return std::unexpected(std::move(reader.error()));

    AnnouncementRecord announcement;
    auto flags = reader->get_uint8();
    if (!flags) return std::unexpected(std::move(flags.error()));
    announcement.compressed = (*flags & kAnnounceCompressed) != 0;

    auto header_len = reader->get_uint32_be();
    if (!header_len) return std::unexpected(std::move(header_len.error()));
    auto header = reader->get_bytes(*header_len);
    if (!header) return std::unexpected(std::move(header.error()));
    announcement.header.assign(header->begin(), header->end());

    auto sub_address = GetShortString(*reader);
    if (!sub_address) return std::unexpected(std::move(sub_address.error()));
    if (sub_address->empty()) {
        return std::unexpected(Error{ErrorCode::ParseError, "announcement without sub-address"});
    }
    announcement.sub_address = std::move(*sub_address);

    auto hint = GetShortString(*reader);
    if (!hint) return std::unexpected(std::move(hint.error()));
    announcement.origin_hint = std::move(*hint);

    if (auto end = ExpectEnd(*reader, "announcement"); !end) {
        return std::unexpected(std::move(end.error()));
    }
    return announcement;
}

std::vector<std::byte> EncodeItem(std::span<const std::byte> payload) {
    std::vector<std::byte> record;
    record.reserve(payload.size() + 1);
    record.push_back(static_cast<std::byte>(RecordKind::Item));
    record.insert(record.end(), payload.begin(), payload.end());
    return record;
}

std::expected<std::vector<std::byte>, Error> DecodeItem(std::vector<std::byte>&& record) {
    auto reader = OpenRecord(record, RecordKind::Item);
    if (!reader) return std::unexpected(std::move(reader.error()));
    record.erase(record.begin());
    return std::move(record);
}

}  // namespace chanserv
