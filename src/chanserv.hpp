// SPDX-License-Identifier: MIT

// src/chanserv.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lib/stream/channel.hpp"

namespace chanserv {

/// One payload delivered within a Source. The bytes are opaque to chanserv;
/// implement Bytes() with whatever serialization the application uses.
class Frame {
public:
    virtual ~Frame() = default;

    /// Byte representation of the payload. Must stay valid for the
    /// lifetime of the frame.
    virtual std::span<const std::byte> Bytes() const = 0;
};

using FramePtr = std::shared_ptr<Frame>;

/// Frame owning a byte vector.
class BytesFrame : public Frame {
public:
    explicit BytesFrame(std::vector<std::byte> data) : data_(std::move(data)) {}

    static FramePtr From(std::string_view text);

    std::span<const std::byte> Bytes() const override { return data_; }

private:
    std::vector<std::byte> data_;
};

/// Origin of an announced Source, created by chanserv on the subscriber side.
class MetaData {
public:
    virtual ~MetaData() = default;

    /// Virtual address of the dispatcher that announced the Source.
    virtual std::string RemoteAddr() const = 0;
};

/// Announcement of an independently lifecycled sequence of frames.
///
/// Producing side: Out() must be closed after the last frame (dropping the
/// Sender returned by MakeSource() does that).
/// Consuming side: Out() is closed by chanserv when the remote producer
/// finishes or the connection fails. The first call to Out() dials the
/// Source's sub-address; a Source nobody reads never causes a dial.
class Source {
public:
    virtual ~Source() = default;

    /// Application-defined header bytes; may be empty.
    virtual std::span<const std::byte> Header() const = 0;

    /// Origin metadata, or nullptr on the producing side.
    virtual const MetaData* Meta() const = 0;

    virtual Receiver<FramePtr>& Out() = 0;
};

using SourcePtr = std::shared_ptr<Source>;

/// Produces the Sources answering one request body. Invoked once per
/// request on that request's own thread; the returned sequence must be
/// closed after the last Source.
using SourceFunc = std::function<Receiver<SourcePtr>(std::span<const std::byte> body)>;

/// Request options sent alongside the body.
enum class RequestTag : uint8_t {
    Meta = 0,    ///< Reserved
    Bucket = 1,  ///< Shard hint passed verbatim to the dialing layer
};

using RequestTags = std::map<RequestTag, std::string>;

/// A producer-side Source plus the Sender feeding its frames.
struct SourceFeed {
    SourcePtr source;
    Sender<FramePtr> frames;
};

/// Build a producer-side Source with a frame buffer of @p capacity.
SourceFeed MakeSource(std::vector<std::byte> header, size_t capacity = 16);

std::vector<std::byte> ToBytes(std::string_view text);
std::string ToString(std::span<const std::byte> bytes);

}  // namespace chanserv
