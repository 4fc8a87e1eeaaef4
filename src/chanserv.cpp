// SPDX-License-Identifier: MIT

#include "src/chanserv.hpp"

#include <utility>

namespace chanserv {

namespace {

class LocalSource : public Source {
public:
    LocalSource(std::vector<std::byte> header, Receiver<FramePtr> out)
        : header_(std::move(header)), out_(std::move(out)) {}

    std::span<const std::byte> Header() const override { return header_; }
    const MetaData* Meta() const override { return nullptr; }
    Receiver<FramePtr>& Out() override { return out_; }

private:
    std::vector<std::byte> header_;
    Receiver<FramePtr> out_;
};

}  // namespace

FramePtr BytesFrame::From(std::string_view text) {
    return std::make_shared<BytesFrame>(ToBytes(text));
}

SourceFeed MakeSource(std::vector<std::byte> header, size_t capacity) {
    auto [frames, out] = MakeChannel<FramePtr>(capacity);
    return SourceFeed{
        std::make_shared<LocalSource>(std::move(header), std::move(out)),
        std::move(frames),
    };
}

std::vector<std::byte> ToBytes(std::string_view text) {
    std::vector<std::byte> out(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        out[i] = static_cast<std::byte>(text[i]);
    }
    return out;
}

std::string ToString(std::span<const std::byte> bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

}  // namespace chanserv
