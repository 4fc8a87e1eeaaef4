// SPDX-License-Identifier: MIT

#include "src/compression.hpp"

#include <zstd.h>

#include <memory>
#include <string>

#include <fmt/format.h>

namespace chanserv {

namespace {

struct DStreamDeleter {
    void operator()(ZSTD_DStream* ds) const { ZSTD_freeDStream(ds); }
};

}  // namespace

std::expected<std::vector<std::byte>, Error> Compress(std::span<const std::byte> input, int level) {
    std::vector<std::byte> out(ZSTD_compressBound(input.size()));
    size_t n = ZSTD_compress(out.data(), out.size(), input.data(), input.size(), level);
    if (ZSTD_isError(n)) {
        return std::unexpected(Error{ErrorCode::CompressionError,
            std::string("ZSTD compression failed: ") + ZSTD_getErrorName(n)});
    }
    out.resize(n);
    return out;
}

std::expected<std::vector<std::byte>, Error> Decompress(std::span<const std::byte> input,
                                                        size_t max_size) {
    std::unique_ptr<ZSTD_DStream, DStreamDeleter> dstream(ZSTD_createDStream());
    if (!dstream) {
        return std::unexpected(Error{ErrorCode::DecompressionError, "Failed to create ZSTD_DStream"});
    }
    size_t init_result = ZSTD_initDStream(dstream.get());
    if (ZSTD_isError(init_result)) {
        return std::unexpected(Error{ErrorCode::DecompressionError,
            std::string("Failed to initialize ZSTD_DStream: ") + ZSTD_getErrorName(init_result)});
    }

    std::vector<std::byte> out;
    std::vector<std::byte> chunk(ZSTD_DStreamOutSize());
    ZSTD_inBuffer in_buf = {input.data(), input.size(), 0};
    size_t last_result = 0;
    do {
        ZSTD_outBuffer out_buf = {chunk.data(), chunk.size(), 0};
        last_result = ZSTD_decompressStream(dstream.get(), &out_buf, &in_buf);
        if (ZSTD_isError(last_result)) {
            return std::unexpected(Error{ErrorCode::DecompressionError,
                std::string("ZSTD decompression failed: ") + ZSTD_getErrorName(last_result)});
        }
        if (out_buf.pos > max_size - out.size()) {
            return std::unexpected(Error{ErrorCode::BufferOverflow,
                fmt::format("decompressed payload exceeds limit of {}", max_size)});
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(out_buf.pos));
        // Stop on frame end, or when no input is left and the output buffer was not filled
        if (last_result == 0) break;
        if (in_buf.pos == in_buf.size && out_buf.pos < out_buf.size) break;
    } while (true);

    if (last_result != 0) {
        return std::unexpected(Error{ErrorCode::DecompressionError, "truncated zstd frame"});
    }
    return out;
}

}  // namespace chanserv
