// SPDX-License-Identifier: MIT

// src/compression.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <span>
#include <vector>

#include "lib/stream/error.hpp"

namespace chanserv {

/// Compress @p input into one zstd frame.
/// @return the frame, or CompressionError.
std::expected<std::vector<std::byte>, Error> Compress(std::span<const std::byte> input, int level);

/// Decompress one zstd frame, refusing output larger than @p max_size.
/// @return the payload; DecompressionError on a corrupt or truncated
///         frame; BufferOverflow past @p max_size.
std::expected<std::vector<std::byte>, Error> Decompress(std::span<const std::byte> input,
                                                        size_t max_size);

}  // namespace chanserv
