// SPDX-License-Identifier: MIT

// src/config.hpp
#pragma once

#include <chrono>
#include <cstddef>

#include "lib/stream/record_io.hpp"
#include "lib/stream/service_loop.hpp"

namespace chanserv {

/// Dispatcher settings.
struct ServerConfig {
    /// How long an announced sub-address waits to be dialed before it is
    /// unbound and its Source's production is cancelled.
    std::chrono::milliseconds source_timeout{30000};
    size_t max_record_size = kDefaultMaxRecordSize;   ///< Reject larger records
    int compression_level = 0;                        ///< zstd level for items, 0 = off
    ErrorHandler on_error;                            ///< Background failure hook
};

/// Subscriber settings.
struct ClientConfig {
    std::chrono::milliseconds dial_timeout{10000};    ///< Master and sub-address dials
    size_t source_buffer = 16;                        ///< Queued announced Sources
    size_t frame_buffer = 64;                         ///< Queued frames per Source
    size_t max_record_size = kDefaultMaxRecordSize;   ///< Reject larger records
    ErrorHandler on_error;                            ///< Background failure hook
};

}  // namespace chanserv
