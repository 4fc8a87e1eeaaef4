// SPDX-License-Identifier: MIT

// lib/stream/bridge.hpp
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "lib/stream/channel.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/log.hpp"
#include "lib/stream/record_io.hpp"
#include "lib/stream/service_loop.hpp"
#include "lib/stream/transport.hpp"

namespace chanserv {

/// How a bridge run ended.
enum class BridgeResult {
    Completed,   ///< Sequence finished and the close was propagated
    Abandoned,   ///< Local consumer went away
    Cancelled,   ///< Owner's stop token fired
    Failed,      ///< Connection or codec error (reported once)
};

constexpr std::string_view bridge_result_name(BridgeResult r) {
    switch (r) {
        case BridgeResult::Completed: return "completed";
        case BridgeResult::Abandoned: return "abandoned";
        case BridgeResult::Cancelled: return "cancelled";
        case BridgeResult::Failed: return "failed";
    }
    return "unknown";
}

template <typename T>
using Encoder = std::function<std::expected<std::vector<std::byte>, Error>(const T&)>;

template <typename T>
using Decoder = std::function<std::expected<T, Error>(std::vector<std::byte>&&)>;

/// Called once an item's record has been written in full.
template <typename T>
using WrittenHook = std::function<void(const T&)>;

/// Drain @p items onto @p conn, one record per item.
///
/// On producer close the write side is shut down and the run completes.
/// A peer that closes or fails before that is detected by a watcher
/// thread reading the connection, so the run ends even while the producer
/// is idle. Write, peer and encode failures are passed to @p report exactly
/// once and leave @p items abandoned, which fails the producer's next send.
/// @p on_written, when set, runs after each successful write; an item whose
/// write failed never reaches it.
///
/// The connection is closed on return.
template <typename T>
BridgeResult RunOutbound(std::shared_ptr<IConnection> conn,
                         Receiver<T>& items,
                         const Encoder<T>& encode,
                         const ErrorHandler& report,
                         std::stop_token stop,
                         size_t max_record_size = kDefaultMaxRecordSize,
                         const WrittenHook<T>& on_written = {}) {
    std::stop_source done;
    std::stop_callback forward_stop(stop, [&done] { done.request_stop(); });
    std::stop_callback close_on_done(done.get_token(), [conn] { conn->Close(); });

    std::atomic<bool> finishing{false};
    std::optional<Error> peer_error;
    std::jthread watcher([conn, &done, &finishing, &peer_error] {
        // The peer never writes on this connection; anything it sends is discarded
        std::array<std::byte, 256> scratch;
        for (;;) {
            auto n = conn->Read(scratch);
            if (!n || *n == 0) {
                if (!finishing.load()) {
                    peer_error = n ? Error{ErrorCode::ConnectionClosed,
                                           "peer closed before end of sequence"}
                                   : n.error();
                }
                break;
            }
        }
        done.request_stop();
    });

    BridgeResult result = BridgeResult::Completed;
    std::optional<Error> failure;
    for (;;) {
        auto item = items.Receive(done.get_token());
        if (!item) {
            break;
        }
        auto body = encode(*item);
        if (!body) {
            failure = std::move(body.error());
            result = BridgeResult::Failed;
            break;
        }
        auto written = WriteRecord(*conn, *body, max_record_size);
        if (!written) {
            failure = std::move(written.error());
            result = BridgeResult::Failed;
            break;
        }
        if (on_written) {
            on_written(*item);
        }
    }

    if (result == BridgeResult::Completed && !items.Drained()) {
        result = stop.stop_requested() ? BridgeResult::Cancelled : BridgeResult::Failed;
    }

    finishing.store(true);
    if (result == BridgeResult::Completed) {
        conn->CloseWrite();
    }
    conn->Close();
    watcher.join();

    if (result == BridgeResult::Failed) {
        // A peer that went away usually also fails the write; report the cause
        if (peer_error) {
            failure = std::move(peer_error);
        }
        if (!failure) {
            failure = Error{ErrorCode::ConnectionClosed, "connection closed before end of sequence"};
        }
        report(*failure);
    }
    if (result != BridgeResult::Completed) {
        items.Abandon();
    }
    return result;
}

/// Read records from @p conn into @p items until end-of-stream.
///
/// A reader thread pulls records off the connection one ahead of the
/// consumer; this thread decodes them and hands them over with a blocking
/// send, so a slow consumer throttles the reader. A read failure wakes a
/// blocked send, so a connection that fails while the consumer is idle still
/// ends the sequence. A graceful end-of-stream waits for the consumer to
/// take what was already read. Abandoning the receiving end closes the
/// connection, which lets the remote producer see the close. Read and
/// decode failures end the sequence like a normal close and are passed to
/// @p report exactly once.
///
/// @p items and the connection are closed on return.
template <typename T>
BridgeResult RunInbound(std::shared_ptr<IConnection> conn,
                        Sender<T>& items,
                        const Decoder<T>& decode,
                        const ErrorHandler& report,
                        std::stop_token stop,
                        size_t max_record_size = kDefaultMaxRecordSize) {
    std::stop_source halt;
    std::stop_callback forward_stop(stop, [&halt] { halt.request_stop(); });
    std::stop_callback close_on_halt(halt.get_token(), [conn] { conn->Close(); });
    items.OnAbandon([conn] { conn->Close(); });

    auto [pending, records] = MakeChannel<std::vector<std::byte>>(1);
    std::atomic<bool> finishing{false};
    std::optional<Error> read_error;
    std::jthread reader([conn, max_record_size, &halt, &finishing, &read_error,
                         pending = std::move(pending)]() mutable {
        RecordReader in(*conn, max_record_size);
        for (;;) {
            auto record = in.Next();
            if (!record) {
                if (!finishing.load()) {
                    read_error = std::move(record.error());
                    halt.request_stop();
                }
                break;
            }
            if (!*record || !pending.Send(std::move(**record), halt.get_token())) {
                break;
            }
        }
        pending.Close();
    });

    std::optional<Error> decode_error;
    for (;;) {
        auto record = records.Receive(halt.get_token());
        if (!record) {
            break;
        }
        auto item = decode(std::move(*record));
        if (!item) {
            decode_error = std::move(item.error());
            break;
        }
        if (!items.Send(std::move(*item), halt.get_token())) {
            break;
        }
    }

    finishing.store(true);
    items.OnAbandon({});
    conn->Close();
    halt.request_stop();
    reader.join();

    BridgeResult result = BridgeResult::Completed;
    if (decode_error) {
        report(*decode_error);
        result = BridgeResult::Failed;
    } else if (stop.stop_requested()) {
        result = BridgeResult::Cancelled;
    } else if (items.Abandoned()) {
        result = BridgeResult::Abandoned;
    } else if (read_error) {
        report(*read_error);
        result = BridgeResult::Failed;
    }
    items.Close();
    return result;
}

}  // namespace chanserv
