// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace chanserv {

/// Error codes for all transport, protocol and lifecycle operations.
enum class ErrorCode {
    // Transport
    BindFailed,            ///< Transport rejected the bind
    AddressInUse,          ///< Virtual address is already bound
    DialFailed,            ///< Dial was rejected by the transport
    DialTimeout,           ///< Address could not be reached within the dial timeout
    ConnectionClosed,      ///< Connection was closed (locally or by the peer)
    ConnectionReset,       ///< Connection failed mid-stream

    // Protocol
    ParseError,            ///< Record or envelope could not be decoded
    BufferOverflow,        ///< Record exceeds the configured size limit
    UnexpectedRecord,      ///< Record kind not valid for this connection

    // Codec
    CompressionError,      ///< Zstd compression failed
    DecompressionError,    ///< Zstd decompression failed

    // Lifecycle
    SourceTimeout,         ///< Announced sub-address was never dialed
    InvalidState,          ///< Method called in wrong instance state
    CallbackFailed,        ///< User source callback threw
};

/// Error payload returned from setup calls and delivered to diagnostic hooks.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
};

/// Return a short category string for an error code (e.g. "transport", "protocol").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::BindFailed:
        case ErrorCode::AddressInUse:
        case ErrorCode::DialFailed:
        case ErrorCode::DialTimeout:
        case ErrorCode::ConnectionClosed:
        case ErrorCode::ConnectionReset:
            return "transport";
        case ErrorCode::ParseError:
        case ErrorCode::BufferOverflow:
        case ErrorCode::UnexpectedRecord:
            return "protocol";
        case ErrorCode::CompressionError:
        case ErrorCode::DecompressionError:
            return "codec";
        case ErrorCode::SourceTimeout:
        case ErrorCode::InvalidState:
        case ErrorCode::CallbackFailed:
            return "lifecycle";
    }
    return "unknown";
}

/// Return the enumerator name for an error code, for log lines.
constexpr std::string_view error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::BindFailed: return "BindFailed";
        case ErrorCode::AddressInUse: return "AddressInUse";
        case ErrorCode::DialFailed: return "DialFailed";
        case ErrorCode::DialTimeout: return "DialTimeout";
        case ErrorCode::ConnectionClosed: return "ConnectionClosed";
        case ErrorCode::ConnectionReset: return "ConnectionReset";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::BufferOverflow: return "BufferOverflow";
        case ErrorCode::UnexpectedRecord: return "UnexpectedRecord";
        case ErrorCode::CompressionError: return "CompressionError";
        case ErrorCode::DecompressionError: return "DecompressionError";
        case ErrorCode::SourceTimeout: return "SourceTimeout";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::CallbackFailed: return "CallbackFailed";
    }
    return "Unknown";
}

}  // namespace chanserv
