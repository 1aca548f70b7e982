// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace page_pipe {

/// Error codes for all pagination and byte-transport operations.
enum class ErrorCode {
    // Operation
    OperationFailed,       ///< The paged operation call failed

    // Streaming
    SourceFailed,          ///< Upstream byte source failed while being pulled
    StreamingError,        ///< Push sink reported an error during a write
    SinkClosed,            ///< Write attempted on a sink that is already closed
    BufferOverflow,        ///< Collected data exceeded the configured limit

    // Cancellation
    Cancelled,             ///< Surrounding task was cancelled or the bridge torn down

    // Contract
    ProtocolViolation,     ///< Caller broke a usage contract (e.g. second waiter)
    InvalidArgument,       ///< Construction or configuration parameter is invalid

    // OS
    IoError,               ///< Descriptor-level failure, errno in os_errno
};

/// Error payload carried by std::expected results.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
};

/// Return a short category string for an error code (e.g. "streaming", "contract").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::OperationFailed:
            return "operation";
        case ErrorCode::SourceFailed:
        case ErrorCode::StreamingError:
        case ErrorCode::SinkClosed:
        case ErrorCode::BufferOverflow:
            return "streaming";
        case ErrorCode::Cancelled:
            return "cancellation";
        case ErrorCode::ProtocolViolation:
        case ErrorCode::InvalidArgument:
            return "contract";
        case ErrorCode::IoError:
            return "io";
    }
    return "unknown";
}

/// Return the enumerator name of an error code.
constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::OperationFailed:   return "OperationFailed";
        case ErrorCode::SourceFailed:      return "SourceFailed";
        case ErrorCode::StreamingError:    return "StreamingError";
        case ErrorCode::SinkClosed:        return "SinkClosed";
        case ErrorCode::BufferOverflow:    return "BufferOverflow";
        case ErrorCode::Cancelled:         return "Cancelled";
        case ErrorCode::ProtocolViolation: return "ProtocolViolation";
        case ErrorCode::InvalidArgument:   return "InvalidArgument";
        case ErrorCode::IoError:           return "IoError";
    }
    return "Unknown";
}

/// True for the deliberate-stop outcome, as opposed to transport faults.
constexpr bool IsCancellation(const Error& e) {
    return e.code == ErrorCode::Cancelled;
}

}  // namespace page_pipe
