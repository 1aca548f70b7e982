// SPDX-License-Identifier: MIT

// lib/stream/stream_config.hpp
#pragma once

#include <cstddef>
#include <optional>

#include "lib/stream/error.hpp"

namespace page_pipe {

/// Sizing parameters for body transport, passed at construction time.
struct StreamConfig {
    size_t chunk_size = 16 * 1024;                 ///< FixedSizeRechunker target size
    size_t max_buffer_size = 16 * 1024;            ///< Upper bound on a single sink write
    size_t max_collect_size = 16 * 1024 * 1024;    ///< Limit for CollectBytes on bodies

    /// Preset for streamed request bodies: matches the 16 KiB bound-stream buffer.
    static StreamConfig RequestBodyDefaults() {
        return StreamConfig{
            .chunk_size = 16 * 1024,
            .max_buffer_size = 16 * 1024,
            .max_collect_size = 16 * 1024 * 1024,
        };
    }

    /// Preset for multipart uploads: 5 MiB parts, the smallest non-final
    /// part size object stores accept.
    static StreamConfig MultipartUploadDefaults() {
        return StreamConfig{
            .chunk_size = 5 * 1024 * 1024,
            .max_buffer_size = 64 * 1024,
            .max_collect_size = 5 * 1024 * 1024,
        };
    }

    /// @return InvalidArgument error if any size is zero.
    std::optional<Error> Validate() const {
        if (chunk_size == 0) {
            return Error{ErrorCode::InvalidArgument, "chunk_size must be greater than zero"};
        }
        if (max_buffer_size == 0) {
            return Error{ErrorCode::InvalidArgument, "max_buffer_size must be greater than zero"};
        }
        if (max_collect_size == 0) {
            return Error{ErrorCode::InvalidArgument, "max_collect_size must be greater than zero"};
        }
        return std::nullopt;
    }
};

}  // namespace page_pipe
