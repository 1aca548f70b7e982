// SPDX-License-Identifier: MIT

// lib/stream/byte_stream.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <span>

#include <asio/awaitable.hpp>

#include "lib/stream/byte_buffer.hpp"
#include "lib/stream/error.hpp"

namespace page_pipe {

/// Result of one pull: a chunk, std::nullopt at end of stream, or an error.
using NextChunk = std::expected<std::optional<ByteBuffer>, Error>;

/// Asynchronous, forward-only, pull-based byte source.
///
/// A consumer may only pull the next chunk or stop. Sources are single-pass
/// and single-consumer: Next() must not be called again before the previous
/// call completed.
class IByteSource {
public:
    virtual ~IByteSource() = default;

    /// Pull the next chunk. May suspend.
    virtual asio::awaitable<NextChunk> Next() = 0;
};

/// Readiness notifications delivered by a push sink.
enum class SinkEvent {
    SpaceAvailable,   ///< Writable capacity was freed
    ErrorOccurred,    ///< Sink failed; further writes will not succeed
};

/// Synchronous, capacity-bounded push sink.
///
/// Models a transport that only exposes "write if space, notify when space
/// frees up". Write() never blocks; it accepts at most WritableCapacity() bytes.
///
/// Thread safety: WritableCapacity(), Write() and Close() are called from the
/// producing task. The event callback may be invoked from any thread, including
/// from inside Write() or Close().
class IByteSink {
public:
    using EventCallback = std::function<void(SinkEvent)>;

    virtual ~IByteSink() = default;

    /// Bytes the sink currently accepts without blocking.
    virtual size_t WritableCapacity() = 0;

    /// Write up to data.size() bytes. Returns the number of bytes accepted.
    virtual std::expected<size_t, Error> Write(std::span<const std::byte> data) = 0;

    /// Install the readiness callback. Replaces any previous callback.
    virtual void OnEvent(EventCallback cb) = 0;

    /// Release the sink. No further writes are accepted afterwards.
    virtual void Close() = 0;
};

}  // namespace page_pipe
