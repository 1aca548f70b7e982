// SPDX-License-Identifier: MIT

// lib/stream/backpressure_bridge.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <utility>

#include <asio/awaitable.hpp>

#include "lib/stream/byte_stream.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/stream_config.hpp"
#include "lib/stream/write_waiter.hpp"

namespace page_pipe {

// BackpressureBridge - drives an asynchronous pull source into a synchronous,
// capacity-bounded push sink.
//
// For every chunk pulled from the source, Run() writes as many bytes as the
// sink accepts (bounded by max_buffer_size), and suspends on a WriteWaiter
// whenever the sink reports zero capacity. The sink's readiness events, which
// may arrive on any thread, resume the producer.
//
// Outcomes of Run():
//   - success once the source is exhausted and every byte was written
//   - the source's error, verbatim
//   - StreamingError when the sink reports an error (event or failed Write);
//     a failed Write keeps the sink's message and os_errno
//   - Cancelled when the calling task is cancelled, or the bridge is shut down
//
// The sink is closed exactly once on every path, including destruction of the
// suspended coroutine.
//
// Lifetime: Run() keeps the bridge internals alive on its own, so the bridge
// object may be destroyed while Run() is suspended. Destruction performs
// Shutdown(), which resumes the suspended producer with Cancelled.
//
// Thread safety: Run() is driven by one task. Shutdown() and the accessors
// may be called from any thread.
class BackpressureBridge {
public:
    /// @throws std::invalid_argument if source or sink is null, or
    ///         max_buffer_size is zero.
    BackpressureBridge(std::shared_ptr<IByteSource> source,
                       std::shared_ptr<IByteSink> sink,
                       size_t max_buffer_size = StreamConfig{}.max_buffer_size);

    BackpressureBridge(std::shared_ptr<IByteSource> source,
                       std::shared_ptr<IByteSink> sink,
                       const StreamConfig& config)
        : BackpressureBridge(std::move(source), std::move(sink), config.max_buffer_size) {}

    ~BackpressureBridge();

    BackpressureBridge(const BackpressureBridge&) = delete;
    BackpressureBridge& operator=(const BackpressureBridge&) = delete;
    BackpressureBridge(BackpressureBridge&&) = default;
    BackpressureBridge& operator=(BackpressureBridge&&) = delete;

    /// Stream the whole source into the sink. May be called once; a second
    /// call, or a call on a moved-from bridge, fails with ProtocolViolation.
    asio::awaitable<std::expected<void, Error>> Run();

    /// Explicit teardown: closes the waiter (resuming a suspended Run() with
    /// Cancelled). Closes the sink directly if Run() was never started; sinks
    /// bound to an executor (DescriptorSink) carry the close over to it.
    void Shutdown();

    /// Bytes accepted by the sink so far.
    size_t BytesWritten() const;

    /// Number of Write() calls issued to the sink.
    size_t WriteCalls() const;

    /// Number of times the producer suspended waiting for capacity.
    size_t WaitCount() const;

    bool IsSinkClosed() const;

    WriteWaiter::State WaiterState() const;

private:
    struct Core;

    static asio::awaitable<std::expected<void, Error>> Drive(std::shared_ptr<Core> core);
    static asio::awaitable<std::expected<void, Error>> Pump(Core& core);

    std::shared_ptr<Core> core_;
};

}  // namespace page_pipe
