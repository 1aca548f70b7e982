// SPDX-License-Identifier: MIT

// lib/stream/bounded_pipe.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <mutex>
#include <span>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/byte_stream.hpp"
#include "lib/stream/error.hpp"

namespace page_pipe {

// BoundedPipe - in-memory bound stream pair with a fixed buffer size.
//
// The writing half is an IByteSink: it accepts bytes until `capacity` are
// buffered. The reading half (Read) drains bytes from any thread and fires
// SinkEvent::SpaceAvailable whenever it frees space. Fail() puts the pipe in
// an error state and fires SinkEvent::ErrorOccurred.
//
// Events are delivered outside the internal lock, on the thread that caused
// them (the reader's thread for SpaceAvailable).
//
// Thread safety: All methods are thread-safe.
class BoundedPipe : public IByteSink {
public:
    explicit BoundedPipe(size_t capacity);

    BoundedPipe(const BoundedPipe&) = delete;
    BoundedPipe& operator=(const BoundedPipe&) = delete;

    // IByteSink (writing half)
    size_t WritableCapacity() override;
    std::expected<size_t, Error> Write(std::span<const std::byte> data) override;
    void OnEvent(EventCallback cb) override;
    void Close() override;

    /// Drain up to @p max_bytes buffered bytes (reading half).
    /// Fires SpaceAvailable if anything was drained.
    ByteBuffer Read(size_t max_bytes);

    /// Fail the pipe: later writes fail with StreamingError.
    void Fail();

    size_t Capacity() const { return capacity_; }
    size_t Buffered() const;
    size_t TotalRead() const;
    size_t TotalWritten() const;
    bool IsClosed() const;
    int CloseCount() const;

    /// True once the writer closed the pipe and every byte was read.
    bool AtEnd() const;

private:
    void Fire(SinkEvent event);

    const size_t capacity_;
    mutable std::mutex mutex_;
    BufferChain buffered_;
    EventCallback callback_;
    size_t total_read_ = 0;
    size_t total_written_ = 0;
    int close_count_ = 0;
    bool failed_ = false;
};

}  // namespace page_pipe
