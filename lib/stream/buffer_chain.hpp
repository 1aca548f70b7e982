// SPDX-License-Identifier: MIT

// lib/stream/buffer_chain.hpp
#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <deque>
#include <vector>

#include "lib/stream/byte_buffer.hpp"

namespace page_pipe {

// Chain of byte buffers representing data received but not yet forwarded.
// Supports efficient append/consume operations for streaming data, and
// extraction of exactly-sized pieces for re-chunking.
//
// Thread safety: Not thread-safe. All operations must be called from the
// consumer that owns the chain.
class BufferChain {
public:
    // Add buffer to chain. Empty buffers are ignored.
    void Append(ByteBuffer buf) {
        if (buf.Empty()) return;
        total_size_ += buf.Size();
        segments_.push_back(std::move(buf));
    }

    // Splice all buffers from another chain (transfers ownership).
    // The source chain is left empty after this operation.
    void Splice(BufferChain&& other) {
        if (other.Empty()) return;
        total_size_ += other.total_size_;
        for (auto& seg : other.segments_) {
            segments_.push_back(std::move(seg));
        }
        other.segments_.clear();
        other.total_size_ = 0;
    }

    // Consume bytes from front.
    // If bytes == 0, this is a no-op. Consuming more than Size() empties the chain.
    void Consume(size_t bytes) noexcept {
        while (bytes > 0 && !segments_.empty()) {
            auto& front = segments_.front();
            size_t available = front.Size();

            if (bytes >= available) {
                bytes -= available;
                total_size_ -= available;
                segments_.pop_front();
            } else {
                front.ReadSlice(bytes);
                total_size_ -= bytes;
                bytes = 0;
            }
        }
    }

    // Copy data to destination buffer (offset relative to chain start).
    // If len == 0, this is a no-op.
    void CopyTo(size_t offset, size_t len, std::byte* dest) const {
        if (len == 0) return;

        size_t pos = offset;
        size_t seg_idx = 0;

        // Find starting segment
        while (seg_idx < segments_.size() && pos >= segments_[seg_idx].Size()) {
            pos -= segments_[seg_idx].Size();
            ++seg_idx;
        }

        size_t copied = 0;
        while (copied < len && seg_idx < segments_.size()) {
            auto span = segments_[seg_idx].Span();
            size_t available = span.size() - pos;
            size_t to_copy = std::min(available, len - copied);

            std::memcpy(dest + copied, span.data() + pos, to_copy);
            copied += to_copy;
            pos = 0;
            ++seg_idx;
        }

        assert(copied == len && "CopyTo: not enough data");
    }

    // Remove and return the first @p bytes bytes as a single buffer.
    // Zero-copy when the front buffer alone holds them; otherwise the bytes are
    // gathered into one new allocation. Caller must ensure bytes <= Size().
    ByteBuffer Take(size_t bytes) {
        assert(bytes <= total_size_ && "Take: not enough data");
        if (bytes == 0) return {};

        auto& front = segments_.front();
        if (front.Size() >= bytes) {
            ByteBuffer head = front.ReadSlice(bytes);
            if (front.Empty()) segments_.pop_front();
            total_size_ -= bytes;
            return head;
        }

        std::vector<std::byte> gathered(bytes);
        CopyTo(0, bytes, gathered.data());
        Consume(bytes);
        return ByteBuffer::Adopt(std::move(gathered));
    }

    // Remove and return everything in the chain as a single buffer.
    ByteBuffer TakeAll() { return Take(total_size_); }

    // Total unconsumed bytes. O(1) - cached value.
    size_t Size() const noexcept { return total_size_; }

    // Check if chain is empty (no unconsumed data).
    bool Empty() const noexcept { return total_size_ == 0; }

    // Number of buffers in chain.
    size_t SegmentCount() const noexcept { return segments_.size(); }

    // Contiguous bytes available at the front without crossing buffers.
    size_t ContiguousSize() const noexcept {
        if (segments_.empty()) return 0;
        return segments_.front().Size();
    }

    // Clear all data.
    void Clear() {
        segments_.clear();
        total_size_ = 0;
    }

private:
    std::deque<ByteBuffer> segments_;  // O(1) front removal
    size_t total_size_ = 0;            // Cached total unconsumed bytes
};

}  // namespace page_pipe
