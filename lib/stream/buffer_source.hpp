// SPDX-License-Identifier: MIT

// lib/stream/buffer_source.hpp
#pragma once

#include <cstddef>
#include <deque>
#include <expected>
#include <optional>
#include <utility>
#include <vector>

#include <asio/awaitable.hpp>
#include <fmt/format.h>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/byte_stream.hpp"
#include "lib/stream/error.hpp"

namespace page_pipe {

// BufferSequenceSource - IByteSource over an in-memory list of buffers.
//
// Yields the buffers in order, as given (empty buffers included), then ends.
class BufferSequenceSource : public IByteSource {
public:
    BufferSequenceSource() = default;

    explicit BufferSequenceSource(std::vector<ByteBuffer> buffers)
        : buffers_(buffers.begin(), buffers.end()) {}

    void Push(ByteBuffer buf) { buffers_.push_back(std::move(buf)); }

    asio::awaitable<NextChunk> Next() override {
        if (buffers_.empty()) co_return std::nullopt;
        ByteBuffer front = std::move(buffers_.front());
        buffers_.pop_front();
        co_return front;
    }

    size_t Remaining() const { return buffers_.size(); }

private:
    std::deque<ByteBuffer> buffers_;
};

/// Drain @p source into a single buffer.
/// Fails with BufferOverflow once more than @p max_size bytes were pulled;
/// source errors are surfaced verbatim.
inline asio::awaitable<std::expected<ByteBuffer, Error>> CollectBytes(
    IByteSource& source, size_t max_size) {
    BufferChain chain;
    for (;;) {
        auto next = co_await source.Next();
        if (!next) co_return std::unexpected(next.error());
        if (!next->has_value()) break;

        // Subtraction pattern: compare against remaining budget before append
        ByteBuffer chunk = std::move(**next);
        if (chunk.Size() > max_size - chain.Size()) {
            co_return std::unexpected(Error{ErrorCode::BufferOverflow,
                fmt::format("collected body exceeds {} bytes", max_size)});
        }
        chain.Append(std::move(chunk));
    }
    co_return chain.TakeAll();
}

}  // namespace page_pipe
