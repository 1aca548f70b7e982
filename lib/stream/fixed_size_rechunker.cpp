// SPDX-License-Identifier: MIT

// lib/stream/fixed_size_rechunker.cpp
#include "lib/stream/fixed_size_rechunker.hpp"

#include <stdexcept>
#include <utility>

namespace page_pipe {

FixedSizeRechunker::FixedSizeRechunker(std::shared_ptr<IByteSource> upstream,
                                       size_t chunk_size)
    : upstream_(std::move(upstream)), chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("FixedSizeRechunker: chunk_size must be greater than zero");
    }
    if (!upstream_) {
        throw std::invalid_argument("FixedSizeRechunker: upstream source is null");
    }
}

asio::awaitable<NextChunk> FixedSizeRechunker::Next() {
    if (finished_) co_return std::nullopt;

    // Accumulate until a full chunk is buffered. Whatever was left over by the
    // previous split is already at the front of pending_.
    while (pending_.Size() < chunk_size_) {
        NextChunk next = co_await upstream_->Next();
        if (!next) {
            finished_ = true;
            co_return std::unexpected(std::move(next.error()));
        }

        if (!next->has_value()) {
            // Upstream exhausted: flush the short tail, never an empty chunk
            finished_ = true;
            if (pending_.Empty()) co_return std::nullopt;
            ByteBuffer tail = pending_.TakeAll();
            bytes_emitted_ += tail.Size();
            co_return tail;
        }

        bytes_pulled_ += (*next)->Size();
        pending_.Append(std::move(**next));
    }

    ByteBuffer chunk = pending_.Take(chunk_size_);
    bytes_emitted_ += chunk.Size();
    co_return chunk;
}

}  // namespace page_pipe
