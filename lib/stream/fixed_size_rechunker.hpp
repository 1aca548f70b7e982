// SPDX-License-Identifier: MIT

// lib/stream/fixed_size_rechunker.hpp
#pragma once

#include <cstddef>
#include <memory>

#include <asio/awaitable.hpp>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/byte_stream.hpp"

namespace page_pipe {

/// Re-chunks an arbitrarily fragmented byte source into fixed-size buffers.
///
/// Every emitted buffer holds exactly chunk_size bytes, except the last one,
/// which may be shorter but is never empty. An upstream that produces no bytes
/// yields an empty sequence.
///
/// Upstream chunks are split without copying when one upstream chunk covers the
/// rest of an output chunk; bytes are gathered into a new allocation only when
/// an output chunk spans several upstream chunks.
///
/// Byte accounting: BytesEmitted() + BufferedBytes() == BytesPulled() holds
/// between any two calls to Next().
///
/// Thread safety: Not thread-safe. Single consumer, single pass.
class FixedSizeRechunker : public IByteSource {
public:
    /// @throws std::invalid_argument if @p chunk_size is zero or @p upstream is null.
    FixedSizeRechunker(std::shared_ptr<IByteSource> upstream, size_t chunk_size);

    FixedSizeRechunker(const FixedSizeRechunker&) = delete;
    FixedSizeRechunker& operator=(const FixedSizeRechunker&) = delete;

    /// Pull the next fixed-size chunk. Upstream errors are surfaced verbatim
    /// and end the sequence.
    asio::awaitable<NextChunk> Next() override;

    size_t ChunkSize() const noexcept { return chunk_size_; }

    /// Total bytes received from upstream so far.
    size_t BytesPulled() const noexcept { return bytes_pulled_; }

    /// Total bytes handed to the consumer so far.
    size_t BytesEmitted() const noexcept { return bytes_emitted_; }

    /// Bytes pulled but not yet emitted.
    size_t BufferedBytes() const noexcept { return pending_.Size(); }

private:
    std::shared_ptr<IByteSource> upstream_;
    size_t chunk_size_;
    BufferChain pending_;
    size_t bytes_pulled_ = 0;
    size_t bytes_emitted_ = 0;
    bool finished_ = false;
};

}  // namespace page_pipe
