// SPDX-License-Identifier: MIT

// tests/fixed_size_rechunker_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include <asio/io_context.hpp>

#include "lib/stream/buffer_source.hpp"
#include "lib/stream/fixed_size_rechunker.hpp"
#include "lib/stream/stream_config.hpp"
#include "tests/test_util.hpp"

using namespace page_pipe;
using page_pipe::testing::CreateRandomBuffer;
using page_pipe::testing::RunAwaitable;
using page_pipe::testing::SplitBuffer;

namespace {

// Yields its buffers, then fails instead of ending
class FailingSource : public IByteSource {
public:
    explicit FailingSource(std::vector<ByteBuffer> buffers) : inner_(std::move(buffers)) {}

    asio::awaitable<NextChunk> Next() override {
        auto next = co_await inner_.Next();
        if (next && !next->has_value()) {
            co_return std::unexpected(Error{ErrorCode::SourceFailed, "connection reset"});
        }
        co_return next;
    }

private:
    BufferSequenceSource inner_;
};

// Drain the rechunker, checking the accounting identity after every pull
asio::awaitable<std::vector<ByteBuffer>> DrainChecked(FixedSizeRechunker& rechunker) {
    std::vector<ByteBuffer> out;
    for (;;) {
        auto next = co_await rechunker.Next();
        EXPECT_TRUE(next.has_value());
        EXPECT_EQ(rechunker.BytesEmitted() + rechunker.BufferedBytes(),
                  rechunker.BytesPulled());
        if (!next || !next->has_value()) break;
        out.push_back(std::move(**next));
    }
    co_return out;
}

ByteBuffer Concat(const std::vector<ByteBuffer>& chunks) {
    BufferChain chain;
    for (const auto& c : chunks) chain.Append(c);
    return chain.TakeAll();
}

}  // namespace

TEST(FixedSizeRechunkerTest, ConstructorRejectsZeroChunkSize) {
    auto source = std::make_shared<BufferSequenceSource>();
    EXPECT_THROW(FixedSizeRechunker(source, 0), std::invalid_argument);
}

TEST(FixedSizeRechunkerTest, ConstructorRejectsNullUpstream) {
    EXPECT_THROW(FixedSizeRechunker(nullptr, 16), std::invalid_argument);
}

TEST(FixedSizeRechunkerTest, EmptyUpstreamYieldsNothing) {
    asio::io_context ctx;
    auto source = std::make_shared<BufferSequenceSource>();
    FixedSizeRechunker rechunker(source, 8);

    auto chunks = RunAwaitable(ctx, DrainChecked(rechunker));
    EXPECT_TRUE(chunks.empty());
    EXPECT_EQ(rechunker.BytesPulled(), 0);
}

TEST(FixedSizeRechunkerTest, EmptyUpstreamChunksYieldNothing) {
    asio::io_context ctx;
    auto source = std::make_shared<BufferSequenceSource>(
        std::vector<ByteBuffer>{ByteBuffer{}, ByteBuffer{}, ByteBuffer{}});
    FixedSizeRechunker rechunker(source, 8);

    auto chunks = RunAwaitable(ctx, DrainChecked(rechunker));
    EXPECT_TRUE(chunks.empty());
}

TEST(FixedSizeRechunkerTest, ExactMultipleHasNoShortTail) {
    asio::io_context ctx;
    auto data = CreateRandomBuffer(1, 2, 64);
    auto source = std::make_shared<BufferSequenceSource>(SplitBuffer(data, {5, 11}));
    FixedSizeRechunker rechunker(source, 16);

    auto chunks = RunAwaitable(ctx, DrainChecked(rechunker));
    ASSERT_EQ(chunks.size(), 4);
    for (const auto& c : chunks) EXPECT_EQ(c.Size(), 16);
    EXPECT_EQ(Concat(chunks), data);
}

TEST(FixedSizeRechunkerTest, ShortFinalChunk) {
    asio::io_context ctx;
    auto source = std::make_shared<BufferSequenceSource>(std::vector<ByteBuffer>{
        ByteBuffer::FromString("abcdefg"), ByteBuffer::FromString("hij")});
    FixedSizeRechunker rechunker(source, 4);

    auto chunks = RunAwaitable(ctx, DrainChecked(rechunker));
    ASSERT_EQ(chunks.size(), 3);
    EXPECT_EQ(chunks[0].ToString(), "abcd");
    EXPECT_EQ(chunks[1].ToString(), "efgh");
    EXPECT_EQ(chunks[2].ToString(), "ij");
}

TEST(FixedSizeRechunkerTest, LargeUpstreamChunkIsSplitWithoutCopy) {
    asio::io_context ctx;
    auto data = CreateRandomBuffer(9, 4, 100);
    auto source = std::make_shared<BufferSequenceSource>(std::vector<ByteBuffer>{data});
    FixedSizeRechunker rechunker(source, 32);

    auto chunks = RunAwaitable(ctx, DrainChecked(rechunker));
    ASSERT_EQ(chunks.size(), 4);
    EXPECT_EQ(chunks[0].Span().data(), data.Span().data());
    EXPECT_EQ(chunks[1].Span().data(), data.Span().data() + 32);
    EXPECT_EQ(chunks[3].Size(), 4);
    EXPECT_EQ(Concat(chunks), data);
}

// Any fragmentation produces the same bytes, in order, and only the last chunk
// may be short.
TEST(FixedSizeRechunkerTest, ConservesBytesAcrossFragmentations) {
    const std::vector<std::vector<size_t>> fragmentations = {
        {1}, {3, 7}, {1, 1, 100}, {4096}, {1000, 1, 17}, {13, 0, 29},
    };
    const size_t chunk_sizes[] = {1, 7, 64, 1000};

    auto data = CreateRandomBuffer(11, 13, 5000);
    for (const auto& sizes : fragmentations) {
        for (size_t chunk_size : chunk_sizes) {
            asio::io_context ctx;
            std::vector<ByteBuffer> pieces;
            if (sizes == std::vector<size_t>{13, 0, 29}) {
                // Interleave empty upstream chunks
                for (auto& p : SplitBuffer(data, {13, 29})) {
                    pieces.push_back(ByteBuffer{});
                    pieces.push_back(std::move(p));
                }
            } else {
                pieces = SplitBuffer(data, sizes);
            }
            auto source = std::make_shared<BufferSequenceSource>(std::move(pieces));
            FixedSizeRechunker rechunker(source, chunk_size);

            auto chunks = RunAwaitable(ctx, DrainChecked(rechunker));
            ASSERT_FALSE(chunks.empty());
            for (size_t i = 0; i + 1 < chunks.size(); ++i) {
                EXPECT_EQ(chunks[i].Size(), chunk_size);
            }
            EXPECT_GT(chunks.back().Size(), 0);
            EXPECT_LE(chunks.back().Size(), chunk_size);
            EXPECT_EQ(Concat(chunks), data);
            EXPECT_EQ(rechunker.BytesEmitted(), data.Size());
            EXPECT_EQ(rechunker.BufferedBytes(), 0);
        }
    }
}

TEST(FixedSizeRechunkerTest, UpstreamErrorIsSurfacedAndEndsSequence) {
    asio::io_context ctx;
    auto source = std::make_shared<FailingSource>(std::vector<ByteBuffer>{
        ByteBuffer::FromString("abcdef"), ByteBuffer::FromString("g")});
    FixedSizeRechunker rechunker(source, 4);

    auto first = RunAwaitable(ctx, rechunker.Next());
    ASSERT_TRUE(first.has_value() && first->has_value());
    EXPECT_EQ((*first)->ToString(), "abcd");

    // "efg" is buffered but incomplete when the upstream fails
    auto failed = RunAwaitable(ctx, rechunker.Next());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::SourceFailed);
    EXPECT_EQ(failed.error().message, "connection reset");

    auto after = RunAwaitable(ctx, rechunker.Next());
    ASSERT_TRUE(after.has_value());
    EXPECT_FALSE(after->has_value());
}

TEST(FixedSizeRechunkerTest, ResponseBodyPresetChunkSize) {
    asio::io_context ctx;
    auto data = CreateRandomBuffer(5, 6, 40000);
    auto source = std::make_shared<BufferSequenceSource>(SplitBuffer(data, {1500}));
    FixedSizeRechunker rechunker(source, StreamConfig::RequestBodyDefaults().chunk_size);

    auto chunks = RunAwaitable(ctx, DrainChecked(rechunker));
    ASSERT_EQ(chunks.size(), 3);
    EXPECT_EQ(chunks[0].Size(), 16384);
    EXPECT_EQ(chunks[1].Size(), 16384);
    EXPECT_EQ(chunks[2].Size(), 40000 - 2 * 16384);
}
