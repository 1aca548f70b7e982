// SPDX-License-Identifier: MIT

// tests/request_body_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>

#include "lib/stream/bounded_pipe.hpp"
#include "lib/stream/buffer_source.hpp"
#include "lib/stream/request_body.hpp"
#include "tests/test_util.hpp"

using namespace page_pipe;
using page_pipe::testing::CreateRandomBuffer;
using page_pipe::testing::RunAwaitable;
using page_pipe::testing::SplitBuffer;

namespace {

// Drain @p pipe on its own thread until the writer closed it
class PipeReader {
public:
    explicit PipeReader(std::shared_ptr<BoundedPipe> pipe)
        : pipe_(std::move(pipe)), thread_([this] { Loop(); }) {}

    ~PipeReader() {
        if (thread_.joinable()) thread_.join();
    }

    ByteBuffer Join() {
        thread_.join();
        return ByteBuffer::Copy(received_);
    }

private:
    void Loop() {
        while (!pipe_->AtEnd()) {
            auto chunk = pipe_->Read(1024);
            if (chunk.Empty()) {
                std::this_thread::yield();
                continue;
            }
            auto span = chunk.Span();
            received_.insert(received_.end(), span.begin(), span.end());
        }
    }

    std::shared_ptr<BoundedPipe> pipe_;
    std::vector<std::byte> received_;
    std::thread thread_;
};

}  // namespace

TEST(RequestBodyTest, DefaultIsEmptyBuffer) {
    RequestBody body;
    EXPECT_FALSE(body.IsStreaming());
    EXPECT_EQ(body.Length(), 0);
}

TEST(RequestBodyTest, BufferBodyLength) {
    auto body = RequestBody::FromBuffer(ByteBuffer::FromString("hello"));
    EXPECT_FALSE(body.IsStreaming());
    EXPECT_EQ(body.Length(), 5);
}

TEST(RequestBodyTest, StreamingBodyLength) {
    auto source = std::make_shared<BufferSequenceSource>();
    EXPECT_EQ(RequestBody::FromSource(source, 42).Length(), 42);
    EXPECT_FALSE(RequestBody::FromSource(source).Length().has_value());
    EXPECT_TRUE(RequestBody::FromSource(source).IsStreaming());
}

TEST(RequestBodyTest, BufferBodyOpensRepeatedly) {
    asio::io_context ctx;
    auto body = RequestBody::FromBuffer(ByteBuffer::FromString("abc"));

    for (int i = 0; i < 2; ++i) {
        auto source = body.OpenSource();
        ASSERT_TRUE(source.has_value());
        auto collected = RunAwaitable(ctx, CollectBytes(**source, 16));
        ASSERT_TRUE(collected.has_value());
        EXPECT_EQ(collected->ToString(), "abc");
    }
}

TEST(RequestBodyTest, StreamingBodyOpensOnce) {
    auto body = RequestBody::FromSource(std::make_shared<BufferSequenceSource>());
    ASSERT_TRUE(body.OpenSource().has_value());

    auto again = body.OpenSource();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::ProtocolViolation);
}

TEST(RequestBodyTest, NullSourceIsInvalid) {
    auto body = RequestBody::FromSource(nullptr);
    auto source = body.OpenSource();
    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, ErrorCode::InvalidArgument);
}

TEST(StreamBodyTest, StreamsBufferBody) {
    asio::io_context ctx;
    auto data = CreateRandomBuffer(7, 8, 50000);
    auto pipe = std::make_shared<BoundedPipe>(4096);
    PipeReader reader(pipe);

    auto result = RunAwaitable(ctx, StreamBody(RequestBody::FromBuffer(data), pipe));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(reader.Join(), data);
    EXPECT_EQ(pipe->CloseCount(), 1);
}

TEST(StreamBodyTest, StreamsSourceBodyWithDeclaredLength) {
    asio::io_context ctx;
    auto data = CreateRandomBuffer(9, 10, 30000);
    auto pipe = std::make_shared<BoundedPipe>(1000);
    PipeReader reader(pipe);

    auto body = RequestBody::FromSource(
        std::make_shared<BufferSequenceSource>(SplitBuffer(data, {333, 4096})), data.Size());
    auto result = RunAwaitable(ctx, StreamBody(std::move(body), pipe));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(reader.Join(), data);
}

TEST(StreamBodyTest, DeclaredLengthMismatchFails) {
    asio::io_context ctx;
    auto pipe = std::make_shared<BoundedPipe>(1000);
    PipeReader reader(pipe);

    auto body = RequestBody::FromSource(
        std::make_shared<BufferSequenceSource>(
            std::vector<ByteBuffer>{ByteBuffer::FromString("short")}),
        100);
    auto result = RunAwaitable(ctx, StreamBody(std::move(body), pipe));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StreamingError);
    EXPECT_EQ(reader.Join().ToString(), "short");
    EXPECT_EQ(pipe->CloseCount(), 1);
}

TEST(StreamBodyTest, InvalidConfigClosesSink) {
    asio::io_context ctx;
    auto pipe = std::make_shared<BoundedPipe>(16);
    StreamConfig config;
    config.max_buffer_size = 0;

    auto result = RunAwaitable(ctx, StreamBody(RequestBody{}, pipe, config));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(pipe->CloseCount(), 1);
}

TEST(StreamBodyTest, NullSinkIsInvalid) {
    asio::io_context ctx;
    auto result = RunAwaitable(ctx, StreamBody(RequestBody{}, nullptr));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST(ChunkedResponseBodyTest, RechunksTransportStream) {
    asio::io_context ctx;
    auto data = CreateRandomBuffer(12, 13, 1000);
    StreamConfig config;
    config.chunk_size = 256;

    auto body = ChunkedResponseBody(
        std::make_shared<BufferSequenceSource>(SplitBuffer(data, {100, 1, 50})), config);

    std::vector<size_t> sizes;
    for (;;) {
        auto next = RunAwaitable(ctx, body->Next());
        ASSERT_TRUE(next.has_value());
        if (!next->has_value()) break;
        sizes.push_back((*next)->Size());
    }
    EXPECT_EQ(sizes, (std::vector<size_t>{256, 256, 256, 232}));

    // Collecting the whole body through the same interface
    auto again = ChunkedResponseBody(
        std::make_shared<BufferSequenceSource>(SplitBuffer(data, {100})), config);
    auto collected = RunAwaitable(ctx, CollectBytes(*again, config.max_collect_size));
    ASSERT_TRUE(collected.has_value());
    EXPECT_EQ(*collected, data);
}

TEST(ChunkedResponseBodyTest, ZeroChunkSizeThrows) {
    StreamConfig config;
    config.chunk_size = 0;
    EXPECT_THROW(ChunkedResponseBody(std::make_shared<BufferSequenceSource>(), config),
                 std::invalid_argument);
}
