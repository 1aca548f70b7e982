// SPDX-License-Identifier: MIT

// lib/stream/request_body.cpp
#include "lib/stream/request_body.hpp"

#include <cstdio>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/backpressure_bridge.hpp"
#include "lib/stream/buffer_source.hpp"
#include "lib/stream/fixed_size_rechunker.hpp"

namespace page_pipe {

RequestBody RequestBody::FromBuffer(ByteBuffer buffer) {
    RequestBody body;
    body.storage_ = std::move(buffer);
    return body;
}

RequestBody RequestBody::FromSource(std::shared_ptr<IByteSource> source,
                                    std::optional<size_t> length) {
    RequestBody body;
    body.storage_ = std::move(source);
    body.declared_length_ = length;
    return body;
}

std::optional<size_t> RequestBody::Length() const {
    if (const auto* buffer = std::get_if<ByteBuffer>(&storage_)) {
        return buffer->Size();
    }
    return declared_length_;
}

std::expected<std::shared_ptr<IByteSource>, Error> RequestBody::OpenSource() {
    if (const auto* buffer = std::get_if<ByteBuffer>(&storage_)) {
        auto source = std::make_shared<BufferSequenceSource>();
        if (!buffer->Empty()) source->Push(*buffer);
        return source;
    }

    auto& source = std::get<std::shared_ptr<IByteSource>>(storage_);
    if (opened_) {
        std::fprintf(stderr, "RequestBody::OpenSource called twice on a streaming body\n");
        return std::unexpected(Error{ErrorCode::ProtocolViolation,
                                     "streaming body already opened"});
    }
    if (!source) {
        return std::unexpected(Error{ErrorCode::InvalidArgument, "streaming body has no source"});
    }
    opened_ = true;
    return source;
}

asio::awaitable<std::expected<void, Error>> StreamBody(
    RequestBody body, std::shared_ptr<IByteSink> sink, StreamConfig config) {
    if (!sink) {
        co_return std::unexpected(Error{ErrorCode::InvalidArgument, "sink is required"});
    }
    if (auto err = config.Validate()) {
        sink->Close();
        co_return std::unexpected(std::move(*err));
    }

    auto source = body.OpenSource();
    if (!source) {
        sink->Close();
        co_return std::unexpected(std::move(source.error()));
    }

    BackpressureBridge bridge(std::move(*source), sink, config);
    auto result = co_await bridge.Run();
    if (!result) co_return result;

    auto expected_length = body.Length();
    if (expected_length && *expected_length != bridge.BytesWritten()) {
        co_return std::unexpected(Error{ErrorCode::StreamingError,
            fmt::format("body length mismatch: declared {} bytes, wrote {}",
                        *expected_length, bridge.BytesWritten())});
    }
    co_return std::expected<void, Error>{};
}

std::shared_ptr<IByteSource> ChunkedResponseBody(
    std::shared_ptr<IByteSource> transport, const StreamConfig& config) {
    return std::make_shared<FixedSizeRechunker>(std::move(transport), config.chunk_size);
}

}  // namespace page_pipe
