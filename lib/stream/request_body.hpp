// SPDX-License-Identifier: MIT

// lib/stream/request_body.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <variant>

#include <asio/awaitable.hpp>

#include "lib/stream/byte_buffer.hpp"
#include "lib/stream/byte_stream.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/stream_config.hpp"

namespace page_pipe {

// RequestBody - body of an outgoing request: either one in-memory buffer or a
// streaming byte source with an optional declared length.
//
// A streaming body can be opened once; its source is single-pass.
// Move-only so that ownership of the stream is never ambiguous.
class RequestBody {
public:
    /// Empty buffer body.
    RequestBody() = default;

    static RequestBody FromBuffer(ByteBuffer buffer);

    /// @param length  Declared total length, if known up front
    static RequestBody FromSource(std::shared_ptr<IByteSource> source,
                                  std::optional<size_t> length = std::nullopt);

    RequestBody(const RequestBody&) = delete;
    RequestBody& operator=(const RequestBody&) = delete;
    RequestBody(RequestBody&&) = default;
    RequestBody& operator=(RequestBody&&) = default;

    bool IsStreaming() const {
        return std::holds_alternative<std::shared_ptr<IByteSource>>(storage_);
    }

    /// Buffer size, or the declared length of a streaming body.
    std::optional<size_t> Length() const;

    /// Source yielding the body. A buffer body becomes a one-chunk source and
    /// may be opened repeatedly; a streaming body fails with ProtocolViolation
    /// on the second open.
    std::expected<std::shared_ptr<IByteSource>, Error> OpenSource();

private:
    std::variant<ByteBuffer, std::shared_ptr<IByteSource>> storage_;
    std::optional<size_t> declared_length_;
    bool opened_ = false;
};

/// Write @p body into @p sink through a BackpressureBridge.
/// Fails with StreamingError if a declared length does not match the bytes
/// written. The sink is closed on every path.
asio::awaitable<std::expected<void, Error>> StreamBody(
    RequestBody body, std::shared_ptr<IByteSink> sink,
    StreamConfig config = StreamConfig::RequestBodyDefaults());

/// Response-side body: re-chunk a transport byte stream into
/// config.chunk_size pieces.
/// @throws std::invalid_argument if config.chunk_size is zero.
std::shared_ptr<IByteSource> ChunkedResponseBody(
    std::shared_ptr<IByteSource> transport,
    const StreamConfig& config = StreamConfig::RequestBodyDefaults());

}  // namespace page_pipe
