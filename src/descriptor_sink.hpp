// SPDX-License-Identifier: MIT

// src/descriptor_sink.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <span>

#include <asio/any_io_executor.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include "lib/stream/byte_stream.hpp"
#include "lib/stream/error.hpp"

namespace page_pipe {

// DescriptorSink - IByteSink over a non-blocking POSIX descriptor (pipe or
// stream socket).
//
// WritableCapacity() polls the descriptor: when writable it reports
// max_buffer_size, otherwise it arms a one-shot asio wait_write whose
// completion fires SinkEvent::SpaceAvailable (or ErrorOccurred). Write() maps
// EAGAIN to zero bytes accepted and arms the same wait.
//
// Events are delivered on the executor the sink was created with.
//
// Ownership: the sink owns the descriptor and closes it in Close() or on
// destruction. Close() may be called from any thread; the descriptor itself
// is closed on the sink's executor, inline when called from there.
class DescriptorSink : public IByteSink,
                       public std::enable_shared_from_this<DescriptorSink> {
public:
    /// Take ownership of @p fd and switch it to non-blocking mode.
    static std::expected<std::shared_ptr<DescriptorSink>, Error> Create(
        asio::any_io_executor executor, int fd, size_t max_buffer_size = 16 * 1024);

    ~DescriptorSink() override;

    DescriptorSink(const DescriptorSink&) = delete;
    DescriptorSink& operator=(const DescriptorSink&) = delete;

    size_t WritableCapacity() override;
    std::expected<size_t, Error> Write(std::span<const std::byte> data) override;
    void OnEvent(EventCallback cb) override;
    void Close() override;

    bool IsClosed() const { return closed_.load(std::memory_order_acquire); }

protected:
    DescriptorSink(asio::any_io_executor executor, int fd, size_t max_buffer_size);

private:
    void ArmWriteWait();
    void CloseDescriptor();
    void Fire(SinkEvent event);

    asio::posix::stream_descriptor stream_;
    const int fd_;
    const size_t max_buffer_size_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> wait_pending_{false};

    std::mutex callback_mutex_;
    EventCallback callback_;
};

}  // namespace page_pipe
