// SPDX-License-Identifier: MIT

// src/descriptor_sink.cpp
#include "src/descriptor_sink.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <utility>

#include <asio/dispatch.hpp>
#include <asio/error.hpp>
#include <fmt/format.h>

namespace page_pipe {

namespace {

bool fd_writable(int fd) {
    struct pollfd pfd = {fd, POLLOUT, 0};
    int rc = ::poll(&pfd, 1, 0);
    if (rc <= 0) return false;
    return (pfd.revents & (POLLOUT | POLLERR | POLLHUP)) != 0;
}

}  // namespace

std::expected<std::shared_ptr<DescriptorSink>, Error> DescriptorSink::Create(
    asio::any_io_executor executor, int fd, size_t max_buffer_size) {
    if (fd < 0) {
        return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid descriptor"});
    }
    if (max_buffer_size == 0) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     "max_buffer_size must be greater than zero"});
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        int err = errno;
        return std::unexpected(Error{ErrorCode::IoError,
            fmt::format("fcntl O_NONBLOCK failed: {}", std::strerror(err)), err});
    }

    struct MakeSharedEnabler : public DescriptorSink {
        MakeSharedEnabler(asio::any_io_executor ex, int f, size_t max)
            : DescriptorSink(std::move(ex), f, max) {}
    };
    return std::make_shared<MakeSharedEnabler>(std::move(executor), fd, max_buffer_size);
}

DescriptorSink::DescriptorSink(asio::any_io_executor executor, int fd, size_t max_buffer_size)
    : stream_(std::move(executor), fd), fd_(fd), max_buffer_size_(max_buffer_size) {}

DescriptorSink::~DescriptorSink() {
    // A close still queued on the executor owns a reference, so reaching here
    // means it ran or was dropped; the stream's own destructor covers the latter.
    if (!closed_.exchange(true, std::memory_order_acq_rel)) CloseDescriptor();
}

size_t DescriptorSink::WritableCapacity() {
    if (IsClosed()) return 0;
    if (fd_writable(fd_)) return max_buffer_size_;
    ArmWriteWait();
    return 0;
}

std::expected<size_t, Error> DescriptorSink::Write(std::span<const std::byte> data) {
    if (IsClosed()) {
        return std::unexpected(Error{ErrorCode::SinkClosed, "write to closed descriptor"});
    }
    if (data.empty()) return 0;

    for (;;) {
        ssize_t n = ::write(fd_, data.data(), data.size());
        if (n >= 0) return static_cast<size_t>(n);

        int err = errno;
        if (err == EINTR) continue;
        if (err == EAGAIN || err == EWOULDBLOCK) {
            ArmWriteWait();
            return 0;
        }
        return std::unexpected(Error{ErrorCode::IoError,
            fmt::format("write failed: {}", std::strerror(err)), err});
    }
}

void DescriptorSink::OnEvent(EventCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(cb);
}

void DescriptorSink::Close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) return;
    // The stream is only touched on its executor; inline when already there.
    asio::dispatch(stream_.get_executor(),
                   [self = shared_from_this()] { self->CloseDescriptor(); });
}

void DescriptorSink::CloseDescriptor() {
    std::error_code ec;
    stream_.close(ec);  // Cancels a pending wait_write as well
    if (ec) {
        std::fprintf(stderr, "DescriptorSink: close failed: %s\n", ec.message().c_str());
    }
}

void DescriptorSink::ArmWriteWait() {
    if (wait_pending_.exchange(true, std::memory_order_acq_rel)) return;

    std::weak_ptr<DescriptorSink> weak_self = weak_from_this();
    stream_.async_wait(
        asio::posix::stream_descriptor::wait_write,
        [weak_self](std::error_code ec) {
            auto self = weak_self.lock();
            if (!self) return;
            self->wait_pending_.store(false, std::memory_order_release);
            if (ec == asio::error::operation_aborted || self->IsClosed()) return;
            self->Fire(ec ? SinkEvent::ErrorOccurred : SinkEvent::SpaceAvailable);
        });
}

void DescriptorSink::Fire(SinkEvent event) {
    EventCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = callback_;
    }
    if (cb) cb(event);
}

}  // namespace page_pipe
