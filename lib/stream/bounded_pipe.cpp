// SPDX-License-Identifier: MIT

// lib/stream/bounded_pipe.cpp
#include "lib/stream/bounded_pipe.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace page_pipe {

BoundedPipe::BoundedPipe(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("BoundedPipe: capacity must be greater than zero");
    }
}

size_t BoundedPipe::WritableCapacity() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (close_count_ > 0 || failed_) return 0;
    return capacity_ - buffered_.Size();
}

std::expected<size_t, Error> BoundedPipe::Write(std::span<const std::byte> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (close_count_ > 0) {
        return std::unexpected(Error{ErrorCode::SinkClosed, "write to closed pipe"});
    }
    if (failed_) {
        return std::unexpected(Error{ErrorCode::StreamingError, "write to failed pipe"});
    }

    size_t n = std::min(data.size(), capacity_ - buffered_.Size());
    if (n == 0) return 0;
    buffered_.Append(ByteBuffer::Copy(data.first(n)));
    total_written_ += n;
    return n;
}

void BoundedPipe::OnEvent(EventCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(cb);
}

void BoundedPipe::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++close_count_;
}

ByteBuffer BoundedPipe::Read(size_t max_bytes) {
    ByteBuffer out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = std::min(max_bytes, buffered_.Size());
        if (n == 0) return out;
        out = buffered_.Take(n);
        total_read_ += n;
    }
    Fire(SinkEvent::SpaceAvailable);
    return out;
}

void BoundedPipe::Fail() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failed_) return;
        failed_ = true;
    }
    Fire(SinkEvent::ErrorOccurred);
}

void BoundedPipe::Fire(SinkEvent event) {
    EventCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = callback_;
    }
    if (cb) cb(event);
}

size_t BoundedPipe::Buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffered_.Size();
}

size_t BoundedPipe::TotalRead() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_read_;
}

size_t BoundedPipe::TotalWritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_written_;
}

bool BoundedPipe::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_count_ > 0;
}

int BoundedPipe::CloseCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_count_;
}

bool BoundedPipe::AtEnd() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_count_ > 0 && buffered_.Empty();
}

}  // namespace page_pipe
