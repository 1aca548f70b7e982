// SPDX-License-Identifier: MIT

// lib/stream/byte_buffer.hpp
#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace page_pipe {

/// Immutable, reference-counted slice of bytes.
///
/// Copies of a ByteBuffer share storage; slicing never copies. This is the
/// unit pulled from byte sources and pushed into sinks.
///
/// Thread safety: a ByteBuffer may be read from several threads at once.
/// Mutating operations (ReadSlice, assignment) require external synchronization.
class ByteBuffer {
public:
    ByteBuffer() = default;

    /// Copy @p bytes into freshly allocated storage.
    static ByteBuffer Copy(std::span<const std::byte> bytes) {
        return Adopt(std::vector<std::byte>(bytes.begin(), bytes.end()));
    }

    /// Copy the characters of @p s into a new buffer.
    static ByteBuffer FromString(std::string_view s) {
        std::vector<std::byte> data(s.size());
        if (!s.empty()) std::memcpy(data.data(), s.data(), s.size());
        return Adopt(std::move(data));
    }

    /// Take ownership of @p bytes without copying.
    static ByteBuffer Adopt(std::vector<std::byte> bytes) {
        ByteBuffer buf;
        buf.size_ = bytes.size();
        buf.storage_ = std::make_shared<const std::vector<std::byte>>(std::move(bytes));
        return buf;
    }

    size_t Size() const noexcept { return size_; }

    bool Empty() const noexcept { return size_ == 0; }

    /// Readable bytes of this slice.
    std::span<const std::byte> Span() const noexcept {
        if (!storage_) return {};
        return std::span{storage_->data() + offset_, size_};
    }

    /// Split off the first @p n bytes and return them; the remainder stays in
    /// this buffer. Shares storage with the result.
    ByteBuffer ReadSlice(size_t n) {
        assert(n <= size_ && "ReadSlice: length exceeds readable bytes");
        ByteBuffer head = Slice(0, n);
        offset_ += n;
        size_ -= n;
        return head;
    }

    /// Sub-slice [@p offset, @p offset + @p len) sharing storage with this buffer.
    ByteBuffer Slice(size_t offset, size_t len) const {
        assert(offset + len <= size_ && "Slice: range out of bounds");
        ByteBuffer out;
        out.storage_ = storage_;
        out.offset_ = offset_ + offset;
        out.size_ = len;
        return out;
    }

    std::string ToString() const {
        auto span = Span();
        return std::string(reinterpret_cast<const char*>(span.data()), span.size());
    }

    /// Number of ByteBuffers currently sharing this buffer's storage.
    long UseCount() const noexcept { return storage_.use_count(); }

    friend bool operator==(const ByteBuffer& a, const ByteBuffer& b) {
        return std::ranges::equal(a.Span(), b.Span());
    }

private:
    std::shared_ptr<const std::vector<std::byte>> storage_;
    size_t offset_ = 0;
    size_t size_ = 0;
};

}  // namespace page_pipe
