// SPDX-License-Identifier: MIT

// lib/stream/backpressure_bridge.cpp
#include "lib/stream/backpressure_bridge.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <asio/cancellation_state.hpp>
#include <asio/cancellation_type.hpp>
#include <asio/error.hpp>
#include <asio/this_coro.hpp>
#include <fmt/format.h>

namespace page_pipe {

namespace {

// A cancelled task sees asio's operation_aborted at its next co_await
Error CancelledOrRethrow(const std::system_error& e) {
    if (e.code() != asio::error::operation_aborted) throw;
    return Error{ErrorCode::Cancelled, "bridge cancelled"};
}

}  // namespace

struct BackpressureBridge::Core {
    std::shared_ptr<IByteSource> source;
    std::shared_ptr<IByteSink> sink;
    std::shared_ptr<WriteWaiter> waiter = WriteWaiter::Create();
    size_t max_buffer_size = 0;

    std::atomic<bool> started{false};
    std::atomic<bool> shutdown{false};
    std::atomic<bool> sink_closed{false};

    std::atomic<size_t> bytes_written{0};
    std::atomic<size_t> write_calls{0};
    std::atomic<size_t> wait_count{0};

    void CloseSink() {
        if (sink_closed.exchange(true, std::memory_order_acq_rel)) return;
        sink->Close();
    }
};

BackpressureBridge::BackpressureBridge(std::shared_ptr<IByteSource> source,
                                       std::shared_ptr<IByteSink> sink,
                                       size_t max_buffer_size)
    : core_(std::make_shared<Core>()) {
    if (!source || !sink) {
        throw std::invalid_argument("BackpressureBridge: source and sink are required");
    }
    if (max_buffer_size == 0) {
        throw std::invalid_argument("BackpressureBridge: max_buffer_size must be greater than zero");
    }
    core_->source = std::move(source);
    core_->sink = std::move(sink);
    core_->max_buffer_size = max_buffer_size;
}

BackpressureBridge::~BackpressureBridge() {
    Shutdown();
}

asio::awaitable<std::expected<void, Error>> BackpressureBridge::Run() {
    return Drive(core_);
}

void BackpressureBridge::Shutdown() {
    if (!core_) return;  // Moved-from
    core_->shutdown.store(true, std::memory_order_release);
    core_->waiter->Close(Error{ErrorCode::Cancelled, "bridge shut down"});

    // Never started: nobody else will release the sink
    if (!core_->started.exchange(true, std::memory_order_acq_rel)) {
        core_->CloseSink();
    }
}

asio::awaitable<std::expected<void, Error>> BackpressureBridge::Drive(std::shared_ptr<Core> core) {
    if (!core) {
        std::fprintf(stderr, "BackpressureBridge::Run called on a moved-from bridge\n");
        co_return std::unexpected(Error{ErrorCode::ProtocolViolation,
                                        "Run() called on a moved-from bridge"});
    }
    if (core->started.exchange(true, std::memory_order_acq_rel)) {
        if (core->shutdown.load(std::memory_order_acquire)) {
            co_return std::unexpected(Error{ErrorCode::Cancelled, "bridge shut down"});
        }
        std::fprintf(stderr, "BackpressureBridge::Run called more than once\n");
        co_return std::unexpected(Error{ErrorCode::ProtocolViolation,
                                        "Run() called more than once"});
    }

    // Scope guard: the sink is released on every exit path, including when
    // the coroutine is destroyed while suspended.
    struct SinkCloser {
        Core& core;
        ~SinkCloser() { core.CloseSink(); }
    } closer{*core};

    // Events may arrive on the sink's own thread; route them into the waiter
    std::weak_ptr<WriteWaiter> weak_waiter = core->waiter;
    core->sink->OnEvent([weak_waiter](SinkEvent event) {
        auto waiter = weak_waiter.lock();
        if (!waiter) return;
        switch (event) {
            case SinkEvent::SpaceAvailable:
                waiter->NotifyCapacity();
                break;
            case SinkEvent::ErrorOccurred:
                waiter->NotifyError(Error{ErrorCode::StreamingError,
                                          "sink reported an error"});
                break;
        }
    });

    auto result = co_await Pump(*core);
    core->CloseSink();
    co_return result;
}

asio::awaitable<std::expected<void, Error>> BackpressureBridge::Pump(Core& core) {
    asio::cancellation_state cs = co_await asio::this_coro::cancellation_state;

    // Checked before every pull and every write
    auto interrupted = [&core, &cs]() -> std::optional<Error> {
        if (cs.cancelled() != asio::cancellation_type::none) {
            return Error{ErrorCode::Cancelled, "bridge cancelled"};
        }
        if (core.shutdown.load(std::memory_order_acquire)) {
            return Error{ErrorCode::Cancelled, "bridge shut down"};
        }
        return core.waiter->PendingError();
    };

    for (;;) {
        if (auto err = interrupted()) co_return std::unexpected(std::move(*err));

        NextChunk next;
        try {
            next = co_await core.source->Next();
        } catch (const std::system_error& e) {
            next = std::unexpected(CancelledOrRethrow(e));
        }
        if (!next) co_return std::unexpected(std::move(next.error()));
        if (!next->has_value()) break;

        ByteBuffer chunk = std::move(**next);
        auto data = chunk.Span();
        size_t offset = 0;

        while (offset < data.size()) {
            if (auto err = interrupted()) co_return std::unexpected(std::move(*err));

            size_t capacity = core.sink->WritableCapacity();
            if (capacity > 0) {
                size_t len = std::min({data.size() - offset, capacity, core.max_buffer_size});
                auto written = core.sink->Write(data.subspan(offset, len));
                if (!written) {
                    const Error& e = written.error();
                    co_return std::unexpected(Error{ErrorCode::StreamingError,
                        fmt::format("sink write failed: {}", e.message), e.os_errno});
                }
                core.write_calls.fetch_add(1, std::memory_order_relaxed);

                size_t n = std::min(*written, len);
                if (n > 0) {
                    offset += n;
                    core.bytes_written.fetch_add(n, std::memory_order_relaxed);
                    continue;
                }
                // Accepted nothing despite reported capacity: wait like a full sink
            }

            core.wait_count.fetch_add(1, std::memory_order_relaxed);
            WriteWaiter::WaitResult woke;
            try {
                woke = co_await core.waiter->Wait();
            } catch (const std::system_error& e) {
                woke = CancelledOrRethrow(e);
            }
            if (woke) co_return std::unexpected(std::move(*woke));
        }
    }

    co_return std::expected<void, Error>{};
}

size_t BackpressureBridge::BytesWritten() const {
    return core_ ? core_->bytes_written.load(std::memory_order_relaxed) : 0;
}

size_t BackpressureBridge::WriteCalls() const {
    return core_ ? core_->write_calls.load(std::memory_order_relaxed) : 0;
}

size_t BackpressureBridge::WaitCount() const {
    return core_ ? core_->wait_count.load(std::memory_order_relaxed) : 0;
}

bool BackpressureBridge::IsSinkClosed() const {
    return core_ && core_->sink_closed.load(std::memory_order_acquire);
}

WriteWaiter::State BackpressureBridge::WaiterState() const {
    return core_ ? core_->waiter->GetState() : WriteWaiter::State::Closed;
}

}  // namespace page_pipe
