// SPDX-License-Identifier: MIT

// lib/stream/write_waiter.cpp
#include "lib/stream/write_waiter.hpp"

#include <cstdio>
#include <utility>

#include <asio/associated_cancellation_slot.hpp>
#include <asio/associated_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/cancellation_type.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

namespace page_pipe {

template<typename Handler>
void WriteWaiter::Register(Handler handler) {
    auto ex = asio::get_associated_executor(handler);
    auto slot = asio::get_associated_cancellation_slot(handler);

    // Handler is move-only; share it so the resumer fits in std::function
    auto handler_ptr = std::make_shared<Handler>(std::move(handler));
    Resumer resume = [ex, slot, handler_ptr](WaitResult result) {
        asio::post(ex, [slot, handler_ptr, result = std::move(result)]() mutable {
            if (slot.is_connected()) slot.clear();
            std::move(*handler_ptr)(std::move(result));
        });
    };

    // Hook cancellation before publishing the waiter. A late cancellation for an
    // already-resumed registration is ignored via the ticket.
    uint64_t ticket = next_ticket_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (slot.is_connected()) {
        std::weak_ptr<WriteWaiter> weak_self = weak_from_this();
        slot.assign([weak_self, ticket](asio::cancellation_type) {
            if (auto self = weak_self.lock()) {
                self->Cancel(ticket);
            }
        });
    }

    WaitResult immediate;
    bool complete_now = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case State::Closed:
                immediate = close_reason_;
                break;
            case State::Waiting:
                std::fprintf(stderr, "WriteWaiter: second waiter registered while one is pending\n");
                immediate = Error{ErrorCode::ProtocolViolation,
                                  "a waiter is already registered"};
                break;
            case State::CapacityAvailable:
                state_ = State::Idle;
                immediate = error_;
                break;
            case State::Idle:
                if (error_) {
                    immediate = error_;
                    break;
                }
                state_ = State::Waiting;
                waiter_ = resume;
                waiter_ticket_ = ticket;
                complete_now = false;
                break;
        }
    }

    if (complete_now) {
        resume(std::move(immediate));
    }
}

asio::awaitable<WriteWaiter::WaitResult> WriteWaiter::Wait() {
    // Bridge the callback-style registration into the calling coroutine
    auto result = co_await asio::async_initiate<
        decltype(asio::use_awaitable),
        void(WaitResult)
    >(
        [this](auto handler) {
            Register(std::move(handler));
        },
        asio::use_awaitable
    );

    co_return result;
}

void WriteWaiter::NotifyCapacity() {
    Resumer resume;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case State::Waiting:
                resume = std::move(waiter_);
                waiter_ = nullptr;
                state_ = State::Idle;
                break;
            case State::Idle:
                state_ = State::CapacityAvailable;
                break;
            case State::CapacityAvailable:
            case State::Closed:
                break;
        }
    }
    if (resume) resume(std::nullopt);
}

void WriteWaiter::NotifyError(Error e) {
    Resumer resume;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Closed) return;
        if (!error_) error_ = e;
        if (state_ == State::Waiting) {
            resume = std::move(waiter_);
            waiter_ = nullptr;
            state_ = State::Idle;
        }
    }
    if (resume) resume(std::move(e));
}

void WriteWaiter::Close(Error reason) {
    Resumer resume;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Closed) return;
        close_reason_ = reason;
        if (state_ == State::Waiting) {
            resume = std::move(waiter_);
            waiter_ = nullptr;
        }
        state_ = State::Closed;
    }
    if (resume) resume(std::move(reason));
}

void WriteWaiter::Cancel(uint64_t ticket) {
    Resumer resume;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Waiting || waiter_ticket_ != ticket) return;
        resume = std::move(waiter_);
        waiter_ = nullptr;
        state_ = State::Idle;
    }
    resume(Error{ErrorCode::Cancelled, "wait for sink capacity cancelled"});
}

WriteWaiter::State WriteWaiter::GetState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<Error> WriteWaiter::PendingError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

}  // namespace page_pipe
