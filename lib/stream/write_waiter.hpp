// SPDX-License-Identifier: MIT

// lib/stream/write_waiter.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include <asio/awaitable.hpp>

#include "lib/stream/error.hpp"

namespace page_pipe {

// WriteWaiter - single-slot handoff between a producer waiting for sink
// capacity and the sink's readiness events.
//
// State machine (all transitions under mutex_):
//
//   Idle --Wait()--> Waiting --NotifyCapacity()--> Idle   (waiter resumed OK)
//   Idle --NotifyCapacity()--> CapacityAvailable --Wait()--> Idle (immediate)
//   Waiting --NotifyError()/cancel--> Idle               (waiter resumed with error)
//   any --Close()--> Closed                              (waiter resumed with reason)
//
// A capacity event that finds no waiter is latched rather than dropped, so an
// event racing with the producer's capacity check cannot strand the producer.
// The first sink error is latched as well and fails every later Wait().
//
// At most one waiter may be registered. A second Wait() while one is pending
// fails the new caller with ProtocolViolation; the pending waiter is untouched.
//
// Waiters are always resumed by posting to their own executor, never inline on
// the notifying thread.
//
// Thread safety: NotifyCapacity(), NotifyError() and Close() may be called from
// any thread. Wait() is called from the single producing task.
class WriteWaiter : public std::enable_shared_from_this<WriteWaiter> {
public:
    enum class State { Idle, CapacityAvailable, Waiting, Closed };

    /// std::nullopt when resumed by capacity, otherwise the reason for failing.
    using WaitResult = std::optional<Error>;

    static std::shared_ptr<WriteWaiter> Create() {
        struct MakeSharedEnabler : public WriteWaiter {};
        return std::make_shared<MakeSharedEnabler>();
    }

    WriteWaiter(const WriteWaiter&) = delete;
    WriteWaiter& operator=(const WriteWaiter&) = delete;

    /// Suspend until capacity is signalled, an error is reported, the waiter is
    /// closed, or the calling task is cancelled (resumes with Cancelled).
    asio::awaitable<WaitResult> Wait();

    /// Capacity was freed. Resumes the waiter, or latches the event.
    void NotifyCapacity();

    /// The sink failed. Resumes the waiter with @p e and fails later waits.
    void NotifyError(Error e);

    /// Terminal transition. Resumes any waiter with @p reason; later waits
    /// complete immediately with @p reason. Idempotent.
    void Close(Error reason);

    State GetState() const;

    bool HasWaiter() const { return GetState() == State::Waiting; }

    /// Latched sink error, if any.
    std::optional<Error> PendingError() const;

protected:
    WriteWaiter() = default;

private:
    using Resumer = std::function<void(WaitResult)>;

    template<typename Handler>
    void Register(Handler handler);

    void Cancel(uint64_t ticket);

    mutable std::mutex mutex_;
    State state_ = State::Idle;
    std::optional<Error> error_;      // First sink error, latched
    std::optional<Error> close_reason_;
    Resumer waiter_;                  // Set only in Waiting
    uint64_t waiter_ticket_ = 0;      // Identifies the registration in waiter_
    std::atomic<uint64_t> next_ticket_{0};
};

}  // namespace page_pipe
