// SPDX-License-Identifier: MIT

// lib/stream/paginator.hpp
#pragma once

#include <concepts>
#include <cstdint>
#include <cstdio>
#include <expected>
#include <functional>
#include <optional>
#include <system_error>
#include <utility>

#include <asio/awaitable.hpp>
#include <asio/cancellation_state.hpp>
#include <asio/cancellation_type.hpp>
#include <asio/error.hpp>
#include <asio/this_coro.hpp>

#include "lib/stream/error.hpp"

namespace page_pipe {

// PageOperation - a paged call: Input -> awaitable<expected<Output, Error>>
template<typename F, typename Input, typename Output>
concept PageOperation = requires(F& f, Input in) {
    { f(std::move(in)) } -> std::same_as<asio::awaitable<std::expected<Output, Error>>>;
};

// Paginator - lazy, forward-only sequence of pages driven by a cursor.
//
// Each Next() issues exactly one call with the current input. The returned
// page's next-cursor (via the getter) becomes the cursor of the following
// input (via the setter). The first page without a next-cursor is delivered
// and ends the sequence.
//
// State machine:
//   Ready -> Fetching -> Ready      (page with next-cursor)
//                     -> Finished   (page without next-cursor, error, or cancel)
//
// Requests are strictly sequential: request n+1 is built only after response n
// completed. A page whose next-cursor repeats the previous cursor is not
// detected; the operation is responsible for making progress.
//
// Errors are terminal and surfaced verbatim; nothing is retried here.
//
// Thread safety: Not thread-safe. A Paginator is driven by one consumer task.
template<typename Input, typename Output, typename Cursor>
class Paginator {
public:
    using Result = std::expected<Output, Error>;
    using Page = std::expected<std::optional<Output>, Error>;
    using Operation = std::function<asio::awaitable<Result>(Input)>;
    using CursorGetter = std::function<std::optional<Cursor>(const Output&)>;
    using CursorSetter = std::function<Input(const Input&, Cursor)>;

    enum class State { Ready, Fetching, Finished };

    /// @param initial_input  Input of the first request, carrying the caller's
    ///                       starting cursor (absent = from the beginning)
    /// @param call           The paged operation
    /// @param get_cursor     Extracts the next-cursor from a page
    /// @param set_cursor     Produces the next input from the previous one
    Paginator(Input initial_input, Operation call,
              CursorGetter get_cursor, CursorSetter set_cursor)
        : input_(std::move(initial_input)),
          call_(std::move(call)),
          get_cursor_(std::move(get_cursor)),
          set_cursor_(std::move(set_cursor)) {}

    Paginator(const Paginator&) = delete;
    Paginator& operator=(const Paginator&) = delete;
    Paginator(Paginator&&) = default;
    Paginator& operator=(Paginator&&) = default;

    /// Fetch the next page.
    /// @return the page, std::nullopt once the sequence ended, or the error
    ///         that ended it.
    asio::awaitable<Page> Next() {
        if (state_ == State::Finished) co_return std::nullopt;
        if (state_ == State::Fetching) {
            std::fprintf(stderr, "Paginator::Next called while a page request is in flight\n");
            co_return std::unexpected(Error{ErrorCode::ProtocolViolation,
                                            "Next() called while a page request is in flight"});
        }

        asio::cancellation_state cs = co_await asio::this_coro::cancellation_state;
        if (cs.cancelled() != asio::cancellation_type::none) {
            state_ = State::Finished;
            co_return std::unexpected(Error{ErrorCode::Cancelled, "pagination cancelled"});
        }

        // Ends the sequence if the call throws instead of returning an error
        struct FetchGuard {
            State& state;
            bool completed = false;
            ~FetchGuard() {
                if (!completed) state = State::Finished;
            }
        } guard{state_};

        state_ = State::Fetching;
        ++request_count_;
        std::optional<Result> result;
        try {
            result.emplace(co_await call_(input_));
        } catch (const std::system_error& e) {
            co_return AbortedByCancellation(e);
        }
        guard.completed = true;

        if (!*result) {
            state_ = State::Finished;
            co_return std::unexpected(std::move(result->error()));
        }

        std::optional<Cursor> cursor = get_cursor_(**result);
        if (cursor) {
            input_ = set_cursor_(input_, std::move(*cursor));
            state_ = State::Ready;
        } else {
            state_ = State::Finished;
        }
        co_return std::move(**result);
    }

    /// Invoke @p fn on every remaining page in order.
    /// Pages delivered before an error have already been passed to @p fn.
    template<typename F>
    asio::awaitable<std::expected<void, Error>> ForEach(F fn) {
        for (;;) {
            Page page;
            try {
                page = co_await Next();
            } catch (const std::system_error& e) {
                page = AbortedByCancellation(e);
            }
            if (!page) co_return std::unexpected(std::move(page.error()));
            if (!page->has_value()) break;
            fn(std::move(**page));
        }
        co_return std::expected<void, Error>{};
    }

    /// Fold all remaining pages into an accumulator: acc = fn(acc, page).
    template<typename T, typename F>
    asio::awaitable<std::expected<T, Error>> Reduce(T initial, F fn) {
        T acc = std::move(initial);
        for (;;) {
            Page page;
            try {
                page = co_await Next();
            } catch (const std::system_error& e) {
                page = AbortedByCancellation(e);
            }
            if (!page) co_return std::unexpected(std::move(page.error()));
            if (!page->has_value()) break;
            acc = fn(std::move(acc), std::move(**page));
        }
        co_return std::move(acc);
    }

    /// Number of operation calls issued so far.
    uint64_t RequestCount() const { return request_count_; }

    bool IsFinished() const { return state_ == State::Finished; }

    State GetState() const { return state_; }

    /// Input the next request will be sent with.
    const Input& CurrentInput() const { return input_; }

private:
    // A cancelled task sees asio's operation_aborted at its next co_await.
    // Anything else is rethrown.
    Page AbortedByCancellation(const std::system_error& e) {
        if (e.code() != asio::error::operation_aborted) throw;
        state_ = State::Finished;
        return std::unexpected(Error{ErrorCode::Cancelled, "pagination cancelled"});
    }

    Input input_;
    Operation call_;
    CursorGetter get_cursor_;
    CursorSetter set_cursor_;
    State state_ = State::Ready;
    uint64_t request_count_ = 0;
};

/// Build a Paginator whose cursor accessors are two std::optional<Cursor>
/// data members: the request's cursor field and the response's next-cursor field.
///
/// @code
/// auto pages = PaginateByMembers(ListInput{.page_size = 4}, list_op,
///                                &ListInput::token, &ListOutput::next_token);
/// @endcode
template<typename Input, typename Output, typename Cursor, typename Op>
    requires PageOperation<Op, Input, Output>
Paginator<Input, Output, Cursor> PaginateByMembers(
    Input initial_input,
    Op call,
    std::optional<Cursor> Input::*input_cursor,
    std::optional<Cursor> Output::*output_cursor) {
    return Paginator<Input, Output, Cursor>(
        std::move(initial_input),
        std::move(call),
        [output_cursor](const Output& out) { return out.*output_cursor; },
        [input_cursor](const Input& in, Cursor cursor) {
            Input next = in;
            next.*input_cursor = std::move(cursor);
            return next;
        });
}

}  // namespace page_pipe
