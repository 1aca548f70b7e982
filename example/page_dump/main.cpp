// SPDX-License-Identifier: MIT

// example/page_dump/main.cpp
//
// Walks a simulated cursor-paginated listing and streams it, re-chunked, to
// stdout through a backpressured descriptor sink.
//
// Usage: page_dump [item_count] [page_size] [chunk_size]
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/this_coro.hpp>
#include <fmt/format.h>

#include "lib/stream/buffer_source.hpp"
#include "lib/stream/paginator.hpp"
#include "lib/stream/request_body.hpp"
#include "src/descriptor_sink.hpp"

using namespace page_pipe;

namespace {

struct ListInput {
    std::optional<size_t> start_after;
    size_t page_size = 100;
};

struct ListOutput {
    std::vector<std::string> keys;
    std::optional<size_t> next_start_after;
};

// Stand-in for a remote listing call
auto MakeListOperation(size_t item_count) {
    return [item_count](ListInput in) -> asio::awaitable<std::expected<ListOutput, Error>> {
        size_t begin = in.start_after.value_or(0);
        size_t end = std::min(begin + in.page_size, item_count);
        ListOutput out;
        for (size_t i = begin; i < end; ++i) {
            out.keys.push_back(fmt::format("objects/{:08}.bin", i));
        }
        if (end < item_count) out.next_start_after = end;
        co_return out;
    };
}

asio::awaitable<std::expected<void, Error>> Dump(size_t item_count, size_t page_size,
                                                 StreamConfig config) {
    auto pages = PaginateByMembers(ListInput{.start_after = std::nullopt, .page_size = page_size},
                                   MakeListOperation(item_count),
                                   &ListInput::start_after, &ListOutput::next_start_after);

    auto listing = std::make_shared<BufferSequenceSource>();
    auto walked = co_await pages.ForEach([&](ListOutput page) {
        std::string text;
        for (const auto& key : page.keys) {
            text += key;
            text += '\n';
        }
        listing->Push(ByteBuffer::FromString(text));
    });
    if (!walked) co_return std::unexpected(walked.error());
    std::fprintf(stderr, "listed %zu keys in %llu requests\n", item_count,
                 static_cast<unsigned long long>(pages.RequestCount()));

    int fd = ::dup(STDOUT_FILENO);
    if (fd < 0) {
        co_return std::unexpected(Error{ErrorCode::IoError, "dup(stdout) failed", errno});
    }
    auto executor = co_await asio::this_coro::executor;
    auto sink = DescriptorSink::Create(executor, fd, config.max_buffer_size);
    if (!sink) {
        ::close(fd);
        co_return std::unexpected(sink.error());
    }

    auto body = RequestBody::FromSource(ChunkedResponseBody(listing, config));
    co_return co_await StreamBody(std::move(body), *sink, config);
}

}  // namespace

int main(int argc, char* argv[]) {
    size_t item_count = argc > 1 ? std::strtoull(argv[1], nullptr, 10) : 1000;
    size_t page_size = argc > 2 ? std::strtoull(argv[2], nullptr, 10) : 100;
    if (page_size == 0) {
        std::fprintf(stderr, "page_size must be greater than zero\n");
        return 2;
    }
    StreamConfig config = StreamConfig::RequestBodyDefaults();
    if (argc > 3) config.chunk_size = std::strtoull(argv[3], nullptr, 10);
    if (auto err = config.Validate()) {
        std::fprintf(stderr, "invalid configuration: %s\n", err->message.c_str());
        return 2;
    }

    asio::io_context ctx;
    std::optional<std::expected<void, Error>> result;
    asio::co_spawn(ctx, Dump(item_count, page_size, config),
        [&](std::exception_ptr e, std::expected<void, Error> r) {
            if (e) std::rethrow_exception(e);
            result = std::move(r);
        });
    ctx.run();

    if (!result || !*result) {
        const Error& err = result ? result->error()
                                  : Error{ErrorCode::OperationFailed, "did not complete"};
        std::fprintf(stderr, "page_dump failed [%s]: %s\n",
                     std::string(error_code_name(err.code)).c_str(), err.message.c_str());
        return 1;
    }
    return 0;
}
