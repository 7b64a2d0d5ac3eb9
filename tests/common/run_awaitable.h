#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace dockhand::test_support {

namespace detail {
template <typename T>
boost::asio::awaitable<void> storeResult(boost::asio::awaitable<T> op, std::optional<T>& out) {
    out.emplace(co_await std::move(op));
}
} // namespace detail

// Drives one coroutine to completion on the given io_context and returns its value.
template <typename T>
T runAwaitable(boost::asio::io_context& io, boost::asio::awaitable<T> op,
               std::chrono::milliseconds limit = std::chrono::seconds(10)) {
    std::optional<T> out;
    std::exception_ptr failure;
    bool done = false;
    boost::asio::co_spawn(io, detail::storeResult(std::move(op), out),
                          [&](std::exception_ptr e) {
                              failure = e;
                              done = true;
                          });
    io.restart();
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done && std::chrono::steady_clock::now() < deadline) {
        io.run_one_for(std::chrono::milliseconds(50));
        if (io.stopped())
            break;
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
    if (!done || !out) {
        throw std::runtime_error("coroutine did not finish in time");
    }
    return std::move(*out);
}

// Runs queued handlers (socket closes, timers) without blocking.
inline void drain(boost::asio::io_context& io) {
    io.restart();
    io.poll();
}

} // namespace dockhand::test_support
