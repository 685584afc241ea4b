#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

// Drives one coroutine to completion on io and hands back its result or rethrows its exception.
template <typename T>
T runBlocking(boost::asio::io_context& io, boost::asio::awaitable<T> task)
{
    auto result = boost::asio::co_spawn(io, std::move(task), boost::asio::use_future);
    io.restart();
    io.run();
    return result.get();
}
