/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "server.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/as_tuple.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <exception>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

//-------------------------------------------------------------------------

namespace uniledger::server
{

namespace http = beast::http;
using net::use_awaitable;
using namespace net::experimental::awaitable_operators;

//-------------------------------------------------------------------------

namespace
{

constexpr auto use_nothrow_awaitable = net::experimental::as_tuple(use_awaitable);

net::awaitable<void> idleTimer(std::chrono::steady_clock::duration duration)
{
    net::steady_timer timer{co_await net::this_coro::executor};
    timer.expires_after(duration);
    co_await timer.async_wait(use_nothrow_awaitable);
}

}  // namespace

//-------------------------------------------------------------------------

net::awaitable<void> session(
    beast::tcp_stream stream,
    const api::LedgerApi& api,
    std::chrono::steady_clock::duration idleTimeout)
{
    beast::flat_buffer buffer;

    try {
        for (;;) {
            http::request<http::string_body> req;
            auto result = co_await (
                http::async_read(stream, buffer, req, use_nothrow_awaitable)
                || idleTimer(idleTimeout));
            if (result.index() == 1) break;

            auto [ec, bytes] = std::get<0>(result);
            if (ec == http::error::end_of_stream) break;
            if (ec) {
                throw boost::system::system_error{ec};
            }

            const auto outcome = api.handle(
                std::string_view{req.method_string()},
                std::string_view{req.target()},
                req.body());

            http::response<http::string_body> res{
                http::int_to_status(outcome.status), req.version()};
            res.set(http::field::content_type, "application/json");
            res.keep_alive(req.keep_alive());
            res.body() = outcome.body;
            res.prepare_payload();
            co_await http::async_write(stream, res, use_awaitable);

            if (!res.keep_alive()) break;
        }
    }
    catch (const boost::system::system_error& se) {
        spdlog::warn("Session closed on error: {}", se.what());
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

//-------------------------------------------------------------------------

net::awaitable<void> listen(
    tcp::endpoint endpoint,
    const api::LedgerApi& api,
    std::chrono::steady_clock::duration idleTimeout,
    std::latch& serverReady,
    std::stop_token stopToken)
{
    tcp::acceptor acceptor{co_await net::this_coro::executor, endpoint};
    acceptor.set_option(tcp::acceptor::reuse_address(true));
    spdlog::info("Listening on {}:{}", endpoint.address().to_string(), endpoint.port());
    serverReady.count_down();

    while (!stopToken.stop_requested()) {
        auto [ec, socket] = co_await acceptor.async_accept(use_nothrow_awaitable);
        if (ec == net::error::operation_aborted) break;
        if (ec) {
            spdlog::warn("Accept failed: {}", ec.message());
            continue;
        }
        net::co_spawn(
            acceptor.get_executor(),
            session(beast::tcp_stream{std::move(socket)}, api, idleTimeout),
            net::detached);
    }
}

//-------------------------------------------------------------------------

void runServer(const ServerProps& props, std::latch& serverReady, std::stop_token stopToken)
{
    if (props.api == nullptr || props.threads == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: Server needs an api and at least one thread",
            std::source_location::current().function_name())};
    }

    net::io_context ctx{static_cast<int>(props.threads)};
    std::exception_ptr failure;

    net::co_spawn(
        ctx,
        listen(
            tcp::endpoint{net::ip::make_address(props.host), props.port},
            *props.api,
            props.idleTimeout,
            serverReady,
            stopToken),
        [&](std::exception_ptr eptr) {
            if (eptr) {
                failure = eptr;
                ctx.stop();
            }
        });

    std::optional<net::signal_set> signals;
    if (props.stopOnSignal) {
        signals.emplace(ctx, SIGINT, SIGTERM);
        signals->async_wait([&](boost::system::error_code ec, int signal) {
            if (ec) return;
            spdlog::info("Received signal {}, shutting down", signal);
            ctx.stop();
        });
    }

    std::stop_callback onStop{stopToken, [&ctx] { ctx.stop(); }};

    {
        std::vector<std::jthread> workers;
        workers.reserve(props.threads - 1);
        for (uint32_t i = 1; i < props.threads; ++i) {
            workers.emplace_back([&ctx] { ctx.run(); });
        }
        ctx.run();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

//-------------------------------------------------------------------------

}  // namespace uniledger::server

//-------------------------------------------------------------------------
