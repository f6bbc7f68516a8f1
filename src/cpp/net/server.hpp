/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "LedgerApi.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <chrono>
#include <latch>
#include <stop_token>
#include <string>

//-------------------------------------------------------------------------

namespace uniledger::server
{

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

using namespace std::chrono_literals;

//-------------------------------------------------------------------------

// Serves keep-alive HTTP/1.1 requests on one connection until the peer closes
// it or stays idle for longer than idleTimeout.
net::awaitable<void> session(
    beast::tcp_stream stream,
    const api::LedgerApi& api,
    std::chrono::steady_clock::duration idleTimeout);

//-------------------------------------------------------------------------

net::awaitable<void> listen(
    tcp::endpoint endpoint,
    const api::LedgerApi& api,
    std::chrono::steady_clock::duration idleTimeout,
    std::latch& serverReady,
    std::stop_token stopToken);

//-------------------------------------------------------------------------

struct ServerProps
{
    std::string host;
    uint16_t port;
    uint32_t threads{1};
    std::chrono::steady_clock::duration idleTimeout{30s};
    const api::LedgerApi* api;
    bool stopOnSignal{};
};

// Blocks until stopToken is signalled, or SIGINT/SIGTERM arrives when stopOnSignal is set.
// The io_context runs on props.threads threads.
void runServer(const ServerProps& props, std::latch& serverReady, std::stop_token stopToken);

//-------------------------------------------------------------------------

}  // namespace uniledger::server

//-------------------------------------------------------------------------
