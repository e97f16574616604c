//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "server.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "config.hpp"
#include "error.hpp"
#include "http_session.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using asio::ip::tcp;
using namespace msghub;

static std::string to_string(const tcp::endpoint& ep)
{
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

// Completion handler for sessions. An exception escaping a session
// only terminates that connection
static auto session_completion(std::string peer)
{
    return [peer = std::move(peer)](std::exception_ptr exc) {
        if (!exc)
            return;
        try
        {
            std::rethrow_exception(exc);
        }
        catch (const std::exception& err)
        {
            log_error(errc::uncaught_exception, "Uncaught exception in HTTP session with " + peer, err.what());
        }
    };
}

asio::awaitable<void> msghub::run_server(std::shared_ptr<shared_state> st)
{
    auto ex = co_await asio::this_coro::executor;
    const auto& cfg = st->config();
    tcp::endpoint listening_endpoint(asio::ip::make_address(cfg.listen_address), cfg.port);

    // Binding errors are fatal
    tcp::acceptor acceptor(ex);
    acceptor.open(listening_endpoint.protocol());
    acceptor.set_option(asio::socket_base::reuse_address(true));
    acceptor.bind(listening_endpoint);
    acceptor.listen();
    log_info("Listening on " + to_string(listening_endpoint));

    while (true)
    {
        auto [ec, sock] = co_await acceptor.async_accept(asio::as_tuple(asio::use_awaitable));
        if (ec == asio::error::operation_aborted)
            co_return;
        if (ec)
        {
            // Running out of descriptors shouldn't bring the server down
            log_error(ec, "Accepting a connection");
            continue;
        }

        error_code peer_ec;
        auto peer = sock.remote_endpoint(peer_ec);
        asio::co_spawn(
            ex,
            run_http_session(std::move(sock), st),
            session_completion(peer_ec ? std::string("unknown peer") : to_string(peer))
        );
    }
}
