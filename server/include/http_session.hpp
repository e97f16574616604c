//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_HTTP_SESSION_HPP
#define MSGHUB_SERVER_INCLUDE_HTTP_SESSION_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>

namespace msghub {

// Forward declaration
class shared_state;

// Runs a HTTP session until the connection is closed or an error is encountered.
// This will serve API requests or run an event stream, depending
// on what the client requested.
boost::asio::awaitable<void> run_http_session(
    boost::asio::ip::tcp::socket&& socket,
    std::shared_ptr<shared_state> state
);

}  // namespace msghub

#endif
