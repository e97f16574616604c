//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#ifndef MSGHUB_SERVER_INCLUDE_SERVER_HPP
#define MSGHUB_SERVER_INCLUDE_SERVER_HPP

#include <boost/asio/awaitable.hpp>

#include <memory>

namespace msghub {

class shared_state;

// Accepts HTTP connections on the address and port in st's configuration,
// spawning a session for each. Returns when the acceptor is cancelled or
// the io_context stops. Throws if the address can't be parsed or bound.
boost::asio::awaitable<void> run_server(std::shared_ptr<shared_state> st);

}  // namespace msghub

#endif
