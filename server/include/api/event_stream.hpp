//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MSGHUB_SERVER_INCLUDE_API_EVENT_STREAM_HPP
#define MSGHUB_SERVER_INCLUDE_API_EVENT_STREAM_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <chrono>
#include <cstdint>
#include <optional>

#include "error.hpp"
#include "request_context.hpp"

// Pushes newly created messages to connected clients, using server-sent events.

namespace msghub {

class shared_state;
class event_sink;
class subscription;

// Delivers hub events addressed to user_id through sink, interleaved with
// heartbeats, until the hub is closed (returns an empty error code) or
// a write fails (returns the write error). Lag is logged and skipped.
boost::asio::awaitable<error_code> run_event_bridge(
    event_sink& sink,
    subscription& sub,
    std::int64_t user_id,
    std::chrono::seconds heartbeat_interval
);

// GET /stream. Authenticates the client and, on success, takes ownership of
// the connection and runs the bridge until it finishes.
// Returns the response to write if the stream couldn't be established,
// and an empty optional if the connection was consumed.
boost::asio::awaitable<std::optional<response_builder::response_type>> handle_event_stream(
    request_context& ctx,
    boost::beast::tcp_stream& stream,
    shared_state& st
);

}  // namespace msghub

#endif
