//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/event_stream.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "api/api_types.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "services/broadcast_hub.hpp"
#include "services/session_registry.hpp"
#include "shared_state.hpp"
#include "util/event_stream.hpp"

using namespace msghub;
namespace asio = boost::asio;
using namespace asio::experimental::awaitable_operators;

// Maximum time a single write may take
static constexpr std::chrono::seconds write_timeout{30};

asio::awaitable<error_code> msghub::run_event_bridge(
    event_sink& sink,
    subscription& sub,
    std::int64_t user_id,
    std::chrono::seconds heartbeat_interval
)
{
    asio::steady_timer timer(co_await asio::this_coro::executor);

    // Heartbeats are sent at a fixed rate, regardless of the messages in between
    auto next_heartbeat = std::chrono::steady_clock::now() + heartbeat_interval;

    while (true)
    {
        // Wait for whichever comes first. If the timer wins, the receive is
        // cancelled without losing any event
        timer.expires_at(next_heartbeat);
        auto res = co_await (sub.receive() || timer.async_wait(asio::as_tuple(asio::use_awaitable)));

        if (res.index() == 0u)
        {
            auto& evt = std::get<0>(res);
            if (evt.has_error())
            {
                if (evt.error() == errc::subscriber_lagged)
                {
                    // The client detects the gap by looking at message IDs, and re-syncs
                    log_info("Event stream for user " + std::to_string(user_id) + " lagged behind");
                    continue;
                }
                else if (evt.error() == errc::hub_closed)
                {
                    co_return error_code();
                }
                co_return evt.error();
            }

            // Messages for other users are discarded
            const auto& event = **evt;
            if (!event.is_recipient(user_id))
                continue;

            auto data = chat_message_frame{*event.message}.to_json();
            auto ec = co_await sink.write_event(chat_message_frame::event_name, data);
            if (ec)
                co_return ec;
        }
        else
        {
            auto data = heartbeat_frame{timestamp_t::clock::now()}.to_json();
            auto ec = co_await sink.write_event(heartbeat_frame::event_name, data);
            if (ec)
                co_return ec;
            next_heartbeat = std::chrono::steady_clock::now() + heartbeat_interval;
        }
    }
}

asio::awaitable<std::optional<response_builder::response_type>> msghub::handle_event_stream(
    request_context& ctx,
    boost::beast::tcp_stream& stream,
    shared_state& st
)
{
    // Authenticate the client. EventSource can't set headers, so the
    // token usually comes in the query string
    auto user_id = co_await st.sessions().resolve_session(ctx.session_token());
    if (user_id.has_error())
    {
        if (user_id.error().ec == errc::requires_auth)
            co_return ctx.response().unauthorized();
        co_return ctx.response().internal_server_error(user_id.error());
    }

    // Subscribe before writing anything, so events published from now on are seen
    auto sub = st.hub().subscribe();

    // Take ownership of the connection
    sse_stream sse(stream.release_socket(), ctx.http_version(), write_timeout);
    auto ec = co_await sse.start();
    if (ec)
    {
        log_error(ec, "Writing event stream response head");
        co_return std::nullopt;
    }

    const auto uid_str = std::to_string(*user_id);
    log_info("Event stream connected for user " + uid_str);

    // Run until the hub is closed or the client goes away
    ec = co_await run_event_bridge(sse, *sub, *user_id, st.config().heartbeat_interval);
    if (ec)
        log_error(ec, "Running event stream for user " + uid_str);
    sse.close();

    log_info("Event stream disconnected for user " + uid_str);
    co_return std::nullopt;
}
