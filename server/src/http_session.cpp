//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "http_session.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/url/url.hpp>

#include <cassert>
#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "api/event_stream.hpp"
#include "api/messages.hpp"
#include "error.hpp"
#include "request_context.hpp"
#include "shared_state.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace asio = boost::asio;
using namespace msghub;

namespace {

using namespace std::chrono_literals;

// Request bodies are small JSON documents
constexpr std::uint64_t max_body_size = 16u * 1024u;

// Time allowed to read a request, and to run its handler
constexpr auto read_timeout = 30s;
constexpr auto handler_timeout = 30s;

using handler_fn = asio::awaitable<http::message_generator> (*)(request_context&, shared_state&);

struct api_endpoint
{
    // Path, relative to /api
    std::string_view path;
    http::verb method;
    handler_fn handler;
};

constexpr api_endpoint endpoints[] = {
    {"/messages",         http::verb::post,    handle_send_message  },
    {"/messages/history", http::verb::get,     handle_get_history   },
    {"/messages/sync",    http::verb::get,     handle_sync_messages },
    {"/messages/batch",   http::verb::post,    handle_batch_messages},
    {"/read-index",       http::verb::put,     handle_set_read_index},
    {"/chat-list",        http::verb::get,     handle_get_chat_list },
    {"/session",          http::verb::delete_, handle_logout        },
};

// Handled outside the table, since it consumes the connection
constexpr std::string_view event_stream_path = "/stream";

// The normalized path after /api, or an empty optional for non-API targets
std::optional<std::string> get_api_path(const request_context& ctx)
{
    boost::urls::url normalized(ctx.request_target());
    normalized.normalize();

    // After normalization, comparing encoded segments is safe
    auto segs = normalized.encoded_segments();
    if (segs.empty() || segs.front() != "api")
        return std::nullopt;

    constexpr std::string_view api_prefix = "/api";
    std::string_view path = normalized.encoded_path();
    assert(path.starts_with(api_prefix));
    return std::string(path.substr(api_prefix.size()));
}

// parse_request_target must have been called and succeeded
bool is_event_stream_request(const request_context& ctx)
{
    return ctx.request_method() == http::verb::get && get_api_path(ctx) == event_stream_path;
}

// Outcome of matching a request against the endpoint table
enum class route_status
{
    found,
    unknown_path,
    bad_method,
};

route_status route(std::string_view path, http::verb method, handler_fn& handler)
{
    auto res = route_status::unknown_path;
    for (const auto& e : endpoints)
    {
        if (e.path != path)
            continue;
        if (e.method == method)
        {
            handler = e.handler;
            return route_status::found;
        }
        res = route_status::bad_method;
    }

    // The stream path exists, but only for GET
    if (path == event_stream_path)
        res = route_status::bad_method;
    return res;
}

asio::awaitable<http::message_generator> handle_http_request_impl(request_context& ctx, shared_state& st)
{
    auto api_path = get_api_path(ctx);
    if (!api_path.has_value())
        co_return ctx.response().not_found_text();

    handler_fn handler = nullptr;
    switch (route(*api_path, ctx.request_method(), handler))
    {
    case route_status::unknown_path: co_return ctx.response().not_found_text();
    case route_status::bad_method: co_return ctx.response().method_not_allowed();
    case route_status::found: break;
    }

    // cancel_after makes the handler fail once the deadline expires.
    // message_generator is not default-constructible, and co_spawn
    // requires that for results, hence the optional
    std::optional<http::message_generator> gen;
    co_await asio::co_spawn(
        co_await asio::this_coro::executor,
        [handler, &gen, &ctx, &st]() -> asio::awaitable<void> { gen = co_await handler(ctx, st); },
        asio::cancel_after(handler_timeout)
    );
    co_return std::move(gen).value();
}

asio::awaitable<http::message_generator> handle_http_request(request_context& ctx, shared_state& st)
{
    // Handlers report errors as responses. Anything thrown is a bug, and becomes a 500
    try
    {
        co_return co_await handle_http_request_impl(ctx, st);
    }
    catch (const std::exception& err)
    {
        co_return ctx.response().internal_server_error(errc::uncaught_exception, err.what());
    }
}

}  // namespace

asio::awaitable<void> msghub::run_http_session(
    boost::asio::ip::tcp::socket&& socket,
    std::shared_ptr<shared_state> state
)
{
    error_code ec;
    beast::flat_buffer buff;
    beast::tcp_stream stream(std::move(socket));

    // Serve requests until the client closes, a response requires closing,
    // or the connection is handed to an event stream
    while (true)
    {
        http::request_parser<http::string_body> parser;
        parser.body_limit(max_body_size);
        stream.expires_after(read_timeout);

        co_await http::async_read(stream, buff, parser.get(), asio::redirect_error(ec));
        if (ec == http::error::end_of_stream)
        {
            stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
            co_return;
        }
        else if (ec)
        {
            co_return log_error(ec, "Reading HTTP request");
        }

        request_context ctx(parser.release());
        std::optional<http::message_generator> msg;
        if (ctx.parse_request_target())
        {
            msg = ctx.response().bad_request_text("Invalid request target");
        }
        else if (is_event_stream_request(ctx))
        {
            // Runs until the client disconnects or the server shuts down,
            // unless authentication fails and we get a response to write
            try
            {
                msg = co_await handle_event_stream(ctx, stream, *state);
            }
            catch (const std::exception& err)
            {
                log_error(errc::uncaught_exception, "Uncaught exception while running event stream", err.what());
                co_return;
            }
            if (!msg.has_value())
                co_return;
        }
        else
        {
            msg = co_await handle_http_request(ctx, *state);
        }

        bool keep_alive = msg->keep_alive();
        co_await beast::async_write(stream, std::move(*msg), asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "Writing HTTP response");
            co_return;
        }

        if (!keep_alive)
        {
            stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
            co_return;
        }
    }
}
